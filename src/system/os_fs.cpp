#include "system/fs.hpp"

#include "io/fd.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace elemental {

namespace {

Result FromErrorCode(const std::error_code& ec, const std::string& what) {
    return Result::Fail(ec.value(), what + ": " + ec.message());
}

Result WriteAll(int fd, const char* data, size_t len, const std::string& path) {
    size_t off = 0;
    while (off < len) {
        const ssize_t n = ::write(fd, data + off, len - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::FromErrno("write " + path);
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

} // namespace

OsFs::OsFs(std::string root) : root_(std::move(root)) {
    while (root_.size() > 1 && root_.back() == '/') root_.pop_back();
    if (root_ == "/") root_.clear();
}

std::string OsFs::RawPath(std::string_view path) const {
    if (root_.empty()) return std::string(path);
    return JoinPath(root_, JoinPath("/", path));
}

bool OsFs::Exists(std::string_view path) const {
    std::error_code ec;
    return fs::exists(fs::symlink_status(RawPath(path), ec)) && !ec;
}

bool OsFs::IsDir(std::string_view path) const {
    std::error_code ec;
    return fs::is_directory(RawPath(path), ec) && !ec;
}

Result OsFs::MkdirAll(std::string_view path, unsigned mode) const {
    const std::string raw = RawPath(path);
    std::error_code ec;
    fs::create_directories(raw, ec);
    if (ec) return FromErrorCode(ec, "mkdir " + std::string(path));
    fs::permissions(raw, static_cast<fs::perms>(mode), fs::perm_options::replace, ec);
    return Result::Ok();
}

Result OsFs::Remove(std::string_view path) const {
    std::error_code ec;
    fs::remove(RawPath(path), ec);
    if (ec) return FromErrorCode(ec, "remove " + std::string(path));
    return Result::Ok();
}

Result OsFs::RemoveAll(std::string_view path) const {
    std::error_code ec;
    fs::remove_all(RawPath(path), ec);
    if (ec) return FromErrorCode(ec, "remove " + std::string(path));
    return Result::Ok();
}

Result OsFs::ReadFile(std::string_view path, std::string& out) const {
    const std::string raw = RawPath(path);
    Fd fd(::open(raw.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) return Result::FromErrno("open " + std::string(path));

    out.clear();
    char buf[8192];
    while (true) {
        const ssize_t n = ::read(fd.Get(), buf, sizeof(buf));
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::FromErrno("read " + std::string(path));
        }
        out.append(buf, static_cast<size_t>(n));
    }
    return Result::Ok();
}

Result OsFs::WriteFile(std::string_view path, std::string_view data, unsigned mode) const {
    const std::string raw = RawPath(path);
    Fd fd(::open(raw.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode));
    if (!fd.Valid()) return Result::FromErrno("open " + std::string(path));
    return WriteAll(fd.Get(), data.data(), data.size(), std::string(path));
}

Result OsFs::CopyFile(std::string_view src, std::string_view dst) const {
    std::error_code ec;
    fs::copy_file(RawPath(src), RawPath(dst), fs::copy_options::overwrite_existing, ec);
    if (ec) return FromErrorCode(ec, "copy " + std::string(src) + " to " + std::string(dst));
    return Result::Ok();
}

Result OsFs::Rename(std::string_view src, std::string_view dst) const {
    std::error_code ec;
    fs::rename(RawPath(src), RawPath(dst), ec);
    if (ec) return FromErrorCode(ec, "rename " + std::string(src) + " to " + std::string(dst));
    return Result::Ok();
}

Result OsFs::CreateSparseFile(std::string_view path, std::uint64_t bytes) const {
    const std::string raw = RawPath(path);
    Fd fd(::open(raw.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.Valid()) return Result::FromErrno("create " + std::string(path));
    if (::ftruncate(fd.Get(), static_cast<off_t>(bytes)) != 0) {
        return Result::FromErrno("truncate " + std::string(path));
    }
    return Result::Ok();
}

Result OsFs::FileSize(std::string_view path, std::uint64_t& out) const {
    struct stat st {};
    if (::stat(RawPath(path).c_str(), &st) != 0) {
        return Result::FromErrno("stat " + std::string(path));
    }
    out = static_cast<std::uint64_t>(st.st_size);
    return Result::Ok();
}

Result OsFs::TempDir(std::string_view prefix, std::string& out) const {
    auto mk = MkdirAll("/tmp", 01777);
    if (!mk.is_ok()) return mk;

    std::string tmpl = RawPath("/tmp") + "/" + std::string(prefix) + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    char* created = ::mkdtemp(buf.data());
    if (!created) return Result::FromErrno("mkdtemp");

    out = JoinPath("/tmp", BaseName(created));
    return Result::Ok();
}

Result OsFs::EvalSymlinks(std::string_view path, std::string& out) const {
    std::error_code ec;
    const fs::path resolved = fs::canonical(RawPath(path), ec);
    if (ec) return FromErrorCode(ec, "resolve " + std::string(path));

    if (root_.empty()) {
        out = resolved.string();
        return Result::Ok();
    }
    const std::string root = fs::canonical(root_, ec).string();
    if (ec) return FromErrorCode(ec, "resolve " + root_);

    const std::string full = resolved.string();
    if (full == root) {
        out = "/";
    } else if (HasPrefix(full, root + "/")) {
        out = full.substr(root.size());
    } else {
        return Result::Fail(EXDEV, "resolved path " + full + " escapes " + root_);
    }
    return Result::Ok();
}

Result OsFs::ReadDir(std::string_view path, std::vector<DirEntry>& out) const {
    out.clear();
    std::error_code ec;
    fs::directory_iterator it(RawPath(path), ec);
    if (ec) return FromErrorCode(ec, "read dir " + std::string(path));
    for (const auto& entry : it) {
        DirEntry d;
        d.name = entry.path().filename().string();
        d.is_symlink = entry.is_symlink(ec);
        d.is_dir = !d.is_symlink && entry.is_directory(ec);
        out.push_back(std::move(d));
    }
    return Result::Ok();
}

} // namespace elemental
