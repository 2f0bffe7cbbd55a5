#include "deploy/layer_applier.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>

namespace elemental {

namespace {

constexpr std::string_view kWhiteoutPrefix = ".wh.";
constexpr std::string_view kOpaqueWhiteout = ".wh..wh..opq";

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = archive_error_string(a);
    return s ? s : "unknown libarchive error";
}

bool HasDotDot(const std::string& rel) {
    for (const auto& seg : SplitString(rel, '/')) {
        if (seg == "..") return true;
    }
    return false;
}

Result NormalizeEntry(const char* raw, std::string& out) {
    out = NormalizeTarPath(raw ? std::string(raw) : std::string());
    if (out.empty() || out == ".") return Result::Ok();
    if (HasDotDot(out) || out.find('\\') != std::string::npos) {
        return Result::Fail(-1, "unsafe path in archive: " + out);
    }
    return Result::Ok();
}

Result ApplyWhiteout(const std::filesystem::path& base, const std::string& rel) {
    namespace fs = std::filesystem;
    const std::string name = BaseName(rel);
    const std::string parent = rel.find('/') == std::string::npos ? std::string() : DirName(rel);
    const fs::path dir = parent.empty() ? base : base / parent;

    std::error_code ec;
    if (name == kOpaqueWhiteout) {
        if (!fs::is_directory(dir, ec)) return Result::Ok();
        for (const auto& child : fs::directory_iterator(dir, ec)) {
            fs::remove_all(child.path(), ec);
            if (ec) return Result::Fail(ec.value(), "opaque whiteout " + child.path().string() + ": " + ec.message());
        }
        return Result::Ok();
    }

    const fs::path victim = dir / name.substr(kWhiteoutPrefix.size());
    fs::remove_all(victim, ec);
    if (ec) return Result::Fail(ec.value(), "whiteout " + victim.string() + ": " + ec.message());
    return Result::Ok();
}

} // namespace

Result LayerApplier::Apply(const std::string& archive_path,
                           const std::string& dst_dir,
                           std::uint64_t* out_bytes) const {
    namespace fs = std::filesystem;

    const fs::path base_dir(dst_dir);
    std::error_code ec;
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(-1, "destination is not a directory: " + dst_dir);
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(-1, "archive_read_new failed");
    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());
    if (archive_read_open_filename(ar.get(), archive_path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return Result::Fail(-1, "open " + archive_path + ": " + ArchiveErr(ar.get()));
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(-1, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_XATTR;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    if (opt_.preserve_owner) flags |= ARCHIVE_EXTRACT_OWNER;
    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    std::uint64_t extracted = 0;
    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Result::Fail(-1, "read " + archive_path + ": " + ArchiveErr(ar.get()));
        }

        std::string rel;
        auto path_res = NormalizeEntry(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty() || rel == ".") {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        if (opt_.whiteouts && HasPrefix(BaseName(rel), kWhiteoutPrefix)) {
            auto wh = ApplyWhiteout(base_dir, rel);
            if (!wh.is_ok()) return wh;
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        const char* hardlink = archive_entry_hardlink(entry);
        if (hardlink && *hardlink) {
            std::string rel_hl;
            auto hl_res = NormalizeEntry(hardlink, rel_hl);
            if (!hl_res.is_ok()) return hl_res;
            if (!rel_hl.empty() && rel_hl != ".") {
                const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
                archive_entry_set_hardlink(entry, hardlink_target.c_str());
            }
        }

        const int wh = archive_write_header(aw.get(), entry);
        if (wh == ARCHIVE_WARN) {
            LogDebug("%s: %s", target_path.c_str(), ArchiveErr(aw.get()).c_str());
        } else if (wh != ARCHIVE_OK) {
            return Result::Fail(-1, "write " + target_path + ": " + ArchiveErr(aw.get()));
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return Result::Fail(-1, "read data " + rel + ": " + ArchiveErr(ar.get()));

            const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww < ARCHIVE_OK) return Result::Fail(-1, "write data " + rel + ": " + ArchiveErr(aw.get()));
            extracted += static_cast<std::uint64_t>(size);
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf != ARCHIVE_OK && wf != ARCHIVE_WARN) {
            return Result::Fail(-1, "finish " + target_path + ": " + ArchiveErr(aw.get()));
        }
    }

    LogDebug("applied %s onto %s (%llu bytes)", archive_path.c_str(), dst_dir.c_str(),
             static_cast<unsigned long long>(extracted));
    if (out_bytes) *out_bytes = extracted;
    return Result::Ok();
}

} // namespace elemental
