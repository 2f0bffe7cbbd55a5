#include "system/mounter.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sys/mount.h>
#include <sys/stat.h>

namespace elemental {

namespace {

struct FlagOption {
    const char* name;
    unsigned long flag;
    bool clear;
};

constexpr FlagOption kFlagOptions[] = {
    {"ro", MS_RDONLY, false},
    {"rw", MS_RDONLY, true},
    {"remount", MS_REMOUNT, false},
    {"bind", MS_BIND, false},
    {"rbind", MS_BIND | MS_REC, false},
    {"nosuid", MS_NOSUID, false},
    {"nodev", MS_NODEV, false},
    {"noexec", MS_NOEXEC, false},
    {"sync", MS_SYNCHRONOUS, false},
    {"noatime", MS_NOATIME, false},
    {"defaults", 0, false},
};

std::vector<std::string> ProbeFilesystems() {
    std::vector<std::string> out;
    std::ifstream in("/proc/filesystems");
    std::string line;
    while (std::getline(in, line)) {
        if (HasPrefix(line, "nodev")) continue;
        const std::string fs = TrimSpace(line);
        if (!fs.empty()) out.push_back(fs);
    }
    return out;
}

} // namespace

void SystemMounter::ParseOptions(const std::vector<std::string>& options,
                                 unsigned long& flags,
                                 std::string& data) {
    flags = 0;
    data.clear();
    for (const auto& opt : options) {
        bool matched = false;
        for (const auto& known : kFlagOptions) {
            if (opt != known.name) continue;
            if (known.clear) {
                flags &= ~known.flag;
            } else {
                flags |= known.flag;
            }
            matched = true;
            break;
        }
        if (matched || opt.empty()) continue;
        if (!data.empty()) data += ',';
        data += opt;
    }
}

Result SystemMounter::Mount(const std::string& source,
                            const std::string& target,
                            const std::string& fs_type,
                            const std::vector<std::string>& options) const {
    unsigned long flags = 0;
    std::string data;
    ParseOptions(options, flags, data);

    std::string type = fs_type;
    if (type == "bind") {
        flags |= MS_BIND;
        type.clear();
    }

    // A read-only bind needs a second remount pass.
    const bool ro_bind = (flags & MS_BIND) && (flags & MS_RDONLY) && !(flags & MS_REMOUNT);

    auto do_mount = [&](const std::string& t, unsigned long f) -> int {
        return ::mount(source.c_str(),
                       target.c_str(),
                       t.empty() ? nullptr : t.c_str(),
                       f,
                       data.empty() ? nullptr : data.c_str());
    };

    LogDebug("mount %s -> %s (%s)", source.c_str(), target.c_str(), type.c_str());

    if (type == "auto") {
        for (const auto& candidate : ProbeFilesystems()) {
            if (do_mount(candidate, flags) == 0) return Result::Ok();
        }
        return Result::Fail(EINVAL, "mount " + source + " on " + target + ": no suitable filesystem found");
    }

    if (do_mount(type, ro_bind ? (flags & ~MS_RDONLY) : flags) != 0) {
        return Result::FromErrno("mount " + source + " on " + target);
    }
    if (ro_bind) {
        if (::mount(nullptr, target.c_str(), nullptr, MS_BIND | MS_REMOUNT | MS_RDONLY, nullptr) != 0) {
            return Result::FromErrno("remount read-only " + target);
        }
    }
    return Result::Ok();
}

Result SystemMounter::Unmount(const std::string& target) const {
    LogDebug("umount %s", target.c_str());
    if (::umount2(target.c_str(), 0) != 0) {
        return Result::FromErrno("umount " + target);
    }
    return Result::Ok();
}

Result SystemMounter::IsLikelyNotMountPoint(const std::string& path, bool& out) const {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return Result::FromErrno("stat " + path);
    }
    struct stat parent {};
    const std::string parent_path = JoinPath(path, "..");
    if (::stat(parent_path.c_str(), &parent) != 0) {
        return Result::FromErrno("stat " + parent_path);
    }
    out = st.st_dev == parent.st_dev;
    return Result::Ok();
}

} // namespace elemental
