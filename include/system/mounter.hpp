#pragma once

#include "util/result.hpp"

#include <string>
#include <vector>

namespace elemental {

class IMounter {
  public:
    virtual ~IMounter() = default;
    virtual Result Mount(const std::string& source,
                         const std::string& target,
                         const std::string& fs_type,
                         const std::vector<std::string>& options) const = 0;
    virtual Result Unmount(const std::string& target) const = 0;
    // Sets `out` to true when `path` is not a mount point. Mirrors the
    // common st_dev heuristic, so bind mounts of the same device are missed.
    virtual Result IsLikelyNotMountPoint(const std::string& path, bool& out) const = 0;
};

// mount(2)/umount2(2) based implementation. Options such as ro, rw, remount,
// bind, nosuid, nodev, noexec and sync map to mount flags; anything else is
// passed as filesystem data.
class SystemMounter final : public IMounter {
  public:
    Result Mount(const std::string& source,
                 const std::string& target,
                 const std::string& fs_type,
                 const std::vector<std::string>& options) const override;
    Result Unmount(const std::string& target) const override;
    Result IsLikelyNotMountPoint(const std::string& path, bool& out) const override;

    // Exposed for tests.
    static void ParseOptions(const std::vector<std::string>& options,
                             unsigned long& flags,
                             std::string& data);
};

} // namespace elemental
