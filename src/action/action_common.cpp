#include "action/action_common.hpp"

#include "system/chroot.hpp"
#include "system/partition_probe.hpp"
#include "util/constants.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <map>

namespace elemental {

namespace {

constexpr int kCommandNotFound = 127;

bool IsMounted(const IMounter& mounter, const PartitionPtr& part) {
    if (!part || part->mount_point.empty()) return false;
    bool not_mounted = true;
    if (!mounter.IsLikelyNotMountPoint(part->mount_point, not_mounted).is_ok()) return false;
    return !not_mounted;
}

std::string FindPolicyFile(const IFs& fs, const std::string& dir) {
    std::vector<DirEntry> entries;
    if (!fs.ReadDir(dir, entries).is_ok()) return {};
    for (const auto& e : entries) {
        if (!e.is_dir && HasPrefix(e.name, "policy.")) return JoinPath(dir, e.name);
    }
    return {};
}

} // namespace

Result Reboot(const IRunner& runner) {
    LogInfo("rebooting");
    return runner.Run("reboot", {"-f"});
}

Result Shutdown(const IRunner& runner) {
    LogInfo("shutting down");
    return runner.Run("poweroff", {"-f"});
}

Result SelinuxRelabel(const Config& cfg, const std::string& root_dir, bool raise_error) {
    const std::string policy = FindPolicyFile(*cfg.fs, JoinPath(root_dir, kSelinuxPolicyDir));
    const std::string context = JoinPath(root_dir, kSelinuxContextFile);
    if (policy.empty() || !cfg.fs->Exists(context)) {
        LogDebug("no files relabelling as SELinux policy is not found");
        return Result::Ok();
    }

    std::vector<std::string> args;
    if (root_dir.empty() || root_dir == "/") {
        args = {"-c", policy, "-e", "/dev", "-e", "/proc", "-e", "/sys", "-F", context, "/"};
    } else {
        args = {"-c", policy, "-F", "-r", root_dir, context, root_dir};
    }

    std::string output;
    auto r = cfg.runner->Run("setfiles", args, &output);
    LogDebug("SELinux setfiles output: %s", output.c_str());
    if (r.is_ok()) return r;
    if (r.err == kCommandNotFound) {
        LogDebug("no files relabelling as setfiles is not installed");
        return Result::Ok();
    }
    if (!raise_error) {
        LogWarn("SELinux relabelling failed: %s", r.msg.c_str());
        return Result::Ok();
    }
    return r;
}

Result RelabelDeployedTree(const Config& cfg,
                           const std::string& root,
                           const PartitionPtr& persistent,
                           const PartitionPtr& oem) {
    std::map<std::string, std::string> binds;
    if (IsMounted(*cfg.mounter, persistent)) binds[persistent->mount_point] = kUsrLocalPath;
    if (IsMounted(*cfg.mounter, oem)) binds[oem->mount_point] = kOemPath;

    Chroot chroot(root, cfg.mounter, cfg.syscall, cfg.fs);
    chroot.SetExtraMounts(std::move(binds));
    return chroot.RunCallback([&cfg]() { return SelinuxRelabel(cfg, "/", true); });
}

void CreateExtraDirsInRootfs(const IFs& fs, const std::vector<std::string>& dirs, const std::string& target) {
    if (target.empty()) {
        LogWarn("empty target for extra rootfs dirs, not doing anything");
        return;
    }
    for (const auto& d : dirs) {
        const std::string path = JoinPath(target, d);
        if (fs.Exists(path)) continue;
        LogDebug("creating extra dir %s under %s", d.c_str(), target.c_str());
        auto r = fs.MkdirAll(path);
        if (!r.is_ok()) LogWarn("failure creating extra dir %s under %s: %s", d.c_str(), target.c_str(), r.msg.c_str());
    }
}

bool CheckActiveDeployment(const Config& cfg, const std::vector<std::string>& labels) {
    LogInfo("checking for active deployment");
    PartitionProbe probe(cfg.runner, cfg.fs, cfg.device_retry_interval);
    for (const auto& label : labels) {
        if (label.empty()) continue;
        std::string device;
        if (probe.GetDeviceByLabel(label, 1, device).is_ok()) {
            LogDebug("there is already an active deployment in the system");
            return true;
        }
    }
    return false;
}

} // namespace elemental
