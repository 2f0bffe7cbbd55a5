#include "deploy/image_deployer.hpp"

#include "deploy/system_tools.hpp"
#include "partition/partitioner.hpp"
#include "system/loop_device.hpp"
#include "util/constants.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace elemental {

namespace {

constexpr int kDeviceLookupAttempts = 10;
constexpr std::uint64_t kMiB = 1024 * 1024;

struct RuntimeDir {
    const char* path;
    unsigned mode;
};

constexpr RuntimeDir kRuntimeDirs[] = {
    {"/sys", 0555},
    {"/proc", 0555},
    {"/dev", 0755},
    {"/tmp", 01777},
    {"/boot", 0755},
    {"/usr/local", 0755},
    {"/oem", 0755},
};

} // namespace

ImageDeployer::ImageDeployer(Config cfg)
    : cfg_(std::move(cfg)), dumper_(cfg_), probe_(cfg_.runner, cfg_.fs, cfg_.device_retry_interval) {}

bool ImageDeployer::IsMounted(const Partition& part) const {
    if (part.mount_point.empty()) return false;
    bool not_mounted = true;
    if (!cfg_.mounter->IsLikelyNotMountPoint(part.mount_point, not_mounted).is_ok()) return false;
    return !not_mounted;
}

Result ImageDeployer::MountPartition(Partition& part, const std::vector<std::string>& options) const {
    if (part.mount_point.empty()) return Result::Fail(-1, "no mount point defined for " + part.name);
    if (part.path.empty()) {
        std::string device;
        auto r = probe_.GetDeviceByLabel(part.filesystem_label, kDeviceLookupAttempts, device);
        if (!r.is_ok()) return r.Context("failed mounting " + part.name);
        part.path = device;
    }

    auto r = cfg_.fs->MkdirAll(part.mount_point);
    if (!r.is_ok()) return r;
    LogDebug("mounting %s at %s", part.path.c_str(), part.mount_point.c_str());
    r = cfg_.mounter->Mount(part.path, part.mount_point, "auto", options);
    if (!r.is_ok()) return r.Context("failed mounting " + part.name);
    return Result::Ok();
}

Result ImageDeployer::UnmountPartition(const Partition& part) const {
    if (!IsMounted(part)) {
        LogDebug("%s partition is not mounted", part.name.c_str());
        return Result::Ok();
    }
    LogDebug("unmounting %s", part.mount_point.c_str());
    return cfg_.mounter->Unmount(part.mount_point).Context("failed unmounting " + part.name);
}

Result ImageDeployer::MountPartitions(const PartitionList& parts) const {
    PartitionList mounted;
    for (const auto& part : parts) {
        if (part->mount_point.empty()) continue;
        auto r = MountPartition(*part);
        if (!r.is_ok()) {
            for (auto it = mounted.rbegin(); it != mounted.rend(); ++it) {
                auto u = cfg_.mounter->Unmount((*it)->mount_point);
                if (!u.is_ok()) LogWarn("failed unmounting %s: %s", (*it)->mount_point.c_str(), u.msg.c_str());
            }
            return r;
        }
        mounted.push_back(part);
    }
    return Result::Ok();
}

Result ImageDeployer::UnmountPartitions(const PartitionList& parts) const {
    std::string errors;
    for (const auto& part : parts) {
        auto r = UnmountPartition(*part);
        if (r.is_ok()) continue;
        if (!errors.empty()) errors += "; ";
        errors += r.msg;
    }
    if (!errors.empty()) return Result::Fail(-1, errors);
    return Result::Ok();
}

Result ImageDeployer::MountRWPartition(Partition& part, CleanupStack::Job& undo) const {
    if (IsMounted(part)) {
        auto r = cfg_.mounter->Mount(part.path, part.mount_point, "auto", {"remount", "rw"});
        if (!r.is_ok()) return r.Context("failed remounting " + part.name + " read-write");
        const std::string path = part.path;
        const std::string mnt = part.mount_point;
        auto mounter = cfg_.mounter;
        undo = [mounter, path, mnt]() { return mounter->Mount(path, mnt, "auto", {"remount", "ro"}); };
        return Result::Ok();
    }

    auto r = MountPartition(part, {"rw"});
    if (!r.is_ok()) return r;
    const std::string mnt = part.mount_point;
    const std::string name = part.name;
    auto mounter = cfg_.mounter;
    undo = [mounter, mnt, name]() { return mounter->Unmount(mnt).Context("failed unmounting " + name); };
    return Result::Ok();
}

Result ImageDeployer::MountImage(Image& img, const std::vector<std::string>& options) const {
    if (img.mount_point.empty()) return Result::Fail(-1, "no mount point defined for image " + img.file);

    LoopDevice loop(cfg_.syscall);
    std::string device;
    auto r = loop.Attach(img.file, device);
    if (!r.is_ok()) return r;

    r = cfg_.fs->MkdirAll(img.mount_point);
    if (r.is_ok()) r = cfg_.mounter->Mount(device, img.mount_point, img.fs, options);
    if (!r.is_ok()) {
        auto d = loop.Detach(device);
        if (!d.is_ok()) LogWarn("failed detaching %s: %s", device.c_str(), d.msg.c_str());
        return r.Context("failed mounting image " + img.file);
    }
    img.loop_device = device;
    return Result::Ok();
}

Result ImageDeployer::UnmountImage(Image& img) const {
    if (img.loop_device.empty()) {
        LogDebug("image %s is not mounted", img.file.c_str());
        return Result::Ok();
    }
    auto r = cfg_.mounter->Unmount(img.mount_point);
    if (!r.is_ok()) return r.Context("failed unmounting image " + img.file);
    r = LoopDevice(cfg_.syscall).Detach(img.loop_device);
    img.loop_device.clear();
    return r;
}

Result ImageDeployer::CreateFileSystemImage(const Image& img) const {
    LogInfo("creating image %s", img.file.c_str());
    auto r = cfg_.fs->MkdirAll(DirName(img.file));
    if (r.is_ok()) r = cfg_.fs->CreateSparseFile(img.file, img.size * kMiB);
    if (!r.is_ok()) return r;

    r = Partitioner(cfg_).FormatDevice(img.file, img.fs, img.label);
    if (!r.is_ok()) {
        auto rm = cfg_.fs->Remove(img.file);
        if (!rm.is_ok()) LogWarn("failed removing %s: %s", img.file.c_str(), rm.msg.c_str());
        return r;
    }
    return Result::Ok();
}

Result ImageDeployer::CreateDirStructure(const std::string& target) const {
    for (const auto& d : kRuntimeDirs) {
        auto r = cfg_.fs->MkdirAll(JoinPath(target, d.path), d.mode);
        if (!r.is_ok()) return r;
    }
    return Result::Ok();
}

Result ImageDeployer::DumpSource(const std::string& target,
                                 const ImageSource& source,
                                 ImageSourceMetadata& meta) const {
    return dumper_.DumpSource(target, source, meta);
}

Result ImageDeployer::DeployImage(Image& img, bool leave_mounted, ImageSourceMetadata& meta) const {
    CleanupStack cleanup;
    bool deployed = false;
    std::string target;

    if (img.source.IsFile()) {
        target = img.file;
        cleanup.Push([this, &img, &deployed]() {
            if (deployed) return Result::Ok();
            return cfg_.fs->Remove(img.file);
        });
    } else if (img.fs == kSquashFs) {
        auto r = cfg_.fs->TempDir("elemental-squash-", target);
        if (!r.is_ok()) return r;
        cleanup.Push([this, target]() { return cfg_.fs->RemoveAll(target); });
        cleanup.Push([this, &img, &deployed]() {
            if (deployed || !cfg_.fs->Exists(img.file)) return Result::Ok();
            return cfg_.fs->Remove(img.file);
        });
    } else {
        target = img.mount_point;
        auto r = CreateFileSystemImage(img);
        if (!r.is_ok()) return r;
        cleanup.Push([this, &img, &deployed]() {
            if (deployed) return Result::Ok();
            return cfg_.fs->Remove(img.file);
        });
        r = MountImage(img, {"rw"});
        if (!r.is_ok()) return cleanup.Cleanup(r);
        cleanup.Push([this, &img, &deployed, leave_mounted]() {
            if (deployed && leave_mounted) return Result::Ok();
            return UnmountImage(img);
        });
    }

    auto r = DumpSource(target, img.source, meta);
    if (!r.is_ok()) return cleanup.Cleanup(r);

    if (!img.source.IsFile()) {
        r = CreateDirStructure(target);
        if (!r.is_ok()) return cleanup.Cleanup(r);
    }

    if (img.fs == kSquashFs && !img.source.IsFile()) {
        r = cfg_.fs->MkdirAll(DirName(img.file));
        if (r.is_ok()) r = CreateSquashFS(*cfg_.runner, target, img.file, cfg_.SquashfsOptions());
        if (!r.is_ok()) return cleanup.Cleanup(r);
    }

    if (img.source.IsFile()) {
        if (!img.label.empty() && img.fs != kSquashFs) {
            r = cfg_.runner->Run("tune2fs", {"-L", img.label, img.file});
            if (!r.is_ok()) return cleanup.Cleanup(r.Context("failed setting label of " + img.file));
        }
        if (leave_mounted) {
            r = MountImage(img, {img.fs == kSquashFs ? "ro" : "rw"});
            if (!r.is_ok()) return cleanup.Cleanup(r);
        }
    }

    deployed = true;
    return cleanup.Cleanup(Result::Ok());
}

} // namespace elemental
