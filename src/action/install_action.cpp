#include "action/install_action.hpp"

#include "action/action_common.hpp"
#include "partition/partitioner.hpp"
#include "state/install_state_store.hpp"
#include "util/constants.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <string>

namespace elemental {

namespace {

// Only local files are accepted, plain or as file:// URIs.
Result LocalPath(const std::string& location, std::string& out) {
    if (HasPrefix(location, "file://")) {
        out = location.substr(7);
    } else if (location.find("://") != std::string::npos) {
        return Result::Fail(-1, "unsupported location " + location + ", only local files are supported");
    } else {
        out = location;
    }
    if (out.empty() || out.front() != '/') return Result::Fail(-1, "not an absolute path: " + location);
    return Result::Ok();
}

} // namespace

InstallAction::InstallAction(Config cfg, InstallSpec& spec)
    : cfg_(std::move(cfg)), spec_(spec), deployer_(cfg_) {}

Result InstallAction::WriteInstallState(const ImageSourceMetadata& system_meta,
                                        const ImageSourceMetadata& recovery_meta) {
    const auto& parts = spec_.partitions;
    if (!parts.state || !parts.recovery) return Result::Fail(-1, "undefined state or recovery partition");

    // A recovery copied from the active image shares its provenance.
    ImageSource recovery_source = spec_.recovery.source;
    ImageSourceMetadata rec_meta = recovery_meta;
    if (recovery_source.IsFile() && recovery_source.Value() == spec_.active.file) {
        recovery_source = spec_.active.source;
        rec_meta = system_meta;
    }

    InstallState state;
    state.date = InstallStateStore::Now();
    state.partitions[kStatePartName] = PartitionState{
        .fs_label = parts.state->filesystem_label,
        .images = {
            {kActiveImgName, ImageState{.source = spec_.active.source,
                                        .source_metadata = system_meta,
                                        .label = spec_.active.label,
                                        .fs = spec_.active.fs}},
            {kPassiveImgName, ImageState{.source = spec_.active.source,
                                         .source_metadata = system_meta,
                                         .label = spec_.passive.label,
                                         .fs = spec_.passive.fs}},
        },
    };
    state.partitions[kRecoveryPartName] = PartitionState{
        .fs_label = parts.recovery->filesystem_label,
        .images = {
            {kRecoveryImgName, ImageState{.source = recovery_source,
                                          .source_metadata = rec_meta,
                                          .label = spec_.recovery.label,
                                          .fs = spec_.recovery.fs}},
        },
    };
    if (parts.oem) state.partitions[kOemPartName] = PartitionState{.fs_label = parts.oem->filesystem_label};
    if (parts.persistent) {
        state.partitions[kPersistentPartName] = PartitionState{.fs_label = parts.persistent->filesystem_label};
    }

    return InstallStateStore(cfg_.fs).Write(state, {JoinPath(parts.state->mount_point, kInstallStateFile),
                                                    JoinPath(parts.recovery->mount_point, kInstallStateFile)});
}

Result InstallAction::UseIsoSources(CleanupStack& cleanup) {
    std::string iso;
    auto r = LocalPath(spec_.iso, iso);
    if (!r.is_ok()) return r.Context("invalid ISO");
    if (!cfg_.fs->Exists(iso)) return Result::Fail(ENOENT, "ISO " + iso + " does not exist");

    std::string work_dir;
    r = cfg_.fs->TempDir("elemental-iso-", work_dir);
    if (!r.is_ok()) return r;
    cleanup.Push([this, work_dir]() { return cfg_.fs->RemoveAll(work_dir); });

    const std::string iso_file = JoinPath(work_dir, "cOs.iso");
    const std::string iso_mnt = JoinPath(work_dir, "iso");
    const std::string rootfs_mnt = JoinPath(work_dir, "rootfs");

    r = cfg_.fs->CopyFile(iso, iso_file);
    if (!r.is_ok()) return r.Context("failed copying ISO " + iso);
    r = cfg_.fs->MkdirAll(iso_mnt);
    if (!r.is_ok()) return r;
    LogInfo("mounting iso %s into %s", iso_file.c_str(), iso_mnt.c_str());
    r = cfg_.mounter->Mount(iso_file, iso_mnt, "auto", {"loop"});
    if (!r.is_ok()) return r.Context("failed mounting ISO " + iso);
    cleanup.Push([this, iso_mnt]() { return cfg_.mounter->Unmount(iso_mnt); });

    r = cfg_.fs->MkdirAll(rootfs_mnt);
    if (!r.is_ok()) return r;
    LogInfo("mounting squashfs image from iso into %s", rootfs_mnt.c_str());
    r = cfg_.mounter->Mount(JoinPath(iso_mnt, kIsoRootFile), rootfs_mnt, "auto", {});
    if (!r.is_ok()) return r.Context("failed mounting ISO root filesystem");
    cleanup.Push([this, rootfs_mnt]() { return cfg_.mounter->Unmount(rootfs_mnt); });

    spec_.active.source = ImageSource::FromDir(rootfs_mnt);

    const std::string recovery_dir = DirName(spec_.recovery.file);
    const std::string squashed = JoinPath(iso_mnt, kRecoverySquashFile);
    if (cfg_.fs->Exists(squashed)) {
        spec_.recovery.source = ImageSource::FromFile(squashed);
        spec_.recovery.fs = kSquashFs;
        spec_.recovery.file = JoinPath(recovery_dir, kRecoverySquashFile);
    } else {
        spec_.recovery.source = ImageSource::FromFile(spec_.active.file);
        spec_.recovery.fs = kLinuxImgFs;
        spec_.recovery.file = JoinPath(recovery_dir, kRecoveryImgFile);
        if (spec_.recovery.label.empty()) spec_.recovery.label = kSystemLabel;
    }
    return Result::Ok();
}

Result InstallAction::CopyCloudInit() const {
    const std::string oem_dir =
        spec_.partitions.oem && !spec_.partitions.oem->mount_point.empty() ? spec_.partitions.oem->mount_point
                                                                              : kOemDir;
    for (size_t i = 0; i < spec_.cloud_init.size(); ++i) {
        const std::string& location = spec_.cloud_init[i];
        const std::string dest = JoinPath(oem_dir, "9" + std::to_string(i) + "_custom.yaml");
        LogInfo("copying cloud config file %s to %s", location.c_str(), dest.c_str());

        std::string src;
        auto r = LocalPath(location, src);
        std::string data;
        if (r.is_ok()) r = cfg_.fs->ReadFile(src, data);
        if (r.is_ok()) r = cfg_.fs->MkdirAll(oem_dir);
        if (r.is_ok()) r = cfg_.fs->WriteFile(dest, data, 0640);
        if (!r.is_ok()) return r.Context("failed copying cloud config " + location);
    }
    return Result::Ok();
}

Result InstallAction::Install(CleanupStack& cleanup) {
    if (!spec_.iso.empty()) {
        auto r = UseIsoSources(cleanup);
        if (!r.is_ok()) return r;
    }
    if (spec_.active.source.IsEmpty()) return Result::Fail(-1, "undefined system source to install");

    if (spec_.no_format) {
        LogInfo("no-format is set, skipping format and partitioning");
        if (CheckActiveDeployment(cfg_, {spec_.active.label, spec_.recovery.label}) && !spec_.force) {
            return Result::Fail(-1, "use `force` flag to run an installation over the current running deployment");
        }
    } else {
        auto r = Partitioner(cfg_).PartitionAndFormatDevice(spec_);
        if (!r.is_ok()) return r;
    }

    auto r = deployer_.MountPartitions(spec_.partitions.PartitionsByMountPoint(false));
    if (!r.is_ok()) return r;
    cleanup.Push([this]() { return deployer_.UnmountPartitions(spec_.partitions.PartitionsByMountPoint(true)); });

    ImageSourceMetadata system_meta;
    r = deployer_.DeployImage(spec_.active, true, system_meta);
    if (!r.is_ok()) return r;
    cleanup.Push([this]() { return deployer_.UnmountImage(spec_.active); });

    CreateExtraDirsInRootfs(*cfg_.fs, spec_.extra_dirs_rootfs, spec_.active.mount_point);

    r = CopyCloudInit();
    if (!r.is_ok()) return r;

    r = RelabelDeployedTree(cfg_, spec_.active.mount_point, spec_.partitions.persistent, spec_.partitions.oem);
    if (!r.is_ok()) return r;

    r = deployer_.UnmountImage(spec_.active);
    if (!r.is_ok()) return r;

    ImageSourceMetadata recovery_meta;
    r = deployer_.DeployImage(spec_.recovery, false, recovery_meta);
    if (!r.is_ok()) return r;
    ImageSourceMetadata passive_meta;
    r = deployer_.DeployImage(spec_.passive, false, passive_meta);
    if (!r.is_ok()) return r;

    return WriteInstallState(system_meta, recovery_meta);
}

Result InstallAction::Run() {
    LogInfo("installing to %s", spec_.target.c_str());
    CleanupStack cleanup;
    auto r = cleanup.Cleanup(Install(cleanup));
    if (!r.is_ok()) return r;

    LogInfo("installation complete");
    if (spec_.ShouldReboot()) return Reboot(*cfg_.runner);
    if (spec_.ShouldShutdown()) return Shutdown(*cfg_.runner);
    return Result::Ok();
}

} // namespace elemental
