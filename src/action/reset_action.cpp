#include "action/reset_action.hpp"

#include "action/action_common.hpp"
#include "partition/partitioner.hpp"
#include "state/install_state_store.hpp"
#include "util/constants.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace elemental {

ResetAction::ResetAction(Config cfg, ResetSpec& spec) : cfg_(std::move(cfg)), spec_(spec), deployer_(cfg_) {}

Result ResetAction::UpdateInstallState(CleanupStack& cleanup, const ImageSourceMetadata& meta) {
    const auto& parts = spec_.partitions;
    if (!parts.state || !parts.recovery) return Result::Fail(-1, "undefined state or recovery partition");

    InstallState state;
    state.date = InstallStateStore::Now();
    state.partitions[kStatePartName] = PartitionState{
        .fs_label = parts.state->filesystem_label,
        .images = {
            {kActiveImgName, ImageState{.source = spec_.active.source,
                                        .source_metadata = meta,
                                        .label = spec_.active.label,
                                        .fs = spec_.active.fs}},
            {kPassiveImgName, ImageState{.source = spec_.active.source,
                                         .source_metadata = meta,
                                         .label = spec_.passive.label,
                                         .fs = spec_.passive.fs}},
        },
    };
    if (parts.oem) state.partitions[kOemPartName] = PartitionState{.fs_label = parts.oem->filesystem_label};
    if (parts.persistent) {
        state.partitions[kPersistentPartName] = PartitionState{.fs_label = parts.persistent->filesystem_label};
    }
    if (spec_.state) {
        auto previous = spec_.state->partitions.find(kRecoveryPartName);
        if (previous != spec_.state->partitions.end()) state.partitions[kRecoveryPartName] = previous->second;
    }

    CleanupStack::Job undo;
    auto r = deployer_.MountRWPartition(*parts.recovery, undo);
    if (!r.is_ok()) return r;
    cleanup.Push(std::move(undo));

    return InstallStateStore(cfg_.fs).Write(state, {JoinPath(parts.state->mount_point, kInstallStateFile),
                                                    JoinPath(parts.recovery->mount_point, kInstallStateFile)});
}

Result ResetAction::Reset(CleanupStack& cleanup) {
    auto& parts = spec_.partitions;
    const PartitionList keep_recovery{parts.recovery};

    auto r = deployer_.UnmountPartitions(parts.PartitionsByMountPoint(true, keep_recovery));
    if (!r.is_ok()) return r;

    Partitioner partitioner(cfg_);
    r = partitioner.FormatPartition(*parts.state);
    if (!r.is_ok()) return r;
    if (spec_.format_persistent && parts.persistent) {
        r = partitioner.FormatPartition(*parts.persistent);
        if (!r.is_ok()) return r;
    }
    if (spec_.format_oem && parts.oem) {
        r = partitioner.FormatPartition(*parts.oem);
        if (!r.is_ok()) return r;
    }

    r = deployer_.MountPartitions(parts.PartitionsByMountPoint(false, keep_recovery));
    if (!r.is_ok()) return r;
    cleanup.Push([this, keep_recovery]() {
        return deployer_.UnmountPartitions(spec_.partitions.PartitionsByMountPoint(true, keep_recovery));
    });

    ImageSourceMetadata meta;
    r = deployer_.DeployImage(spec_.active, true, meta);
    if (!r.is_ok()) return r;
    cleanup.Push([this]() { return deployer_.UnmountImage(spec_.active); });

    CreateExtraDirsInRootfs(*cfg_.fs, spec_.extra_dirs_rootfs, spec_.active.mount_point);
    r = RelabelDeployedTree(cfg_, spec_.active.mount_point, parts.persistent, parts.oem);
    if (!r.is_ok()) return r;

    r = deployer_.UnmountImage(spec_.active);
    if (!r.is_ok()) return r;

    ImageSourceMetadata passive_meta;
    r = deployer_.DeployImage(spec_.passive, false, passive_meta);
    if (!r.is_ok()) return r;

    return UpdateInstallState(cleanup, meta);
}

Result ResetAction::Run() {
    LogInfo("resetting system on %s", spec_.target.c_str());
    CleanupStack cleanup;
    auto r = cleanup.Cleanup(Reset(cleanup));
    if (!r.is_ok()) return r;

    LogInfo("reset complete");
    if (spec_.ShouldReboot()) return Reboot(*cfg_.runner);
    if (spec_.ShouldShutdown()) return Shutdown(*cfg_.runner);
    return Result::Ok();
}

} // namespace elemental
