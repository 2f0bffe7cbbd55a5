#include "action/upgrade_action.hpp"

#include "action/action_common.hpp"
#include "state/install_state_store.hpp"
#include "util/constants.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace elemental {

UpgradeAction::UpgradeAction(Config cfg, UpgradeSpec& spec)
    : cfg_(std::move(cfg)), spec_(spec), deployer_(cfg_) {}

Result UpgradeAction::RemoveIfExists(const std::string& path) const {
    if (!cfg_.fs->Exists(path)) return Result::Ok();
    return cfg_.fs->Remove(path);
}

Result UpgradeAction::UpdateInstallState(const ImageSourceMetadata& meta, const Image& img) {
    const auto& parts = spec_.partitions;
    if (!parts.state || !parts.recovery) return Result::Fail(-1, "undefined state or recovery partition");

    if (!spec_.state) spec_.state = InstallState{};
    InstallState& state = *spec_.state;
    state.date = InstallStateStore::Now();

    const ImageState img_state{.source = img.source, .source_metadata = meta, .label = img.label, .fs = img.fs};
    if (spec_.recovery_upgrade) {
        state.partitions[kRecoveryPartName].images[kRecoveryImgName] = img_state;
    } else {
        auto& images = state.partitions[kStatePartName].images;
        auto active = images.find(kActiveImgName);
        if (active != images.end()) {
            images[kPassiveImgName] = active->second;
        } else {
            images.erase(kPassiveImgName);
        }
        images[kActiveImgName] = img_state;
    }

    return InstallStateStore(cfg_.fs).Write(state, {JoinPath(parts.state->mount_point, kInstallStateFile),
                                                    JoinPath(parts.recovery->mount_point, kInstallStateFile)});
}

Result UpgradeAction::Upgrade(CleanupStack& cleanup) {
    if (!spec_.partitions.state) return Result::Fail(-1, "state partition not found");
    if (!spec_.partitions.recovery) return Result::Fail(-1, "recovery partition not found");

    Image& img = spec_.recovery_upgrade ? spec_.recovery : spec_.active;
    std::string final_file;
    if (spec_.recovery_upgrade) {
        final_file = JoinPath(spec_.partitions.recovery->mount_point, kImagesSubdir,
                              img.fs == kSquashFs ? kRecoverySquashFile : kRecoveryImgFile);
    } else {
        final_file = JoinPath(spec_.partitions.state->mount_point, kImagesSubdir, kActiveImgFile);
    }

    CleanupStack::Job undo;
    auto r = deployer_.MountRWPartition(*spec_.partitions.state, undo);
    if (!r.is_ok()) return r;
    cleanup.Push(std::move(undo));
    r = deployer_.MountRWPartition(*spec_.partitions.recovery, undo);
    if (!r.is_ok()) return r;
    cleanup.Push(std::move(undo));

    const std::string transition = img.file;
    cleanup.Push([this, transition]() { return RemoveIfExists(transition); });

    // Recovery boots do not mount persistent, it is only needed for relabelling.
    if (const auto& persistent = spec_.partitions.persistent) {
        auto mk = cfg_.fs->MkdirAll(persistent->mount_point);
        if (!mk.is_ok()) LogDebug("could not create %s: %s", persistent->mount_point.c_str(), mk.msg.c_str());
        if (!deployer_.IsMounted(*persistent)) {
            CleanupStack::Job unmount_persistent;
            auto p = deployer_.MountRWPartition(*persistent, unmount_persistent);
            if (p.is_ok()) {
                cleanup.Push(std::move(unmount_persistent));
            } else {
                LogWarn("could not mount persistent partition: %s", p.msg.c_str());
            }
        }
    }

    LogInfo("deploying image %s to %s", img.source.String().c_str(), img.file.c_str());
    ImageSourceMetadata meta;
    r = deployer_.DeployImage(img, true, meta);
    if (!r.is_ok()) return r;
    cleanup.Push([this, &img]() { return deployer_.UnmountImage(img); });

    if (img.fs != kSquashFs) {
        CreateExtraDirsInRootfs(*cfg_.fs, spec_.extra_dirs_rootfs, img.mount_point);
        r = RelabelDeployedTree(cfg_, img.mount_point, spec_.partitions.persistent, spec_.partitions.oem);
        if (!r.is_ok()) return r;
    }

    r = deployer_.UnmountImage(img);
    if (!r.is_ok()) return r.Context("failed unmounting transition image");

    if (!spec_.recovery_upgrade) {
        const std::string current = JoinPath(spec_.partitions.state->mount_point, kImagesSubdir, kActiveImgFile);
        LogInfo("moving %s to %s", current.c_str(), spec_.passive.file.c_str());
        r = cfg_.runner->Run("mv", {"-f", current, spec_.passive.file});
        if (!r.is_ok()) return r;
        r = cfg_.runner->Run("tune2fs", {"-L", spec_.passive.label, spec_.passive.file});
        if (!r.is_ok()) return r.Context("failed labelling passive image " + spec_.passive.file);
        cfg_.syscall->Sync();
    }

    LogInfo("moving %s to %s", img.file.c_str(), final_file.c_str());
    r = cfg_.runner->Run("mv", {"-f", img.file, final_file});
    if (!r.is_ok()) return r;
    cfg_.syscall->Sync();

    return UpdateInstallState(meta, img);
}

Result UpgradeAction::Run() {
    CleanupStack cleanup;
    auto r = Upgrade(cleanup);
    if (!r.is_ok()) return cleanup.Cleanup(r);

    auto c = cleanup.Cleanup(Result::Ok());
    if (!c.is_ok()) LogWarn("failure during cleanup (ignoring): %s", c.msg.c_str());

    LogInfo("upgrade completed");
    if (spec_.ShouldReboot()) return Reboot(*cfg_.runner);
    if (spec_.ShouldShutdown()) return Shutdown(*cfg_.runner);
    return Result::Ok();
}

} // namespace elemental
