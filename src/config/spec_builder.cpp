#include "config/spec_builder.hpp"

#include "estimate/size_estimator.hpp"
#include "state/install_state_store.hpp"
#include "util/constants.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace elemental {

namespace {

// `<action>.source` is a shorthand for the system image uri.
Result ReadSourceShorthand(const CloudConfig& cc, std::string_view action, ImageSource& out) {
    const YAML::Node node = cc.Section(action);
    if (!node.IsDefined() || !node.IsMap()) return Result::Ok();
    const YAML::Node v = node["source"];
    if (!v.IsDefined() || v.IsNull()) return Result::Ok();
    if (!v.IsScalar()) return Result::Fail(-1, std::string(action) + ".source must be a string");
    const std::string uri = v.Scalar();
    if (uri.empty()) return Result::Ok();
    auto src = ImageSource::FromUri(uri);
    if (!src) return Result::Fail(-1, std::string(action) + ".source: " + src.error());
    out = std::move(*src);
    return Result::Ok();
}

// Raises `part` to `min` MiB. Values chosen by the user are kept when big
// enough.
void FitPartition(Partition& part, std::uint64_t min, bool user_set) {
    if (!user_set) {
        part.size = min;
        return;
    }
    if (part.size < min) {
        LogWarn("%s partition size %llu MiB is too small for its images, using %llu MiB",
                part.name.c_str(), static_cast<unsigned long long>(part.size),
                static_cast<unsigned long long>(min));
        part.size = min;
    }
}

} // namespace

SpecBuilder::SpecBuilder(Config cfg)
    : cfg_(std::move(cfg)), probe_(cfg_.runner, cfg_.fs, cfg_.device_retry_interval) {}

std::uint64_t SpecBuilder::ImageSizeFor(const ImageSource& source) const {
    auto size = SizeEstimator(cfg_).EstimateSize(source);
    if (!size) {
        LogWarn("failed estimating size of %s, using default image size: %s",
                source.String().c_str(), size.error().msg.c_str());
        return kImgSize;
    }
    if (*size <= 0) return kImgSize;
    return static_cast<std::uint64_t>(*size);
}

bool SpecBuilder::IsMounted(const std::string& path) const {
    bool not_mounted = true;
    if (!cfg_.mounter->IsLikelyNotMountPoint(path, not_mounted).is_ok()) return false;
    return !not_mounted;
}

bool SpecBuilder::HasSquashedRecovery(const Partition& recovery) const {
    if (IsMounted(recovery.mount_point)) {
        return cfg_.fs->Exists(JoinPath(recovery.mount_point, kImagesSubdir, kRecoverySquashFile));
    }

    std::string mnt;
    auto r = cfg_.fs->TempDir("elemental-recovery", mnt);
    if (!r.is_ok()) {
        LogWarn("could not create a mount point to inspect the recovery partition: %s", r.msg.c_str());
        return false;
    }
    bool squashed = false;
    r = cfg_.mounter->Mount(recovery.path, mnt, "auto", {"ro"});
    if (r.is_ok()) {
        squashed = cfg_.fs->Exists(JoinPath(mnt, kImagesSubdir, kRecoverySquashFile));
        r = cfg_.mounter->Unmount(mnt);
        if (!r.is_ok()) LogWarn("failed unmounting %s: %s", mnt.c_str(), r.msg.c_str());
    } else {
        LogWarn("could not mount recovery partition %s: %s", recovery.path.c_str(), r.msg.c_str());
    }
    r = cfg_.fs->RemoveAll(mnt);
    if (!r.is_ok()) LogWarn("failed removing %s: %s", mnt.c_str(), r.msg.c_str());
    return squashed;
}

std::optional<InstallState> SpecBuilder::LoadInstallState() const {
    auto state = InstallStateStore(cfg_.fs).LoadDefault();
    if (!state) {
        LogWarn("failed reading installation state: %s", state.error().c_str());
        return std::nullopt;
    }
    return std::move(*state);
}

std::expected<std::unique_ptr<InstallSpec>, Result> SpecBuilder::NewInstallSpec(const CloudConfig& cc) const {
    auto spec = std::make_unique<InstallSpec>();
    spec->firmware = cfg_.fs->Exists(kEfiFirmwareDir) ? kEfiFirmware : kBiosFirmware;
    spec->part_table = kGpt;
    spec->grub_def_entry = kGrubDefEntry;

    spec->active = Image{
        .file = JoinPath(kStateDir, kImagesSubdir, kActiveImgFile),
        .label = kActiveLabel,
        .size = kImgSize,
        .fs = kLinuxImgFs,
        .mount_point = kActiveDir,
    };
    if (cfg_.fs->Exists(kIsoBaseTree)) spec->active.source = ImageSource::FromDir(kIsoBaseTree);

    const std::string squashed_recovery = JoinPath(kIsoMnt, kRecoverySquashFile);
    if (cfg_.fs->Exists(squashed_recovery)) {
        spec->recovery = Image{.fs = kSquashFs, .source = ImageSource::FromFile(squashed_recovery)};
    } else {
        spec->recovery = Image{
            .label = kSystemLabel,
            .fs = kLinuxImgFs,
            .source = ImageSource::FromFile(spec->active.file),
        };
    }

    spec->passive = Image{
        .file = JoinPath(kStateDir, kImagesSubdir, kPassiveImgFile),
        .label = kPassiveLabel,
        .fs = kLinuxImgFs,
        .source = ImageSource::FromFile(spec->active.file),
    };

    spec->partitions.oem = std::make_shared<Partition>(Partition{
        .name = kOemPartName,
        .filesystem_label = kOemLabel,
        .size = kOemSize,
        .fs = kLinuxFs,
        .mount_point = kOemDir,
    });
    spec->partitions.recovery = std::make_shared<Partition>(Partition{
        .name = kRecoveryPartName,
        .filesystem_label = kRecoveryLabel,
        .fs = kLinuxFs,
        .mount_point = kRecoveryDir,
    });
    spec->partitions.state = std::make_shared<Partition>(Partition{
        .name = kStatePartName,
        .filesystem_label = kStateLabel,
        .fs = kLinuxFs,
        .mount_point = kStateDir,
    });
    spec->partitions.persistent = std::make_shared<Partition>(Partition{
        .name = kPersistentPartName,
        .filesystem_label = kPersistentLabel,
        .size = kPersistentSize,
        .fs = kLinuxFs,
        .mount_point = kPersistentDir,
    });

    auto r = OverlayInstallSpec(cc.Section("install"), *spec);
    if (r.is_ok()) r = ReadSourceShorthand(cc, "install", spec->active.source);
    if (!r.is_ok()) return std::unexpected(r);

    if (!cc.Has("install", "system.size")) spec->active.size = ImageSizeFor(spec->active.source);
    spec->passive.size = spec->active.size;
    if (!cc.Has("install", "recovery-system.size")) {
        spec->recovery.size =
            spec->recovery.fs == kSquashFs ? ImageSizeFor(spec->recovery.source) : spec->active.size;
    }

    if (spec->partitions.recovery) {
        FitPartition(*spec->partitions.recovery, 2 * spec->recovery.size + 200,
                     cc.Has("install", "partitions.recovery.size"));
    }
    if (spec->partitions.state) {
        FitPartition(*spec->partitions.state, 2 * spec->active.size + spec->passive.size + 1000,
                     cc.Has("install", "partitions.state.size"));
    }
    return spec;
}

std::expected<std::unique_ptr<UpgradeSpec>, Result> SpecBuilder::NewUpgradeSpec(const CloudConfig& cc) const {
    auto spec = std::make_unique<UpgradeSpec>();
    spec->grub_def_entry = kGrubDefEntry;
    spec->state = LoadInstallState();

    PartitionList parts;
    auto r = probe_.GetAllPartitions(parts);
    if (!r.is_ok()) return std::unexpected(r.Context("could not read host partitions"));
    auto ep = ElementalPartitions::FromList(parts);
    if (!ep.recovery) ep.recovery = probe_.GetPartitionViaDM(kRecoveryLabel);
    if (!ep.oem) ep.oem = probe_.GetPartitionViaDM(kOemLabel);
    if (!ep.persistent) ep.persistent = probe_.GetPartitionViaDM(kPersistentLabel);

    if (ep.recovery) {
        if (ep.recovery->mount_point.empty()) ep.recovery->mount_point = kRecoveryDir;
        spec->recovery = Image{
            .file = JoinPath(ep.recovery->mount_point, kImagesSubdir, kTransitionImgFile),
            .size = kImgSize,
        };
        if (HasSquashedRecovery(*ep.recovery)) {
            spec->recovery.fs = kSquashFs;
        } else {
            spec->recovery.fs = kLinuxImgFs;
            spec->recovery.label = kSystemLabel;
            spec->recovery.mount_point = kTransitionDir;
        }
    }

    if (ep.state) {
        if (ep.state->mount_point.empty()) ep.state->mount_point = kStateDir;
        spec->active = Image{
            .file = JoinPath(ep.state->mount_point, kImagesSubdir, kTransitionImgFile),
            .label = kActiveLabel,
            .size = kImgSize,
            .fs = kLinuxImgFs,
            .mount_point = kTransitionDir,
        };
        spec->passive = Image{
            .file = JoinPath(ep.state->mount_point, kImagesSubdir, kPassiveImgFile),
            .label = kPassiveLabel,
            .fs = kLinuxImgFs,
            .source = ImageSource::FromFile(spec->active.file),
        };
    }

    if (ep.oem && ep.oem->mount_point.empty()) ep.oem->mount_point = kOemPath;
    if (ep.persistent && ep.persistent->mount_point.empty()) ep.persistent->mount_point = kPersistentDir;
    spec->partitions = ep;

    r = OverlayUpgradeSpec(cc.Section("upgrade"), *spec);
    if (r.is_ok()) {
        r = ReadSourceShorthand(cc, "upgrade",
                                spec->recovery_upgrade ? spec->recovery.source : spec->active.source);
    }
    if (!r.is_ok()) return std::unexpected(r);

    if (spec->recovery_upgrade) {
        if (!cc.Has("upgrade", "recovery-system.size")) spec->recovery.size = ImageSizeFor(spec->recovery.source);
    } else {
        if (!cc.Has("upgrade", "system.size")) spec->active.size = ImageSizeFor(spec->active.source);
        spec->passive.size = spec->active.size;
    }
    return spec;
}

std::expected<std::unique_ptr<ResetSpec>, Result> SpecBuilder::NewResetSpec(const CloudConfig& cc) const {
    std::string cmdline;
    auto r = cfg_.runner->Run("cat", {"/proc/cmdline"}, &cmdline);
    if (!r.is_ok()) return std::unexpected(r.Context("failed reading kernel command line"));
    if (cmdline.find(kRecoverySquashFile) == std::string::npos &&
        cmdline.find(kSystemLabel) == std::string::npos) {
        return std::unexpected(Result::Fail(-1, "reset can only be called from the recovery system"));
    }

    auto spec = std::make_unique<ResetSpec>();
    spec->grub_def_entry = kGrubDefEntry;
    spec->efi = cfg_.fs->Exists(kEfiFirmwareDir);

    PartitionList parts;
    r = probe_.GetAllPartitions(parts);
    if (!r.is_ok()) return std::unexpected(r.Context("could not read host partitions"));
    auto ep = ElementalPartitions::FromList(parts);

    if (spec->efi) {
        if (!ep.efi) return std::unexpected(Result::Fail(-1, "EFI partition not found"));
        if (ep.efi->mount_point.empty()) ep.efi->mount_point = kEfiDir;
        ep.efi->name = kEfiPartName;
    }

    if (!ep.state) return std::unexpected(Result::Fail(-1, "state partition not found"));
    if (ep.state->mount_point.empty()) ep.state->mount_point = kStateDir;
    ep.state->name = kStatePartName;

    if (!ep.recovery) ep.recovery = probe_.GetPartitionViaDM(kRecoveryLabel);
    if (!ep.recovery) return std::unexpected(Result::Fail(-1, "recovery partition not found"));
    if (ep.recovery->mount_point.empty()) ep.recovery->mount_point = kRecoveryDir;

    if (!ep.oem) ep.oem = probe_.GetPartitionViaDM(kOemLabel);
    if (ep.oem) {
        if (ep.oem->mount_point.empty()) ep.oem->mount_point = kOemDir;
    } else {
        LogWarn("no OEM partition found");
    }

    if (!ep.persistent) ep.persistent = probe_.GetPartitionViaDM(kPersistentLabel);
    if (ep.persistent) {
        if (ep.persistent->mount_point.empty()) ep.persistent->mount_point = kPersistentDir;
    } else {
        LogWarn("no Persistent partition found");
    }

    ImageSource source;
    const std::string state_recovery = JoinPath(kRunningStateDir, kImagesSubdir, kRecoveryImgFile);
    const std::string iso_recovery = JoinPath(kIsoScanDir, kImagesSubdir, kRecoveryImgFile);
    if (cfg_.fs->Exists(state_recovery)) {
        source = ImageSource::FromFile(state_recovery);
    } else if (cfg_.fs->Exists(iso_recovery)) {
        source = ImageSource::FromFile(iso_recovery);
    } else if (cfg_.fs->Exists(kIsoBaseTree)) {
        source = ImageSource::FromDir(kIsoBaseTree);
    } else {
        LogWarn("no default source found to reset to");
    }

    spec->target = ep.state->disk;
    spec->active = Image{
        .file = JoinPath(ep.state->mount_point, kImagesSubdir, kActiveImgFile),
        .label = kActiveLabel,
        .size = kImgSize,
        .fs = kLinuxImgFs,
        .source = source,
        .mount_point = kActiveDir,
    };
    spec->passive = Image{
        .file = JoinPath(ep.state->mount_point, kImagesSubdir, kPassiveImgFile),
        .label = kPassiveLabel,
        .fs = kLinuxImgFs,
        .source = ImageSource::FromFile(spec->active.file),
    };
    spec->partitions = ep;
    spec->state = LoadInstallState();

    r = OverlayResetSpec(cc.Section("reset"), *spec);
    if (r.is_ok()) r = ReadSourceShorthand(cc, "reset", spec->active.source);
    if (!r.is_ok()) return std::unexpected(r);

    if (!cc.Has("reset", "system.size")) spec->active.size = ImageSizeFor(spec->active.source);
    spec->passive.size = spec->active.size;
    return spec;
}

std::expected<std::unique_ptr<ISpec>, Result> SpecBuilder::ReadSpecFromCloudConfig(std::string_view action,
                                                                                  const CloudConfig& cc) const {
    std::unique_ptr<ISpec> spec;
    if (action == "install") {
        auto s = NewInstallSpec(cc);
        if (!s) return std::unexpected(s.error());
        spec = std::move(*s);
    } else if (action == "upgrade") {
        auto s = NewUpgradeSpec(cc);
        if (!s) return std::unexpected(s.error());
        spec = std::move(*s);
    } else if (action == "reset") {
        auto s = NewResetSpec(cc);
        if (!s) return std::unexpected(s.error());
        spec = std::move(*s);
    } else {
        return std::unexpected(Result::Fail(-1, "spec not valid: " + std::string(action)));
    }

    auto r = spec->Sanitize();
    if (!r.is_ok()) return std::unexpected(r.Context("invalid " + std::string(action) + " spec"));
    return spec;
}

} // namespace elemental
