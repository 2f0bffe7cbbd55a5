#include "types/spec.hpp"

#include "util/constants.hpp"
#include "util/path_utils.hpp"

#include <algorithm>

namespace elemental {

namespace {

bool MissingMountedPartition(const PartitionPtr& p) {
    return !p || p->mount_point.empty();
}

} // namespace

Result InstallSpec::Sanitize() {
    if (active.source.IsEmpty() && iso.empty()) {
        return Result::Fail(-1, "undefined system source to install");
    }
    if (MissingMountedPartition(partitions.state)) {
        return Result::Fail(-1, "undefined state partition");
    }

    std::string recovery_mnt = kRecoveryDir;
    if (partitions.recovery && !partitions.recovery->mount_point.empty()) {
        recovery_mnt = partitions.recovery->mount_point;
    }
    recovery.file = JoinPath(recovery_mnt, kImagesSubdir,
                             recovery.fs == kSquashFs ? kRecoverySquashFile : kRecoveryImgFile);

    const auto zero_sized = std::count_if(extra_partitions.begin(), extra_partitions.end(),
                                          [](const PartitionPtr& p) { return p && p->size == 0; });
    if (zero_sized > 1) {
        return Result::Fail(-1,
                            "more than one extra partition has its size set to 0. Only one partition can "
                            "have its size set to 0 which means that it will take all the available disk "
                            "space in the device");
    }
    if (zero_sized == 1 && partitions.persistent && partitions.persistent->size == 0) {
        return Result::Fail(-1,
                            "both persistent partition and extra partitions have size set to 0. Only one "
                            "partition can have its size set to 0 which means that it will take all the "
                            "available disk space in the device");
    }

    // Labels are fixed, boot and reset locate partitions through them.
    partitions.SetDefaultLabels();

    for (const auto& label : encrypted_partitions) {
        bool known = false;
        for (const auto& p : partitions.PartitionsByInstallOrder(extra_partitions)) {
            if (p->filesystem_label == label) {
                known = true;
                break;
            }
        }
        if (!known) {
            return Result::Fail(-1, "encrypted partition " + label + " is not part of the layout");
        }
    }

    return partitions.SetFirmwarePartitions(firmware, part_table);
}

Result UpgradeSpec::Sanitize() {
    const ImageSource& source = recovery_upgrade ? recovery.source : active.source;
    if (source.IsEmpty()) return Result::Fail(-1, "undefined upgrade source");

    // Both partitions are mounted read-write and carry the install state.
    if (recovery_upgrade) {
        if (MissingMountedPartition(partitions.recovery)) {
            return Result::Fail(-1, "undefined recovery partition");
        }
        if (MissingMountedPartition(partitions.state)) {
            return Result::Fail(-1, "undefined state partition");
        }
    } else {
        if (MissingMountedPartition(partitions.state)) {
            return Result::Fail(-1, "undefined state partition");
        }
        if (MissingMountedPartition(partitions.recovery)) {
            return Result::Fail(-1, "undefined recovery partition");
        }
    }
    return Result::Ok();
}

Result ResetSpec::Sanitize() {
    if (active.source.IsEmpty()) return Result::Fail(-1, "undefined system source to reset to");
    if (MissingMountedPartition(partitions.state)) {
        return Result::Fail(-1, "undefined state partition");
    }
    return Result::Ok();
}

} // namespace elemental
