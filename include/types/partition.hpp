#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace elemental {

struct Partition {
    std::string name;
    std::string filesystem_label;
    // MiB, 0 takes the rest of the disk.
    std::uint64_t size = 0;
    std::string fs;
    std::vector<std::string> flags;
    std::string mount_point;

    // Filled from host probing or once the device node exists.
    std::string path;
    std::string disk;

    bool HasFlag(std::string_view flag) const;
};

using PartitionPtr = std::shared_ptr<Partition>;
using PartitionList = std::vector<PartitionPtr>;

// Last match wins, unless an earlier match has a mount point.
PartitionPtr GetPartitionByName(const PartitionList& list, std::string_view name);
PartitionPtr GetPartitionByLabel(const PartitionList& list, std::string_view label);

struct ElementalPartitions {
    PartitionPtr bios;
    PartitionPtr efi;
    PartitionPtr oem;
    PartitionPtr recovery;
    PartitionPtr state;
    PartitionPtr persistent;

    // Matches by partition name first, then by default filesystem label.
    static ElementalPartitions FromList(const PartitionList& list);

    Result SetFirmwarePartitions(std::string_view firmware, std::string_view part_table);
    void SetDefaultLabels();

    // BIOS, EFI, OEM, recovery, state, persistent, extras. The first zero
    // sized partition among persistent and extras goes last, any further
    // zero sized extra is dropped.
    PartitionList PartitionsByInstallOrder(const PartitionList& extra,
                                           const PartitionList& excludes = {}) const;
    PartitionList PartitionsByMountPoint(bool descending, const PartitionList& excludes = {}) const;
};

} // namespace elemental
