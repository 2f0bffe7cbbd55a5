#include "types/partition.hpp"

#include "util/constants.hpp"

#include <algorithm>

namespace elemental {

namespace {

template <typename Pred>
PartitionPtr FindPreferMounted(const PartitionList& list, Pred pred) {
    PartitionPtr found;
    for (const auto& p : list) {
        if (!p || !pred(*p)) continue;
        found = p;
        if (!found->mount_point.empty()) return found;
    }
    return found;
}

bool Excluded(const PartitionPtr& p, const PartitionList& excludes) {
    return std::find(excludes.begin(), excludes.end(), p) != excludes.end();
}

PartitionPtr ByNameOrLabel(const PartitionList& list, std::string_view name, std::string_view label) {
    auto p = GetPartitionByName(list, name);
    if (!p) p = GetPartitionByLabel(list, label);
    return p;
}

} // namespace

bool Partition::HasFlag(std::string_view flag) const {
    return std::find(flags.begin(), flags.end(), flag) != flags.end();
}

PartitionPtr GetPartitionByName(const PartitionList& list, std::string_view name) {
    return FindPreferMounted(list, [&](const Partition& p) { return p.name == name; });
}

PartitionPtr GetPartitionByLabel(const PartitionList& list, std::string_view label) {
    return FindPreferMounted(list, [&](const Partition& p) { return p.filesystem_label == label; });
}

ElementalPartitions ElementalPartitions::FromList(const PartitionList& list) {
    ElementalPartitions ep;
    ep.bios = GetPartitionByName(list, kBiosPartName);
    ep.efi = ByNameOrLabel(list, kEfiPartName, kEfiLabel);
    ep.oem = ByNameOrLabel(list, kOemPartName, kOemLabel);
    ep.recovery = ByNameOrLabel(list, kRecoveryPartName, kRecoveryLabel);
    ep.state = ByNameOrLabel(list, kStatePartName, kStateLabel);
    ep.persistent = ByNameOrLabel(list, kPersistentPartName, kPersistentLabel);
    return ep;
}

Result ElementalPartitions::SetFirmwarePartitions(std::string_view firmware, std::string_view part_table) {
    if (firmware == kEfiFirmware && part_table == kGpt) {
        efi = std::make_shared<Partition>(Partition{
            .name = kEfiPartName,
            .filesystem_label = kEfiLabel,
            .size = kEfiSize,
            .fs = kEfiFs,
            .flags = {kEspFlag},
            .mount_point = kEfiDir,
        });
        bios.reset();
    } else if (firmware == kBiosFirmware && part_table == kGpt) {
        bios = std::make_shared<Partition>(Partition{
            .name = kBiosPartName,
            .size = kBiosSize,
            .flags = {kBiosGrubFlag},
        });
        efi.reset();
    } else {
        if (!state) return Result::Fail(-1, "nil state partition");
        state->flags = {kBootFlag};
        efi.reset();
        bios.reset();
    }
    return Result::Ok();
}

void ElementalPartitions::SetDefaultLabels() {
    auto set = [](const PartitionPtr& p, const char* name, const char* label) {
        if (!p) return;
        p->name = name;
        p->filesystem_label = label;
    };
    set(oem, kOemPartName, kOemLabel);
    set(state, kStatePartName, kStateLabel);
    set(persistent, kPersistentPartName, kPersistentLabel);
    set(recovery, kRecoveryPartName, kRecoveryLabel);
}

PartitionList ElementalPartitions::PartitionsByInstallOrder(const PartitionList& extra,
                                                            const PartitionList& excludes) const {
    PartitionList out;
    PartitionPtr last;

    for (const auto& p : {bios, efi, oem, recovery, state}) {
        if (p && !Excluded(p, excludes)) out.push_back(p);
    }
    if (persistent && !Excluded(persistent, excludes)) {
        if (persistent->size == 0) {
            last = persistent;
        } else {
            out.push_back(persistent);
        }
    }
    for (const auto& p : extra) {
        if (!p) continue;
        if (p->size == 0) {
            if (last) continue;
            last = p;
        } else {
            out.push_back(p);
        }
    }
    if (last) out.push_back(last);
    return out;
}

PartitionList ElementalPartitions::PartitionsByMountPoint(bool descending, const PartitionList& excludes) const {
    PartitionList out;
    for (const auto& p : PartitionsByInstallOrder({}, excludes)) {
        if (!p->mount_point.empty()) out.push_back(p);
    }
    std::stable_sort(out.begin(), out.end(), [descending](const PartitionPtr& a, const PartitionPtr& b) {
        return descending ? a->mount_point > b->mount_point : a->mount_point < b->mount_point;
    });
    return out;
}

} // namespace elemental
