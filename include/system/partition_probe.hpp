#pragma once

#include "system/fs.hpp"
#include "system/runner.hpp"
#include "types/partition.hpp"
#include "util/result.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace elemental {

// Discovers host block devices through lsblk, with a device-mapper
// fallback for volumes lsblk does not label (LVM, LUKS).
class PartitionProbe {
  public:
    PartitionProbe(std::shared_ptr<const IRunner> runner,
                   std::shared_ptr<const IFs> fs,
                   std::chrono::milliseconds retry_interval = std::chrono::seconds(1));

    Result GetAllPartitions(PartitionList& out) const;
    // Returns null when no mapped device carries `label`.
    PartitionPtr GetPartitionViaDM(const std::string& label) const;
    // Triggers udev and looks the label up, up to `attempts` times.
    Result GetDeviceByLabel(const std::string& label, int attempts, std::string& out_device) const;
    // Looks a partition up by label and then through device-mapper.
    PartitionPtr FindByLabel(const PartitionList& list, const std::string& label) const;

    // Parses `lsblk --list --bytes -J` output.
    static Result ParseLsblk(const std::string& json, PartitionList& out);

  private:
    std::shared_ptr<const IRunner> runner_;
    std::shared_ptr<const IFs> fs_;
    std::chrono::milliseconds retry_interval_;
};

} // namespace elemental
