#pragma once

#include "config/config.hpp"
#include "types/partition.hpp"
#include "types/spec.hpp"
#include "util/result.hpp"

#include <string>

namespace elemental {

// Writes the partition table of an install target and creates the
// filesystems on it.
class Partitioner {
  public:
    explicit Partitioner(Config cfg);

    // Fills Partition::path of every formatted partition.
    Result PartitionAndFormatDevice(InstallSpec& spec) const;

    Result FormatDevice(const std::string& device, const std::string& fs, const std::string& label) const;
    Result FormatPartition(const Partition& part) const;

  private:
    Result RereadPartitionTable(const std::string& device) const;
    void SettleUdev() const;

    Config cfg_;
};

} // namespace elemental
