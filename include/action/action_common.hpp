#pragma once

#include "config/config.hpp"
#include "types/partition.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace elemental {

Result Reboot(const IRunner& runner);
Result Shutdown(const IRunner& runner);

// Runs setfiles over `root_dir` when an SELinux targeted policy is found
// below it. Missing tooling is not an error.
Result SelinuxRelabel(const Config& cfg, const std::string& root_dir, bool raise_error);

// Relabels the tree mounted at `root` from inside a chroot, with the
// persistent and OEM partitions bound to their runtime paths when mounted.
Result RelabelDeployedTree(const Config& cfg,
                           const std::string& root,
                           const PartitionPtr& persistent,
                           const PartitionPtr& oem);

// Creates each of `dirs` below `target`. Failures are only logged.
void CreateExtraDirsInRootfs(const IFs& fs, const std::vector<std::string>& dirs, const std::string& target);

// True when any of `labels` belongs to a device on this host.
bool CheckActiveDeployment(const Config& cfg, const std::vector<std::string>& labels);

} // namespace elemental
