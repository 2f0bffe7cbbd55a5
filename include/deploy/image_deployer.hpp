#pragma once

#include "config/config.hpp"
#include "deploy/source_dumper.hpp"
#include "system/partition_probe.hpp"
#include "types/image.hpp"
#include "types/install_state.hpp"
#include "types/partition.hpp"
#include "util/cleanup_stack.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace elemental {

// Builds filesystem images from sources and manages the mounts around it.
class ImageDeployer {
  public:
    explicit ImageDeployer(Config cfg);

    // Mounts in list order and unmounts what was mounted when one fails.
    Result MountPartitions(const PartitionList& parts) const;
    // Unmounts every partition, failures are collected.
    Result UnmountPartitions(const PartitionList& parts) const;

    Result MountPartition(Partition& part, const std::vector<std::string>& options = {"rw"}) const;
    Result UnmountPartition(const Partition& part) const;
    // Makes `part` writable. `undo` restores the previous mount state.
    Result MountRWPartition(Partition& part, CleanupStack::Job& undo) const;
    bool IsMounted(const Partition& part) const;

    // Attaches the image file to a loop device and mounts it.
    Result MountImage(Image& img, const std::vector<std::string>& options = {"rw"}) const;
    Result UnmountImage(Image& img) const;
    // Sparse file of img.size MiB formatted with img.fs.
    Result CreateFileSystemImage(const Image& img) const;

    Result DeployImage(Image& img, bool leave_mounted, ImageSourceMetadata& meta) const;
    Result DumpSource(const std::string& target, const ImageSource& source, ImageSourceMetadata& meta) const;

  private:
    Result CreateDirStructure(const std::string& target) const;

    Config cfg_;
    SourceDumper dumper_;
    PartitionProbe probe_;
};

} // namespace elemental
