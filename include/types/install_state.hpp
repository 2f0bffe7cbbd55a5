#pragma once

#include "types/image_source.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace elemental {

struct ImageSourceMetadata {
    std::string digest;
    std::int64_t size = 0;

    bool Empty() const { return digest.empty() && size == 0; }
    bool operator==(const ImageSourceMetadata&) const = default;
};

struct ImageState {
    ImageSource source;
    std::optional<ImageSourceMetadata> source_metadata;
    std::string label;
    std::string fs;

    bool operator==(const ImageState&) const = default;
};

struct PartitionState {
    std::string fs_label;
    // Keyed by image role: active, passive, recovery.
    std::map<std::string, ImageState> images;

    bool operator==(const PartitionState&) const = default;
};

struct InstallState {
    // RFC3339, UTC.
    std::string date;
    // Keyed by partition role: state, recovery, oem, persistent.
    std::map<std::string, PartitionState> partitions;

    bool operator==(const InstallState&) const = default;
};

} // namespace elemental
