#pragma once

#include "types/image_source.hpp"

#include <cstdint>
#include <string>

namespace elemental {

// A filesystem image destined for a partition.
struct Image {
    std::string file;
    std::string label;
    // MiB
    std::uint64_t size = 0;
    std::string fs;
    ImageSource source;
    std::string mount_point;

    // Set only while the image is attached and mounted.
    std::string loop_device;
};

} // namespace elemental
