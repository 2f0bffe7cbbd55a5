#pragma once

#include "system/fs.hpp"
#include "system/image_extractor.hpp"
#include "system/mounter.hpp"
#include "system/runner.hpp"
#include "system/syscall.hpp"
#include "types/platform.hpp"
#include "util/host_env.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace elemental {

struct SizeFactors {
    double docker = 2.5;
    double oci_file = 2.0;
    std::int64_t padding_mb = 100;
};

// Capabilities and agent wide options, passed by value to every component.
struct Config {
    std::shared_ptr<const IFs> fs;
    std::shared_ptr<const IRunner> runner;
    std::shared_ptr<const IMounter> mounter;
    std::shared_ptr<const ISyscall> syscall;
    std::shared_ptr<const IImageExtractor> image_extractor;

    Platform platform;
    bool cosign = false;
    std::string cosign_pub_key;
    std::vector<std::string> squashfs_compression{"-comp", "gzip"};
    bool squashfs_no_compression = false;
    HostEnv host;
    SizeFactors size_factors;
    bool debug = false;
    std::chrono::milliseconds device_retry_interval{1000};

    // Real system implementations for every capability.
    static Config NewDefault();

    // Options passed to mksquashfs after the block size.
    std::vector<std::string> SquashfsOptions() const;
};

} // namespace elemental
