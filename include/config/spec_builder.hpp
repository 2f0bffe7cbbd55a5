#pragma once

#include "config/cloud_config.hpp"
#include "config/config.hpp"
#include "system/partition_probe.hpp"
#include "types/spec.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string_view>

namespace elemental {

// Derives deployment plans from host state and the user cloud-config.
class SpecBuilder {
  public:
    explicit SpecBuilder(Config cfg);

    // Host defaults with the matching cloud-config block applied and image
    // and partition sizes computed. Sanitize is left to the caller.
    std::expected<std::unique_ptr<InstallSpec>, Result> NewInstallSpec(const CloudConfig& cc) const;
    std::expected<std::unique_ptr<UpgradeSpec>, Result> NewUpgradeSpec(const CloudConfig& cc) const;
    std::expected<std::unique_ptr<ResetSpec>, Result> NewResetSpec(const CloudConfig& cc) const;

    // Builds and sanitizes the plan for "install", "upgrade" or "reset".
    std::expected<std::unique_ptr<ISpec>, Result> ReadSpecFromCloudConfig(std::string_view action,
                                                                         const CloudConfig& cc) const;

  private:
    // MB needed for `source`, the default image size when it cannot be told.
    std::uint64_t ImageSizeFor(const ImageSource& source) const;
    bool IsMounted(const std::string& path) const;
    bool HasSquashedRecovery(const Partition& recovery) const;
    std::optional<InstallState> LoadInstallState() const;

    Config cfg_;
    PartitionProbe probe_;
};

} // namespace elemental
