#pragma once

#include "config/config.hpp"
#include "system/fs.hpp"
#include "types/spec.hpp"
#include "util/result.hpp"

#include <yaml-cpp/yaml.h>

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace elemental {

// Merged cloud-config document.
class CloudConfig {
  public:
    CloudConfig();

    static std::expected<CloudConfig, std::string> FromString(std::string_view yaml);
    // Loads files and directories (their *.yaml and *.yml files, sorted) in
    // order. Maps are merged recursively, later values win.
    static std::expected<CloudConfig, std::string> Load(const IFs& fs, const std::vector<std::string>& paths);

    void Merge(const CloudConfig& other);

    // The `install:`, `upgrade:` or `reset:` block, undefined when absent.
    YAML::Node Section(std::string_view name) const;
    const YAML::Node& Root() const { return root_; }

    // Sets `section.key` (dotted key below the section) to a string value.
    void SetString(std::string_view section, std::string_view dotted_key, const std::string& value);
    bool Has(std::string_view section, std::string_view dotted_key) const;

  private:
    YAML::Node root_;
};

// Top-level agent options: debug, cosign, cosign-public-key, platform,
// squash-no-compression, squash-compression and size-factors.
Result ApplyAgentOptions(const CloudConfig& cc, Config& cfg);

// Overlay of user values on computed defaults. Absent keys keep defaults,
// values of the wrong type are errors.
Result OverlayInstallSpec(const YAML::Node& node, InstallSpec& spec);
Result OverlayUpgradeSpec(const YAML::Node& node, UpgradeSpec& spec);
Result OverlayResetSpec(const YAML::Node& node, ResetSpec& spec);

} // namespace elemental
