#pragma once

#include "system/fs.hpp"
#include "types/install_state.hpp"
#include "util/result.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace elemental {

// Reads and writes state.yaml, the record of what every image was built
// from.
class InstallStateStore {
  public:
    explicit InstallStateStore(std::shared_ptr<const IFs> fs);

    // Writes the same document to every path, stops at the first failure.
    Result Write(const InstallState& state, const std::vector<std::string>& paths) const;
    std::expected<InstallState, std::string> Load(const std::string& path) const;
    // State of the running system, from the state partition or the
    // install media.
    std::expected<InstallState, std::string> LoadDefault() const;

    static std::string Serialize(const InstallState& state);
    static std::expected<InstallState, std::string> Parse(std::string_view text);
    // Current UTC time as RFC3339.
    static std::string Now();

  private:
    std::shared_ptr<const IFs> fs_;
};

} // namespace elemental
