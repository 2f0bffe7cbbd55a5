#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace elemental {

// Extracts tar archives (any compression libarchive detects) onto a
// directory. Operates on host paths.
class LayerApplier {
  public:
    struct Options {
        // Honour OCI whiteout entries (.wh.<name>, .wh..wh..opq).
        bool whiteouts = true;
        bool preserve_owner = true;
    };

    LayerApplier() = default;
    explicit LayerApplier(const Options& opt) : opt_(opt) {}

    Result Apply(const std::string& archive_path,
                 const std::string& dst_dir,
                 std::uint64_t* out_bytes = nullptr) const;

  private:
    Options opt_{};
};

} // namespace elemental
