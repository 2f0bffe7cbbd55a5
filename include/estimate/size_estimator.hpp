#pragma once

#include "config/config.hpp"
#include "types/image_source.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <set>
#include <string>

namespace elemental {

// Estimates the size an image needs to hold the content of a source.
class SizeEstimator {
  public:
    explicit SizeEstimator(Config cfg);

    // In MB (10^6 bytes), padded. Empty sources give 0.
    std::expected<std::int64_t, Result> EstimateSize(const ImageSource& source) const;

  private:
    Result WalkDir(const std::string& root,
                   const std::string& dir,
                   std::set<std::string>& counted,
                   std::uint64_t& total) const;
    bool Skipped(const std::string& root, const std::string& path) const;

    Config cfg_;
};

} // namespace elemental
