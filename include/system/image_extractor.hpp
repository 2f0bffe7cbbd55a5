#pragma once

#include "system/fs.hpp"
#include "system/runner.hpp"
#include "types/platform.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace elemental {

class IImageExtractor {
  public:
    virtual ~IImageExtractor() = default;
    // Unpacks the image `ref` for `platform` into the directory `dest` and
    // reports the manifest digest.
    virtual Result ExtractImage(const std::string& ref,
                                const std::string& dest,
                                const Platform& platform,
                                std::string& out_digest) const = 0;
    // Sum of the compressed layer sizes in bytes.
    virtual Result GetOCIImageSize(const std::string& ref,
                                   const Platform& platform,
                                   std::int64_t& out_bytes) const = 0;
};

// Pulls images with `skopeo` into an OCI layout and applies the layers
// in-process.
class SkopeoImageExtractor final : public IImageExtractor {
  public:
    SkopeoImageExtractor(std::shared_ptr<const IRunner> runner, std::shared_ptr<const IFs> fs);

    Result ExtractImage(const std::string& ref,
                        const std::string& dest,
                        const Platform& platform,
                        std::string& out_digest) const override;
    Result GetOCIImageSize(const std::string& ref,
                           const Platform& platform,
                           std::int64_t& out_bytes) const override;

  private:
    std::shared_ptr<const IRunner> runner_;
    std::shared_ptr<const IFs> fs_;
};

} // namespace elemental
