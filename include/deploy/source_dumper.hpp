#pragma once

#include "config/config.hpp"
#include "types/image_source.hpp"
#include "types/install_state.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <vector>

namespace elemental {

// Copies the content of one kind of image source into a directory or file.
class ISourceStrategy {
  public:
    virtual ~ISourceStrategy() = default;
    virtual bool Supports(const ImageSource& source) const = 0;
    virtual Result Dump(const std::string& target, const ImageSource& source, ImageSourceMetadata& meta) const = 0;
};

// Docker, OCI archive, directory and file strategies.
std::vector<std::unique_ptr<ISourceStrategy>> CreateDefaultSourceStrategies(const Config& cfg);

class SourceDumper {
  public:
    explicit SourceDumper(Config cfg);
    SourceDumper(Config cfg, std::vector<std::unique_ptr<ISourceStrategy>> strategies);

    // Dumps `source` to `target` with the first strategy supporting it.
    Result DumpSource(const std::string& target, const ImageSource& source, ImageSourceMetadata& meta) const;

  private:
    Config cfg_;
    std::vector<std::unique_ptr<ISourceStrategy>> strategies_;
};

} // namespace elemental
