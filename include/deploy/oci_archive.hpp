#pragma once

#include "system/fs.hpp"
#include "types/install_state.hpp"
#include "types/platform.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

namespace elemental {

// Error code used when an unpacked archive holds no image matching the
// requested selection. Callers may fall back to another strategy.
inline constexpr int kNoMatchingImage = 2;

// Applies the image of an OCI layout directory (index.json + blobs/) onto
// `target`. Both are host paths. `tag` selects by ref-name annotation, an
// empty tag requires a single image.
Result ApplyOciLayout(const std::string& layout_dir,
                      const Platform& platform,
                      const std::string& tag,
                      const std::string& target,
                      ImageSourceMetadata& meta);

// Container image tarballs as produced by `docker save` or OCI tooling.
class OciArchive {
  public:
    OciArchive(std::shared_ptr<const IFs> fs, Platform platform);

    // Unpacks `tarball` into the existing directory `scratch`.
    Result Unpack(const std::string& tarball, const std::string& scratch) const;

    // Applies the image selected by `tag` from an unpacked archive. An empty
    // tag only succeeds when the archive holds exactly one image.
    Result ApplyImage(const std::string& scratch,
                      const std::string& tag,
                      const std::string& target,
                      ImageSourceMetadata& meta) const;

  private:
    std::shared_ptr<const IFs> fs_;
    Platform platform_;
};

} // namespace elemental
