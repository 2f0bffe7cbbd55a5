#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace elemental {

// Where the content of a deployed image comes from.
class ImageSource {
  public:
    enum class Kind { Empty, Docker, Dir, File, OciFile };

    ImageSource() = default;

    static ImageSource FromDocker(std::string ref);
    static ImageSource FromDir(std::string path);
    static ImageSource FromFile(std::string path);
    static ImageSource FromOciFile(std::string path);

    // Accepts oci://, docker://, container://, dir://, file://, ocifile://
    // and bare image references.
    static std::expected<ImageSource, std::string> FromUri(std::string_view uri);

    Kind kind() const { return kind_; }
    const std::string& Value() const { return value_; }

    bool IsEmpty() const { return kind_ == Kind::Empty; }
    bool IsDocker() const { return kind_ == Kind::Docker; }
    bool IsDir() const { return kind_ == Kind::Dir; }
    bool IsFile() const { return kind_ == Kind::File; }
    bool IsOciFile() const { return kind_ == Kind::OciFile; }

    std::string String() const;

    bool operator==(const ImageSource&) const = default;

  private:
    ImageSource(Kind kind, std::string value) : kind_(kind), value_(std::move(value)) {}

    Kind kind_ = Kind::Empty;
    std::string value_;
};

// Validates a container image reference and appends ":latest" when it has
// neither tag nor digest.
std::expected<std::string, std::string> NormalizeImageReference(std::string_view ref);

} // namespace elemental
