#include "types/image_source.hpp"

#include "util/path_utils.hpp"

#include <cctype>

namespace elemental {

namespace {

constexpr std::string_view kOciScheme = "oci";
constexpr std::string_view kDockerScheme = "docker";
constexpr std::string_view kContainerScheme = "container";
constexpr std::string_view kDirScheme = "dir";
constexpr std::string_view kFileScheme = "file";
constexpr std::string_view kOciFileScheme = "ocifile";

bool IsKnownScheme(std::string_view s) {
    return s == kOciScheme || s == kDockerScheme || s == kContainerScheme || s == kDirScheme ||
           s == kFileScheme || s == kOciFileScheme;
}

bool IsSchemeText(std::string_view s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s.front()))) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') return false;
    }
    return true;
}

bool IsLowerAlnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

// path-component: [a-z0-9]+(?:(?:[._]|__|[-]*)[a-z0-9]+)*
bool IsValidPathComponent(std::string_view c) {
    if (c.empty() || !IsLowerAlnum(c.front()) || !IsLowerAlnum(c.back())) return false;
    for (size_t i = 1; i + 1 < c.size(); ++i) {
        const char ch = c[i];
        if (IsLowerAlnum(ch) || ch == '-') continue;
        if (ch != '.' && ch != '_') return false;
        const char prev = c[i - 1];
        const char next = c[i + 1];
        if (ch == '.' && (!IsLowerAlnum(prev) || !IsLowerAlnum(next))) return false;
        if (ch == '_' && !(IsLowerAlnum(prev) || (prev == '_' && IsLowerAlnum(c[i - 2])))) return false;
        if (ch == '_' && !(IsLowerAlnum(next) || (next == '_' && prev != '_'))) return false;
    }
    return true;
}

bool IsValidRegistry(std::string_view host) {
    if (host.empty()) return false;
    for (char c : host) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-' && c != ':' &&
            c != '[' && c != ']') {
            return false;
        }
    }
    return true;
}

bool IsValidTag(std::string_view tag) {
    if (tag.empty() || tag.size() > 128) return false;
    const char first = tag.front();
    if (!std::isalnum(static_cast<unsigned char>(first)) && first != '_') return false;
    for (char c : tag) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.' && c != '-') return false;
    }
    return true;
}

bool IsValidDigest(std::string_view digest) {
    const size_t colon = digest.find(':');
    if (colon == std::string_view::npos || colon == 0) return false;
    const std::string_view hex = digest.substr(colon + 1);
    if (hex.size() < 32) return false;
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c)) || std::isupper(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

ImageSource ImageSource::FromDocker(std::string ref) { return {Kind::Docker, std::move(ref)}; }
ImageSource ImageSource::FromDir(std::string path) { return {Kind::Dir, std::move(path)}; }
ImageSource ImageSource::FromFile(std::string path) { return {Kind::File, std::move(path)}; }
ImageSource ImageSource::FromOciFile(std::string path) { return {Kind::OciFile, std::move(path)}; }

std::string ImageSource::String() const {
    switch (kind_) {
        case Kind::Docker:  return std::string(kOciScheme) + "://" + value_;
        case Kind::Dir:     return std::string(kDirScheme) + "://" + value_;
        case Kind::File:    return std::string(kFileScheme) + "://" + value_;
        case Kind::OciFile: return std::string(kOciFileScheme) + "://" + value_;
        case Kind::Empty:   break;
    }
    return {};
}

std::expected<std::string, std::string> NormalizeImageReference(std::string_view ref) {
    const std::string invalid = "invalid image reference " + std::string(ref);
    if (ref.empty()) return std::unexpected(invalid);

    std::string_view name = ref;
    std::string_view digest;
    const size_t at = name.find('@');
    if (at != std::string_view::npos) {
        digest = name.substr(at + 1);
        name = name.substr(0, at);
        if (!IsValidDigest(digest)) return std::unexpected(invalid);
    }

    std::string_view tag;
    const size_t last_slash = name.rfind('/');
    const size_t last_colon = name.rfind(':');
    if (last_colon != std::string_view::npos &&
        (last_slash == std::string_view::npos || last_colon > last_slash)) {
        tag = name.substr(last_colon + 1);
        name = name.substr(0, last_colon);
        if (!IsValidTag(tag)) return std::unexpected(invalid);
    }

    auto components = SplitString(name, '/');
    size_t first_path = 0;
    if (components.size() > 1) {
        const std::string& head = components.front();
        const bool looks_like_host = head.find('.') != std::string::npos ||
                                     head.find(':') != std::string::npos || head == "localhost";
        if (looks_like_host) {
            if (!IsValidRegistry(head)) return std::unexpected(invalid);
            first_path = 1;
        }
    }
    if (first_path >= components.size()) return std::unexpected(invalid);
    for (size_t i = first_path; i < components.size(); ++i) {
        if (!IsValidPathComponent(components[i])) return std::unexpected(invalid);
    }

    std::string out(ref);
    if (tag.empty() && digest.empty()) out += ":latest";
    return out;
}

std::expected<ImageSource, std::string> ImageSource::FromUri(std::string_view uri) {
    if (uri.find('#') != std::string_view::npos) {
        return std::unexpected("invalid URI reference " + std::string(uri) + ": fragments are not supported");
    }

    std::string_view rest = uri;
    const size_t q = rest.find('?');
    if (q != std::string_view::npos) rest = rest.substr(0, q);

    std::string scheme;
    std::string value;
    const size_t colon = rest.find(':');
    if (colon != std::string_view::npos) {
        const std::string_view candidate = rest.substr(0, colon);
        const std::string_view after = rest.substr(colon + 1);
        const bool hierarchical = HasPrefix(after, "//");
        if (IsSchemeText(candidate) && (hierarchical || IsKnownScheme(candidate))) {
            for (char c : candidate) scheme.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            if (hierarchical) {
                const std::string_view authority_path = after.substr(2);
                const size_t slash = authority_path.find('/');
                const std::string_view host = authority_path.substr(0, slash);
                const std::string_view path =
                    slash == std::string_view::npos ? std::string_view{} : authority_path.substr(slash);
                value = JoinPath(host, path);
                if (value == ".") value.clear();
            } else {
                value = std::string(after);
            }
        }
    }
    if (scheme.empty()) value = std::string(rest);

    if (scheme.empty() || scheme == kOciScheme || scheme == kDockerScheme || scheme == kContainerScheme) {
        auto ref = NormalizeImageReference(value);
        if (!ref) return std::unexpected(ref.error());
        return FromDocker(std::move(*ref));
    }
    if (scheme == kDirScheme) return FromDir(std::move(value));
    if (scheme == kFileScheme) return FromFile(std::move(value));
    if (scheme == kOciFileScheme) return FromOciFile(std::move(value));

    return std::unexpected("invalid URI reference " + std::string(uri) + ": unknown scheme " + scheme);
}

} // namespace elemental
