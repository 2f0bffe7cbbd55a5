#include "deploy/oci_archive.hpp"

#include "crypto/sha256.hpp"
#include "deploy/layer_applier.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <cerrno>
#include <vector>

namespace elemental {

namespace {

using json = nlohmann::json;

constexpr const char* kRefNameAnnotation = "org.opencontainers.image.ref.name";
constexpr const char* kContainerdNameAnnotation = "io.containerd.image.name";

Result ReadJson(const std::string& path, json& out) {
    std::ifstream in(path);
    if (!in) return Result::Fail(ENOENT, "cannot open " + path);
    try {
        out = json::parse(in);
    } catch (const json::exception& e) {
        return Result::Fail(-1, "invalid json in " + path + ": " + e.what());
    }
    return Result::Ok();
}

Result SafeJoin(const std::string& base, const std::string& rel, std::string& out) {
    const std::string clean = CleanPath(rel);
    if (clean.empty() || clean.front() == '/' || clean == ".." || HasPrefix(clean, "../")) {
        return Result::Fail(-1, "unsafe path in image archive: " + rel);
    }
    out = JoinPath(base, clean);
    return Result::Ok();
}

Result BlobPath(const std::string& layout, const std::string& digest, std::string& out) {
    const size_t colon = digest.find(':');
    if (colon == std::string::npos) return Result::Fail(-1, "invalid digest " + digest);
    return SafeJoin(layout, "blobs/" + digest.substr(0, colon) + "/" + digest.substr(colon + 1), out);
}

std::uint64_t FileBytes(const std::string& path) {
    std::error_code ec;
    const auto n = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(n);
}

// "name" and "docker.io/library/name" denote the same image.
bool TagMatches(const std::string& candidate, const std::string& tag) {
    if (candidate == tag) return true;
    for (const char* prefix : {"docker.io/library/", "docker.io/", "index.docker.io/library/", "library/"}) {
        if (candidate == prefix + tag) return true;
    }
    return false;
}

Result ApplyLayers(const std::string& base,
                   const std::vector<std::string>& layers,
                   const std::string& target,
                   std::int64_t& total) {
    LayerApplier applier;
    total = 0;
    for (const auto& rel : layers) {
        std::string layer;
        auto r = SafeJoin(base, rel, layer);
        if (!r.is_ok()) return r;
        LogDebug("applying layer %s", rel.c_str());
        r = applier.Apply(layer, target);
        if (!r.is_ok()) return r.Context("failed applying layer " + rel);
        total += static_cast<std::int64_t>(FileBytes(layer));
    }
    return Result::Ok();
}

bool PlatformMatches(const json& desc, const Platform& platform) {
    auto it = desc.find("platform");
    if (it == desc.end() || !it->is_object()) return true;
    return platform.Matches(it->value("os", ""), it->value("architecture", ""), it->value("variant", ""));
}

// Resolves nested indexes down to an image manifest.
Result ResolveManifest(const std::string& layout, const json& desc, const Platform& platform, json& manifest) {
    std::string path;
    auto r = BlobPath(layout, desc.value("digest", ""), path);
    if (!r.is_ok()) return r;
    json doc;
    r = ReadJson(path, doc);
    if (!r.is_ok()) return r;

    if (doc.contains("manifests")) {
        for (const auto& child : doc["manifests"]) {
            if (PlatformMatches(child, platform)) return ResolveManifest(layout, child, platform, manifest);
        }
        return Result::Fail(kNoMatchingImage, "no manifest for platform " + platform.String());
    }
    manifest = std::move(doc);
    return Result::Ok();
}

std::string DescriptorName(const json& desc) {
    auto ann = desc.find("annotations");
    if (ann == desc.end() || !ann->is_object()) return {};
    if (ann->contains(kContainerdNameAnnotation)) return ann->value(kContainerdNameAnnotation, "");
    return ann->value(kRefNameAnnotation, "");
}

} // namespace

Result ApplyOciLayout(const std::string& layout_dir,
                      const Platform& platform,
                      const std::string& tag,
                      const std::string& target,
                      ImageSourceMetadata& meta) {
    json index;
    auto r = ReadJson(JoinPath(layout_dir, "index.json"), index);
    if (!r.is_ok()) return r;
    if (!index.contains("manifests") || !index["manifests"].is_array()) {
        return Result::Fail(-1, "index.json without manifests in " + layout_dir);
    }

    const json& manifests = index["manifests"];
    const json* selected = nullptr;
    if (tag.empty()) {
        if (manifests.size() != 1) {
            return Result::Fail(kNoMatchingImage, "archive contains " + std::to_string(manifests.size()) +
                                                      " images, a tag is required");
        }
        selected = &manifests[0];
    } else {
        for (const auto& desc : manifests) {
            const std::string name = DescriptorName(desc);
            if (TagMatches(name, tag) || (name.find(':') == std::string::npos && HasSuffix(tag, ":" + name))) {
                selected = &desc;
                break;
            }
        }
        if (!selected) return Result::Fail(kNoMatchingImage, "tag " + tag + " not found in archive");
    }

    json manifest;
    r = ResolveManifest(layout_dir, *selected, platform, manifest);
    if (!r.is_ok()) return r;

    std::vector<std::string> layers;
    try {
        for (const auto& layer : manifest.at("layers")) {
            std::string path;
            r = BlobPath(layout_dir, layer.at("digest").get<std::string>(), path);
            if (!r.is_ok()) return r;
            layers.push_back(path.substr(layout_dir.size() + 1));
        }
        meta.digest = manifest.at("config").at("digest").get<std::string>();
    } catch (const json::exception& e) {
        return Result::Fail(-1, std::string("invalid image manifest: ") + e.what());
    }

    return ApplyLayers(layout_dir, layers, target, meta.size);
}

OciArchive::OciArchive(std::shared_ptr<const IFs> fs, Platform platform)
    : fs_(std::move(fs)), platform_(std::move(platform)) {}

Result OciArchive::Unpack(const std::string& tarball, const std::string& scratch) const {
    LayerApplier::Options opt;
    opt.whiteouts = false;
    opt.preserve_owner = false;
    return LayerApplier(opt).Apply(fs_->RawPath(tarball), fs_->RawPath(scratch));
}

Result OciArchive::ApplyImage(const std::string& scratch,
                              const std::string& tag,
                              const std::string& target,
                              ImageSourceMetadata& meta) const {
    const std::string base = fs_->RawPath(scratch);
    const std::string dst = fs_->RawPath(target);

    const std::string manifest_path = JoinPath(base, "manifest.json");
    if (!fs_->Exists(JoinPath(scratch, "manifest.json"))) {
        if (fs_->Exists(JoinPath(scratch, "index.json"))) {
            return ApplyOciLayout(base, platform_, tag, dst, meta);
        }
        return Result::Fail(kNoMatchingImage, "no image manifest found in archive");
    }

    json manifest;
    auto r = ReadJson(manifest_path, manifest);
    if (!r.is_ok()) return r;
    if (!manifest.is_array()) return Result::Fail(-1, "manifest.json is not a list");

    const json* selected = nullptr;
    if (tag.empty()) {
        if (manifest.size() != 1) {
            return Result::Fail(kNoMatchingImage, "archive contains " + std::to_string(manifest.size()) +
                                                      " images, a tag is required");
        }
        selected = &manifest[0];
    } else {
        for (const auto& entry : manifest) {
            auto tags = entry.find("RepoTags");
            if (tags == entry.end() || !tags->is_array()) continue;
            for (const auto& t : *tags) {
                if (t.is_string() && TagMatches(t.get<std::string>(), tag)) {
                    selected = &entry;
                    break;
                }
            }
            if (selected) break;
        }
        if (!selected) return Result::Fail(kNoMatchingImage, "tag " + tag + " not found in archive");
    }

    std::string config_rel;
    std::vector<std::string> layers;
    try {
        config_rel = selected->at("Config").get<std::string>();
        for (const auto& l : selected->at("Layers")) layers.push_back(l.get<std::string>());
    } catch (const json::exception& e) {
        return Result::Fail(-1, std::string("invalid manifest.json entry: ") + e.what());
    }

    std::string config_path;
    r = SafeJoin(base, config_rel, config_path);
    if (!r.is_ok()) return r;
    std::string hex;
    r = Sha256HexFile(config_path, hex);
    if (!r.is_ok()) return r;

    std::int64_t size = 0;
    r = ApplyLayers(base, layers, dst, size);
    if (!r.is_ok()) return r;

    meta.digest = "sha256:" + hex;
    meta.size = size;
    return Result::Ok();
}

} // namespace elemental
