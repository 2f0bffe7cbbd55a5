#include "system/image_extractor.hpp"

#include "deploy/oci_archive.hpp"
#include "types/install_state.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <nlohmann/json.hpp>

namespace elemental {

namespace {

using json = nlohmann::json;

std::vector<std::string> PlatformArgs(const Platform& platform) {
    std::vector<std::string> args{"--override-os", platform.os, "--override-arch", platform.arch};
    if (!platform.variant.empty()) {
        args.push_back("--override-variant");
        args.push_back(platform.variant);
    }
    return args;
}

// "registry/repo:tag" or "registry/repo@sha256:..." -> "registry/repo"
std::string Repository(const std::string& ref) {
    std::string repo = ref.substr(0, ref.find('@'));
    const size_t slash = repo.rfind('/');
    const size_t colon = repo.rfind(':');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        repo = repo.substr(0, colon);
    }
    return repo;
}

} // namespace

SkopeoImageExtractor::SkopeoImageExtractor(std::shared_ptr<const IRunner> runner, std::shared_ptr<const IFs> fs)
    : runner_(std::move(runner)), fs_(std::move(fs)) {}

Result SkopeoImageExtractor::ExtractImage(const std::string& ref,
                                          const std::string& dest,
                                          const Platform& platform,
                                          std::string& out_digest) const {
    std::string layout;
    auto r = fs_->TempDir("elemental-oci-", layout);
    if (!r.is_ok()) return r;

    std::vector<std::string> args{"copy"};
    const auto plat = PlatformArgs(platform);
    args.insert(args.end(), plat.begin(), plat.end());
    args.push_back("docker://" + ref);
    args.push_back("oci:" + layout + ":latest");

    std::string output;
    r = runner_->Run("skopeo", args, &output);
    if (r.is_ok()) {
        ImageSourceMetadata meta;
        r = ApplyOciLayout(fs_->RawPath(layout), platform, "", fs_->RawPath(dest), meta);
        if (r.is_ok()) {
            std::string index;
            r = fs_->ReadFile(JoinPath(layout, "index.json"), index);
            if (r.is_ok()) {
                try {
                    out_digest = json::parse(index).at("manifests").at(0).at("digest").get<std::string>();
                } catch (const json::exception& e) {
                    r = Result::Fail(-1, std::string("invalid index.json: ") + e.what());
                }
            }
        }
    }

    auto rm = fs_->RemoveAll(layout);
    if (!rm.is_ok()) LogWarn("failed removing %s: %s", layout.c_str(), rm.msg.c_str());
    if (!r.is_ok()) return r.Context("failed extracting " + ref);
    return Result::Ok();
}

Result SkopeoImageExtractor::GetOCIImageSize(const std::string& ref,
                                             const Platform& platform,
                                             std::int64_t& out_bytes) const {
    std::string output;
    auto r = runner_->Run("skopeo", {"inspect", "--raw", "docker://" + ref}, &output);
    if (!r.is_ok()) return r;

    try {
        json doc = json::parse(output);
        if (doc.contains("manifests")) {
            std::string digest;
            for (const auto& m : doc["manifests"]) {
                const auto p = m.value("platform", json::object());
                if (platform.Matches(p.value("os", ""), p.value("architecture", ""), p.value("variant", ""))) {
                    digest = m.at("digest").get<std::string>();
                    break;
                }
            }
            if (digest.empty()) {
                return Result::Fail(-1, "no manifest for platform " + platform.String() + " in " + ref);
            }
            r = runner_->Run("skopeo", {"inspect", "--raw", "docker://" + Repository(ref) + "@" + digest}, &output);
            if (!r.is_ok()) return r;
            doc = json::parse(output);
        }

        std::int64_t total = 0;
        for (const auto& layer : doc.at("layers")) {
            total += layer.at("size").get<std::int64_t>();
        }
        out_bytes = total;
    } catch (const json::exception& e) {
        return Result::Fail(-1, "invalid manifest for " + ref + ": " + e.what());
    }
    return Result::Ok();
}

} // namespace elemental
