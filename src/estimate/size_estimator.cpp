#include "estimate/size_estimator.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace elemental {

namespace {

bool UnderPath(const std::string& path, const std::string& prefix) {
    if (prefix.empty()) return false;
    return path == prefix || HasPrefix(path, prefix == "/" ? prefix : prefix + "/");
}

} // namespace

SizeEstimator::SizeEstimator(Config cfg) : cfg_(std::move(cfg)) {}

bool SizeEstimator::Skipped(const std::string& root, const std::string& path) const {
    if (!cfg_.host.host_dir.empty() && UnderPath(path, CleanPath(cfg_.host.host_dir))) return true;
    if (cfg_.host.in_kubernetes) {
        for (const char* d : {"proc", "dev", "run"}) {
            if (UnderPath(path, JoinPath(root, d))) return true;
        }
    }
    return false;
}

Result SizeEstimator::WalkDir(const std::string& root,
                              const std::string& dir,
                              std::set<std::string>& counted,
                              std::uint64_t& total) const {
    std::vector<DirEntry> entries;
    auto r = cfg_.fs->ReadDir(dir, entries);
    if (!r.is_ok()) return r;

    for (const auto& e : entries) {
        const std::string path = JoinPath(dir, e.name);
        if (Skipped(root, path)) {
            LogDebug("skipping %s from size estimation", path.c_str());
            continue;
        }

        if (e.is_symlink) {
            std::string resolved;
            if (!cfg_.fs->EvalSymlinks(path, resolved).is_ok()) continue;
            if (cfg_.fs->IsDir(resolved) || counted.count(resolved)) continue;
            std::uint64_t n = 0;
            if (cfg_.fs->FileSize(resolved, n).is_ok()) {
                counted.insert(resolved);
                total += n;
            }
            continue;
        }

        if (e.is_dir) {
            r = WalkDir(root, path, counted, total);
            if (!r.is_ok()) return r;
            continue;
        }

        if (counted.count(path)) continue;
        std::uint64_t n = 0;
        r = cfg_.fs->FileSize(path, n);
        if (!r.is_ok()) return r;
        counted.insert(path);
        total += n;
    }
    return Result::Ok();
}

std::expected<std::int64_t, Result> SizeEstimator::EstimateSize(const ImageSource& source) const {
    std::int64_t bytes = 0;

    switch (source.kind()) {
        case ImageSource::Kind::Empty:
            return 0;
        case ImageSource::Kind::Docker: {
            std::int64_t compressed = 0;
            auto r = cfg_.image_extractor->GetOCIImageSize(source.Value(), cfg_.platform, compressed);
            if (!r.is_ok()) return std::unexpected(r.Context("failed getting size of " + source.Value()));
            bytes = static_cast<std::int64_t>(static_cast<double>(compressed) * cfg_.size_factors.docker);
            break;
        }
        case ImageSource::Kind::Dir: {
            const std::string root = CleanPath(source.Value());
            std::set<std::string> counted;
            std::uint64_t total = 0;
            auto r = WalkDir(root, root, counted, total);
            if (!r.is_ok()) return std::unexpected(r.Context("failed walking " + root));
            bytes = static_cast<std::int64_t>(total);
            break;
        }
        case ImageSource::Kind::OciFile: {
            std::uint64_t n = 0;
            auto r = cfg_.fs->FileSize(source.Value(), n);
            if (!r.is_ok()) return std::unexpected(r);
            bytes = static_cast<std::int64_t>(static_cast<double>(n) * cfg_.size_factors.oci_file);
            break;
        }
        case ImageSource::Kind::File: {
            std::uint64_t n = 0;
            auto r = cfg_.fs->FileSize(source.Value(), n);
            if (!r.is_ok()) return std::unexpected(r);
            bytes = static_cast<std::int64_t>(n);
            break;
        }
    }

    if (bytes == 0) return 0;
    return bytes / 1'000'000 + cfg_.size_factors.padding_mb;
}

} // namespace elemental
