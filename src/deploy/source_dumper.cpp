#include "deploy/source_dumper.hpp"

#include "deploy/oci_archive.hpp"
#include "deploy/system_tools.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace elemental {

namespace {

constexpr const char* kDefaultArchiveTag = "oci-image:latest";

class DockerStrategy final : public ISourceStrategy {
  public:
    explicit DockerStrategy(Config cfg) : cfg_(std::move(cfg)) {}

    bool Supports(const ImageSource& source) const override { return source.IsDocker(); }

    Result Dump(const std::string& target, const ImageSource& source, ImageSourceMetadata& meta) const override {
        const std::string& ref = source.Value();
        if (cfg_.cosign) {
            LogInfo("running cosign verification for %s", ref.c_str());
            auto r = CosignVerify(*cfg_.runner, ref, cfg_.cosign_pub_key);
            if (!r.is_ok()) return r.Context("cosign verification failed");
        }

        std::string digest;
        auto r = cfg_.image_extractor->ExtractImage(ref, target, cfg_.platform, digest);
        if (!r.is_ok()) return r;

        std::int64_t size = 0;
        r = cfg_.image_extractor->GetOCIImageSize(ref, cfg_.platform, size);
        if (!r.is_ok()) LogWarn("could not read size of %s: %s", ref.c_str(), r.msg.c_str());
        meta = ImageSourceMetadata{.digest = digest, .size = size};
        return Result::Ok();
    }

  private:
    Config cfg_;
};

// Tries the single image of the archive, then the default tag, and at last
// copies the raw archive content.
class OciFileStrategy final : public ISourceStrategy {
  public:
    explicit OciFileStrategy(Config cfg) : cfg_(std::move(cfg)) {}

    bool Supports(const ImageSource& source) const override { return source.IsOciFile(); }

    Result Dump(const std::string& target, const ImageSource& source, ImageSourceMetadata& meta) const override {
        std::string scratch;
        auto r = cfg_.fs->TempDir("elemental-ocifile-", scratch);
        if (!r.is_ok()) return r;

        r = DumpFromScratch(scratch, target, source.Value(), meta);
        auto rm = cfg_.fs->RemoveAll(scratch);
        if (!rm.is_ok()) LogWarn("failed removing %s: %s", scratch.c_str(), rm.msg.c_str());
        return r;
    }

  private:
    Result DumpFromScratch(const std::string& scratch,
                           const std::string& target,
                           const std::string& tarball,
                           ImageSourceMetadata& meta) const {
        OciArchive archive(cfg_.fs, cfg_.platform);
        auto r = archive.Unpack(tarball, scratch);
        if (!r.is_ok()) return r.Context("failed unpacking " + tarball);

        r = archive.ApplyImage(scratch, "", target, meta);
        if (r.is_ok() || r.err != kNoMatchingImage) return r;
        LogDebug("%s, trying tag %s", r.msg.c_str(), kDefaultArchiveTag);

        r = archive.ApplyImage(scratch, kDefaultArchiveTag, target, meta);
        if (r.is_ok() || r.err != kNoMatchingImage) return r;
        LogDebug("%s, copying archive content", r.msg.c_str());

        r = SyncData(*cfg_.runner, scratch, target, {});
        if (!r.is_ok()) return r;
        std::uint64_t size = 0;
        r = cfg_.fs->FileSize(tarball, size);
        if (!r.is_ok()) return r;
        meta = ImageSourceMetadata{.size = static_cast<std::int64_t>(size)};
        return Result::Ok();
    }

    Config cfg_;
};

class DirStrategy final : public ISourceStrategy {
  public:
    explicit DirStrategy(Config cfg) : cfg_(std::move(cfg)) {}

    bool Supports(const ImageSource& source) const override { return source.IsDir(); }

    Result Dump(const std::string& target, const ImageSource& source, ImageSourceMetadata&) const override {
        return SyncData(*cfg_.runner, source.Value(), target, DefaultSyncExcludes());
    }

  private:
    Config cfg_;
};

class FileStrategy final : public ISourceStrategy {
  public:
    explicit FileStrategy(Config cfg) : cfg_(std::move(cfg)) {}

    bool Supports(const ImageSource& source) const override { return source.IsFile(); }

    Result Dump(const std::string& target, const ImageSource& source, ImageSourceMetadata&) const override {
        auto r = cfg_.fs->MkdirAll(DirName(target));
        if (!r.is_ok()) return r;
        return cfg_.fs->CopyFile(source.Value(), target);
    }

  private:
    Config cfg_;
};

} // namespace

std::vector<std::unique_ptr<ISourceStrategy>> CreateDefaultSourceStrategies(const Config& cfg) {
    std::vector<std::unique_ptr<ISourceStrategy>> out;
    out.push_back(std::make_unique<DockerStrategy>(cfg));
    out.push_back(std::make_unique<OciFileStrategy>(cfg));
    out.push_back(std::make_unique<DirStrategy>(cfg));
    out.push_back(std::make_unique<FileStrategy>(cfg));
    return out;
}

SourceDumper::SourceDumper(Config cfg) : SourceDumper(cfg, CreateDefaultSourceStrategies(cfg)) {}

SourceDumper::SourceDumper(Config cfg, std::vector<std::unique_ptr<ISourceStrategy>> strategies)
    : cfg_(std::move(cfg)), strategies_(std::move(strategies)) {}

Result SourceDumper::DumpSource(const std::string& target,
                                const ImageSource& source,
                                ImageSourceMetadata& meta) const {
    LogInfo("copying %s source to %s", source.String().c_str(), target.c_str());
    for (const auto& s : strategies_) {
        if (!s->Supports(source)) continue;
        auto r = s->Dump(target, source, meta);
        if (!r.is_ok()) return r.Context("failed dumping " + source.String());
        return r;
    }
    return Result::Fail(-1, "unknown image source type");
}

} // namespace elemental
