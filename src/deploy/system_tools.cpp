#include "deploy/system_tools.hpp"

#include "util/logger.hpp"

namespace elemental {

namespace {

std::string WithTrailingSlash(const std::string& p) {
    if (!p.empty() && p.back() == '/') return p;
    return p + "/";
}

} // namespace

const std::vector<std::string>& DefaultSyncExcludes() {
    static const std::vector<std::string> kExcludes{"/mnt", "/proc", "/sys", "/dev", "/tmp", "/host", "/run"};
    return kExcludes;
}

Result SyncData(const IRunner& runner,
                const std::string& source,
                const std::string& target,
                const std::vector<std::string>& excludes) {
    std::vector<std::string> args{"--progress", "--partial", "--human-readable", "--archive",
                                  "--xattrs", "--acls"};
    for (const auto& e : excludes) args.push_back("--exclude=" + e);
    args.push_back(WithTrailingSlash(source));
    args.push_back(WithTrailingSlash(target));

    LogInfo("Syncing data from %s to %s", source.c_str(), target.c_str());
    std::string output;
    auto r = runner.Run("rsync", args, &output);
    if (!r.is_ok()) return r.Context("failed syncing " + source + " to " + target);
    return Result::Ok();
}

Result CreateSquashFS(const IRunner& runner,
                      const std::string& source,
                      const std::string& target,
                      const std::vector<std::string>& options) {
    std::vector<std::string> args{source, target};
    args.insert(args.end(), options.begin(), options.end());

    LogInfo("Creating squashfs image %s", target.c_str());
    std::string output;
    auto r = runner.Run("mksquashfs", args, &output);
    if (!r.is_ok()) return r.Context("failed creating squashfs image " + target);
    return Result::Ok();
}

Result CosignVerify(const IRunner& runner, const std::string& image, const std::string& pub_key) {
    std::vector<std::string> args{"verify"};
    if (!pub_key.empty()) {
        args.push_back("--key");
        args.push_back(pub_key);
    }
    args.push_back(image);

    LogInfo("Verifying signature of %s", image.c_str());
    std::string output;
    auto r = runner.Run("cosign", args, &output);
    if (!r.is_ok()) return r.Context("signature verification failed for " + image);
    LogDebug("cosign: %s", output.c_str());
    return Result::Ok();
}

} // namespace elemental
