#include "config/config.hpp"

namespace elemental {

Config Config::NewDefault() {
    Config cfg;
    cfg.fs = std::make_shared<OsFs>();
    cfg.runner = std::make_shared<ExecRunner>();
    cfg.mounter = std::make_shared<SystemMounter>();
    cfg.syscall = std::make_shared<LinuxSyscall>();
    cfg.image_extractor = std::make_shared<SkopeoImageExtractor>(cfg.runner, cfg.fs);
    cfg.platform = Platform::Default();
    cfg.host = DetectHostEnv();
    return cfg;
}

std::vector<std::string> Config::SquashfsOptions() const {
    std::vector<std::string> opts{"-b", "1024k"};
    if (squashfs_no_compression) {
        opts.push_back("-no-compression");
    } else {
        opts.insert(opts.end(), squashfs_compression.begin(), squashfs_compression.end());
    }
    return opts;
}

} // namespace elemental
