#include "action/install_action.hpp"
#include "action/reset_action.hpp"
#include "action/upgrade_action.hpp"
#include "config/cloud_config.hpp"
#include "config/config.hpp"
#include "config/spec_builder.hpp"
#include "util/constants.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <getopt.h>
#include <string>
#include <vector>

namespace {

const std::vector<std::string> kDefaultConfigPaths = {
    "/oem",
    "/system/oem",
    "/usr/local/cloud-config",
    "/etc/elemental",
};

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] <install|upgrade|reset>\n"
        "\n"
        "Options:\n"
        "  -c, --config <path>    Cloud-config file or directory, may be repeated\n"
        "  -s, --source <uri>     Image source for the system (or recovery) image\n"
        "  -r, --recovery         Upgrade the recovery system instead of the active one\n"
        "  -d, --debug            Enable debug logging\n"
        "  -h, --help             Show this help\n",
        argv0);
}

elemental::Result RunAction(const elemental::Config& cfg, elemental::ISpec& spec) {
    using namespace elemental;
    if (auto* s = dynamic_cast<InstallSpec*>(&spec)) return InstallAction(cfg, *s).Run();
    if (auto* s = dynamic_cast<UpgradeSpec*>(&spec)) return UpgradeAction(cfg, *s).Run();
    if (auto* s = dynamic_cast<ResetSpec*>(&spec)) return ResetAction(cfg, *s).Run();
    return Result::Fail(-1, "no action for " + std::string(spec.Action()));
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> config_paths;
    std::string source;
    bool recovery = false;
    bool debug = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"source", required_argument, nullptr, 's'},
        {"recovery", no_argument, nullptr, 'r'},
        {"debug", no_argument, nullptr, 'd'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:s:rd", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'c':
                config_paths.emplace_back(optarg);
                break;
            case 's':
                source = optarg;
                break;
            case 'r':
                recovery = true;
                break;
            case 'd':
                debug = true;
                break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind + 1 != argc) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string action = argv[optind];
    if (action != "install" && action != "upgrade" && action != "reset") {
        std::fprintf(stderr, "unknown action: %s\n", action.c_str());
        PrintUsage(argv[0]);
        return 2;
    }
    if (recovery && action != "upgrade") {
        std::fprintf(stderr, "--recovery is only valid for upgrade\n");
        return 2;
    }

    auto& logger = elemental::Logger::Instance();
    logger.SetLevel(debug ? elemental::LogLevel::Debug : elemental::LogLevel::Info);

    elemental::Config cfg = elemental::Config::NewDefault();
    auto cc = elemental::CloudConfig::Load(*cfg.fs, config_paths.empty() ? kDefaultConfigPaths : config_paths);
    if (!cc) {
        LogError("failed loading cloud-config: %s", cc.error().c_str());
        return 1;
    }

    if (auto r = elemental::ApplyAgentOptions(*cc, cfg); !r.is_ok()) {
        LogError("invalid agent options: %s", r.msg.c_str());
        return 1;
    }
    cfg.debug = cfg.debug || debug;
    if (cfg.debug) logger.SetLevel(elemental::LogLevel::Debug);

    if (recovery) cc->SetString("upgrade", "recovery", "true");
    if (!source.empty()) {
        cc->SetString(action, recovery ? "recovery-system.uri" : "system.uri", source);
    }

    auto spec = elemental::SpecBuilder(cfg).ReadSpecFromCloudConfig(action, *cc);
    if (!spec) {
        if (action == "upgrade" && spec.error().msg.find("undefined upgrade source") != std::string::npos) {
            LogError("%s", elemental::kUpgradeNoSourceError);
        }
        LogError("%s", spec.error().msg.c_str());
        return 1;
    }

    auto r = RunAction(cfg, **spec);
    if (!r.is_ok()) {
        LogError("%s failed: %s", action.c_str(), r.msg.c_str());
        return 1;
    }
    return 0;
}
