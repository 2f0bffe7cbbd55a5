#pragma once

#include "config/config.hpp"
#include "deploy/image_deployer.hpp"
#include "types/spec.hpp"
#include "util/cleanup_stack.hpp"
#include "util/result.hpp"

namespace elemental {

// Partitions the target disk and deploys active, recovery and passive
// images on it.
class InstallAction {
  public:
    InstallAction(Config cfg, InstallSpec& spec);

    Result Run();

  private:
    Result Install(CleanupStack& cleanup);
    // Loop mounts spec_.iso and points the active and recovery sources
    // into it.
    Result UseIsoSources(CleanupStack& cleanup);
    Result CopyCloudInit() const;
    Result WriteInstallState(const ImageSourceMetadata& system_meta, const ImageSourceMetadata& recovery_meta);

    Config cfg_;
    InstallSpec& spec_;
    ImageDeployer deployer_;
};

} // namespace elemental
