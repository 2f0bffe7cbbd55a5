#pragma once

#include "config/config.hpp"
#include "deploy/image_deployer.hpp"
#include "types/spec.hpp"
#include "util/cleanup_stack.hpp"
#include "util/result.hpp"

#include <string>

namespace elemental {

// Deploys a transition image and swaps it in as the new active or
// recovery system.
class UpgradeAction {
  public:
    UpgradeAction(Config cfg, UpgradeSpec& spec);

    Result Run();

  private:
    Result Upgrade(CleanupStack& cleanup);
    Result UpdateInstallState(const ImageSourceMetadata& meta, const Image& img);
    Result RemoveIfExists(const std::string& path) const;

    Config cfg_;
    UpgradeSpec& spec_;
    ImageDeployer deployer_;
};

} // namespace elemental
