#pragma once

#include "config/config.hpp"
#include "deploy/image_deployer.hpp"
#include "types/spec.hpp"
#include "util/cleanup_stack.hpp"
#include "util/result.hpp"

namespace elemental {

// Reformats the state partition from the recovery system and deploys a
// fresh active and passive image.
class ResetAction {
  public:
    ResetAction(Config cfg, ResetSpec& spec);

    Result Run();

  private:
    Result Reset(CleanupStack& cleanup);
    Result UpdateInstallState(CleanupStack& cleanup, const ImageSourceMetadata& meta);

    Config cfg_;
    ResetSpec& spec_;
    ImageDeployer deployer_;
};

} // namespace elemental
