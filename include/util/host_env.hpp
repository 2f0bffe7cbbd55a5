#pragma once

#include <string>

namespace elemental {

struct HostEnv {
    bool in_kubernetes = false;
    std::string host_dir;
};

// Reads KUBERNETES_SERVICE_HOST and HOST_DIR from the process environment.
HostEnv DetectHostEnv();

} // namespace elemental
