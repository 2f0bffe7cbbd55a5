#include "util/host_env.hpp"

#include "util/constants.hpp"

#include <cstdlib>

namespace elemental {

HostEnv DetectHostEnv() {
    HostEnv env;
    const char* k8s = std::getenv("KUBERNETES_SERVICE_HOST");
    env.in_kubernetes = k8s != nullptr && *k8s != '\0';

    const char* host_dir = std::getenv("HOST_DIR");
    env.host_dir = (host_dir != nullptr && *host_dir != '\0') ? host_dir : kDefaultHostDir;
    return env;
}

} // namespace elemental
