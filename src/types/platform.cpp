#include "types/platform.hpp"

#include "util/constants.hpp"
#include "util/path_utils.hpp"

#include <sys/utsname.h>

namespace elemental {

std::string NormalizeArch(std::string_view arch) {
    if (arch == "x86_64") return "amd64";
    if (arch == "aarch64") return "arm64";
    return std::string(arch);
}

std::expected<Platform, std::string> Platform::Parse(std::string_view s) {
    const auto parts = SplitString(s, '/');
    if (parts.size() < 2 || parts.size() > 3 || parts[0].empty() || parts[1].empty()) {
        return std::unexpected("invalid platform " + std::string(s) + ", expected os/arch[/variant]");
    }
    Platform p;
    p.os = parts[0];
    p.arch = NormalizeArch(parts[1]);
    if (parts.size() == 3) p.variant = parts[2];
    return p;
}

Platform Platform::Default() {
    struct utsname u {};
    if (::uname(&u) == 0) {
        return Platform{.os = "linux", .arch = NormalizeArch(u.machine), .variant = ""};
    }
    return *Parse(kDefaultPlatform);
}

std::string Platform::String() const {
    std::string out = os + "/" + arch;
    if (!variant.empty()) out += "/" + variant;
    return out;
}

bool Platform::Matches(std::string_view os_name,
                       std::string_view architecture,
                       std::string_view arch_variant) const {
    if (os_name != os || NormalizeArch(architecture) != arch) return false;
    return variant.empty() || arch_variant.empty() || arch_variant == variant;
}

} // namespace elemental
