#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace elemental {

struct Platform {
    std::string os;
    std::string arch;
    std::string variant;

    // "os/arch[/variant]", arch aliases such as x86_64 are normalized.
    static std::expected<Platform, std::string> Parse(std::string_view s);
    // Platform of the running host.
    static Platform Default();

    std::string String() const;

    // Whether a descriptor's platform fields select this platform. The
    // variant only has to agree when both sides define one.
    bool Matches(std::string_view os_name, std::string_view architecture, std::string_view arch_variant) const;

    bool operator==(const Platform&) const = default;
};

std::string NormalizeArch(std::string_view arch);

} // namespace elemental
