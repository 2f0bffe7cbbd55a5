#pragma once

#include "types/image.hpp"
#include "types/install_state.hpp"
#include "types/partition.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace elemental {

class ISpec {
  public:
    virtual ~ISpec() = default;
    // Validates the plan and fills derived fields. Must run before execution.
    virtual Result Sanitize() = 0;
    virtual bool ShouldReboot() const = 0;
    virtual bool ShouldShutdown() const = 0;
    virtual std::string_view Action() const = 0;
};

struct InstallSpec final : ISpec {
    std::string target;
    std::string firmware;
    std::string part_table;
    ElementalPartitions partitions;
    PartitionList extra_partitions;
    bool no_format = false;
    bool force = false;
    bool reboot = false;
    bool poweroff = false;
    std::string iso;
    std::string grub_def_entry;
    std::vector<std::string> cloud_init;
    std::vector<std::string> encrypted_partitions;
    std::vector<std::string> extra_dirs_rootfs;
    Image active;
    Image recovery;
    Image passive;

    Result Sanitize() override;
    bool ShouldReboot() const override { return reboot; }
    bool ShouldShutdown() const override { return poweroff; }
    std::string_view Action() const override { return "install"; }
};

struct UpgradeSpec final : ISpec {
    bool recovery_upgrade = false;
    Image active;
    Image recovery;
    Image passive;
    std::string grub_def_entry;
    bool reboot = false;
    bool poweroff = false;
    std::vector<std::string> extra_dirs_rootfs;
    ElementalPartitions partitions;
    std::optional<InstallState> state;

    Result Sanitize() override;
    bool ShouldReboot() const override { return reboot; }
    bool ShouldShutdown() const override { return poweroff; }
    std::string_view Action() const override { return "upgrade"; }
};

struct ResetSpec final : ISpec {
    bool format_persistent = true;
    bool format_oem = false;
    bool reboot = false;
    bool poweroff = false;
    std::string grub_def_entry;
    std::vector<std::string> extra_dirs_rootfs;
    Image active;
    Image passive;
    ElementalPartitions partitions;
    std::string target;
    bool efi = false;
    std::optional<InstallState> state;

    Result Sanitize() override;
    bool ShouldReboot() const override { return reboot; }
    bool ShouldShutdown() const override { return poweroff; }
    std::string_view Action() const override { return "reset"; }
};

} // namespace elemental
