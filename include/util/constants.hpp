#pragma once

#include <cstdint>

namespace elemental {

inline constexpr const char* kEfiLabel = "COS_GRUB";
inline constexpr const char* kActiveLabel = "COS_ACTIVE";
inline constexpr const char* kPassiveLabel = "COS_PASSIVE";
inline constexpr const char* kSystemLabel = "COS_SYSTEM";
inline constexpr const char* kRecoveryLabel = "COS_RECOVERY";
inline constexpr const char* kStateLabel = "COS_STATE";
inline constexpr const char* kPersistentLabel = "COS_PERSISTENT";
inline constexpr const char* kOemLabel = "COS_OEM";
inline constexpr const char* kDiskGuidSeed = "COS_DISK";

inline constexpr const char* kBiosPartName = "bios";
inline constexpr const char* kEfiPartName = "efi";
inline constexpr const char* kOemPartName = "oem";
inline constexpr const char* kRecoveryPartName = "recovery";
inline constexpr const char* kStatePartName = "state";
inline constexpr const char* kPersistentPartName = "persistent";

inline constexpr const char* kActiveImgName = "active";
inline constexpr const char* kPassiveImgName = "passive";
inline constexpr const char* kRecoveryImgName = "recovery";

inline constexpr const char* kEfiFirmware = "efi";
inline constexpr const char* kBiosFirmware = "bios";
inline constexpr const char* kGpt = "gpt";
inline constexpr const char* kMsdos = "msdos";

inline constexpr const char* kLinuxFs = "ext4";
inline constexpr const char* kLinuxImgFs = "ext2";
inline constexpr const char* kSquashFs = "squashfs";
inline constexpr const char* kEfiFs = "vfat";

inline constexpr const char* kEspFlag = "esp";
inline constexpr const char* kBiosGrubFlag = "bios_grub";
inline constexpr const char* kBootFlag = "boot";

inline constexpr std::uint64_t kEfiSize = 64;
inline constexpr std::uint64_t kOemSize = 64;
inline constexpr std::uint64_t kPersistentSize = 0;
inline constexpr std::uint64_t kBiosSize = 1;
inline constexpr std::uint64_t kImgSize = 3072;

inline constexpr const char* kIsoMnt = "/run/initramfs/live";
inline constexpr const char* kRecoveryDir = "/run/cos/recovery";
inline constexpr const char* kStateDir = "/run/cos/state";
inline constexpr const char* kOemDir = "/run/cos/oem";
inline constexpr const char* kPersistentDir = "/run/cos/persistent";
inline constexpr const char* kActiveDir = "/run/cos/active";
inline constexpr const char* kTransitionDir = "/run/cos/transition";
inline constexpr const char* kEfiDir = "/run/cos/efi";
inline constexpr const char* kIsoBaseTree = "/run/rootfsbase";
inline constexpr const char* kRunningStateDir = "/run/initramfs/cos-state";
inline constexpr const char* kIsoScanDir = "/run/initramfs/isoscan";
inline constexpr const char* kOemPath = "/oem";
inline constexpr const char* kUsrLocalPath = "/usr/local";
inline constexpr const char* kEfiFirmwareDir = "/sys/firmware/efi";
inline constexpr const char* kDefaultHostDir = "/host";
inline constexpr const char* kSelinuxPolicyDir = "/etc/selinux/targeted/policy";
inline constexpr const char* kSelinuxContextFile = "/etc/selinux/targeted/contexts/files/file_contexts";

inline constexpr const char* kRecoverySquashFile = "recovery.squashfs";
inline constexpr const char* kIsoRootFile = "rootfs.squashfs";
inline constexpr const char* kActiveImgFile = "active.img";
inline constexpr const char* kPassiveImgFile = "passive.img";
inline constexpr const char* kRecoveryImgFile = "recovery.img";
inline constexpr const char* kTransitionImgFile = "transition.img";
inline constexpr const char* kInstallStateFile = "state.yaml";
inline constexpr const char* kImagesSubdir = "cOS";

inline constexpr const char* kGrubDefEntry = "Kairos";
inline constexpr const char* kDefaultPlatform = "linux/amd64";

inline constexpr const char* kUpgradeNoSourceError =
    "Could not find a proper source for the upgrade.\n"
    "This can be configured in the cloud config files under the 'upgrade.system.uri' key "
    "or via cmdline using the '--source' flag.";

} // namespace elemental
