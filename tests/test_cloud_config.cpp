#include <gtest/gtest.h>

#include "config/cloud_config.hpp"
#include "testing.hpp"
#include "util/constants.hpp"

namespace elemental {
namespace {

using testutil::TestEnv;

CloudConfig Parse(const char* text) {
    auto cc = CloudConfig::FromString(text);
    EXPECT_TRUE(cc.has_value()) << cc.error();
    return cc.value_or(CloudConfig{});
}

TEST(CloudConfigTest, LoadMergesFilesInOrder) {
    TestEnv env;
    env.Write("/oem/01_base.yaml",
              "install:\n"
              "  device: /dev/sda\n"
              "  system:\n"
              "    uri: oci://elemental/os:1\n"
              "    size: 2048\n");
    env.Write("/oem/02_override.yml",
              "install:\n"
              "  system:\n"
              "    uri: oci://elemental/os:2\n");
    env.Write("/oem/README.txt", "not: [yaml");
    env.Write("/etc/elemental/config.yaml", "debug: true\n");

    auto cc = CloudConfig::Load(*env.fs, {"/oem", "/missing", "/etc/elemental/config.yaml"});
    ASSERT_TRUE(cc.has_value()) << cc.error();

    const YAML::Node install = cc->Section("install");
    EXPECT_EQ(install["device"].as<std::string>(), "/dev/sda");
    EXPECT_EQ(install["system"]["uri"].as<std::string>(), "oci://elemental/os:2");
    // Nested maps merge instead of replacing each other.
    EXPECT_EQ(install["system"]["size"].as<int>(), 2048);
    EXPECT_TRUE(cc->Root()["debug"].as<bool>());
}

TEST(CloudConfigTest, InvalidYamlNamesFile) {
    TestEnv env;
    env.Write("/oem/bad.yaml", "install: [unclosed\n");
    auto cc = CloudConfig::Load(*env.fs, {"/oem"});
    ASSERT_FALSE(cc.has_value());
    EXPECT_NE(cc.error().find("invalid yaml in /oem/bad.yaml"), std::string::npos);

    EXPECT_FALSE(CloudConfig::FromString("- a\n- b\n").has_value());
    EXPECT_TRUE(CloudConfig::FromString("").has_value());
}

TEST(CloudConfigTest, SetStringAndHas) {
    auto cc = Parse("upgrade:\n  reboot: true\n");
    EXPECT_FALSE(cc.Has("upgrade", "system.uri"));
    EXPECT_FALSE(cc.Has("reset", "system.uri"));

    cc.SetString("upgrade", "system.uri", "oci://elemental/os:3");
    EXPECT_TRUE(cc.Has("upgrade", "system.uri"));
    EXPECT_TRUE(cc.Has("upgrade", "reboot"));
    EXPECT_EQ(cc.Section("upgrade")["system"]["uri"].as<std::string>(), "oci://elemental/os:3");

    cc.SetString("upgrade", "recovery", "true");
    EXPECT_TRUE(cc.Section("upgrade")["recovery"].as<bool>());
}

TEST(CloudConfigTest, AgentOptions) {
    auto cc = Parse(
        "debug: true\n"
        "cosign: true\n"
        "cosign-public-key: /etc/cosign.pub\n"
        "platform: linux/aarch64\n"
        "squash-compression: [-comp, xz]\n"
        "size-factors:\n"
        "  docker: 3\n"
        "  padding: 200\n");
    Config cfg;
    auto r = ApplyAgentOptions(cc, cfg);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_TRUE(cfg.debug);
    EXPECT_TRUE(cfg.cosign);
    EXPECT_EQ(cfg.cosign_pub_key, "/etc/cosign.pub");
    EXPECT_EQ(cfg.platform.String(), "linux/arm64");
    EXPECT_EQ(cfg.squashfs_compression, (std::vector<std::string>{"-comp", "xz"}));
    EXPECT_DOUBLE_EQ(cfg.size_factors.docker, 3.0);
    EXPECT_DOUBLE_EQ(cfg.size_factors.oci_file, 2.0);
    EXPECT_EQ(cfg.size_factors.padding_mb, 200);
    EXPECT_EQ(cfg.SquashfsOptions(), (std::vector<std::string>{"-b", "1024k", "-comp", "xz"}));

    cfg.squashfs_no_compression = true;
    EXPECT_EQ(cfg.SquashfsOptions(), (std::vector<std::string>{"-b", "1024k", "-no-compression"}));
}

TEST(CloudConfigTest, AgentOptionErrors) {
    Config cfg;
    EXPECT_FALSE(ApplyAgentOptions(Parse("platform: linux\n"), cfg).is_ok());
    EXPECT_FALSE(ApplyAgentOptions(Parse("debug: maybe\n"), cfg).is_ok());
    auto r = ApplyAgentOptions(Parse("size-factors:\n  docker: -1\n"), cfg);
    EXPECT_EQ(r.msg, "size-factors must be positive");
}

TEST(CloudConfigTest, OverlayInstall) {
    auto cc = Parse(
        "install:\n"
        "  device: /dev/vda\n"
        "  firmware: bios\n"
        "  no-format: true\n"
        "  reboot: true\n"
        "  grub-entry-name: Custom\n"
        "  extra-dirs-rootfs: [/var/lib/extra]\n"
        "  system:\n"
        "    uri: dir:///run/rootfs\n"
        "    label: MYACTIVE\n"
        "  recovery-system:\n"
        "    fs: squashfs\n"
        "  partitions:\n"
        "    persistent:\n"
        "      size: 4096\n"
        "      fs: xfs\n"
        "  extra-partitions:\n"
        "    - name: data\n"
        "      label: DATA\n"
        "      size: 0\n"
        "      fs: ext4\n");
    InstallSpec spec;
    spec.partitions.persistent = std::make_shared<Partition>(Partition{.name = kPersistentPartName, .fs = kLinuxFs});

    auto r = OverlayInstallSpec(cc.Section("install"), spec);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(spec.target, "/dev/vda");
    EXPECT_EQ(spec.firmware, "bios");
    EXPECT_TRUE(spec.no_format);
    EXPECT_TRUE(spec.reboot);
    EXPECT_EQ(spec.grub_def_entry, "Custom");
    EXPECT_EQ(spec.extra_dirs_rootfs, (std::vector<std::string>{"/var/lib/extra"}));
    EXPECT_EQ(spec.active.source, ImageSource::FromDir("/run/rootfs"));
    EXPECT_EQ(spec.active.label, "MYACTIVE");
    EXPECT_EQ(spec.recovery.fs, "squashfs");
    EXPECT_EQ(spec.partitions.persistent->name, kPersistentPartName);
    EXPECT_EQ(spec.partitions.persistent->size, 4096u);
    EXPECT_EQ(spec.partitions.persistent->fs, "xfs");
    ASSERT_EQ(spec.extra_partitions.size(), 1u);
    EXPECT_EQ(spec.extra_partitions[0]->filesystem_label, "DATA");
}

TEST(CloudConfigTest, OverlayRejectsWrongTypes) {
    InstallSpec spec;
    auto r = OverlayInstallSpec(Parse("install:\n  reboot: [1]\n").Section("install"), spec);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.msg.rfind("install: invalid value for reboot", 0), 0u);

    r = OverlayInstallSpec(Parse("install:\n  system:\n    uri: ftp://x/y\n").Section("install"), spec);
    EXPECT_FALSE(r.is_ok());

    r = OverlayInstallSpec(Parse("install:\n  extra-partitions: {a: 1}\n").Section("install"), spec);
    EXPECT_EQ(r.msg, "install: extra-partitions must be a list");

    UpgradeSpec up;
    EXPECT_FALSE(OverlayUpgradeSpec(Parse("upgrade: 3\n").Section("upgrade"), up).is_ok());
}

TEST(CloudConfigTest, OverlayUpgradeAndReset) {
    auto cc = Parse(
        "upgrade:\n"
        "  recovery: true\n"
        "  recovery-system:\n"
        "    uri: oci://elemental/recovery:2\n"
        "reset:\n"
        "  reset-persistent: false\n"
        "  reset-oem: true\n"
        "  poweroff: true\n");

    UpgradeSpec up;
    ASSERT_TRUE(OverlayUpgradeSpec(cc.Section("upgrade"), up).is_ok());
    EXPECT_TRUE(up.recovery_upgrade);
    EXPECT_EQ(up.recovery.source.Value(), "elemental/recovery:2");

    ResetSpec reset;
    ASSERT_TRUE(OverlayResetSpec(cc.Section("reset"), reset).is_ok());
    EXPECT_FALSE(reset.format_persistent);
    EXPECT_TRUE(reset.format_oem);
    EXPECT_TRUE(reset.poweroff);

    ResetSpec untouched;
    ASSERT_TRUE(OverlayResetSpec(cc.Section("install"), untouched).is_ok());
    EXPECT_TRUE(untouched.format_persistent);
}

} // namespace
} // namespace elemental
