#include <gtest/gtest.h>

#include "types/partition.hpp"
#include "util/constants.hpp"

#include <memory>
#include <string>
#include <vector>

namespace elemental {
namespace {

PartitionPtr Make(std::string name, std::string label, std::uint64_t size, std::string mnt = "") {
    return std::make_shared<Partition>(Partition{
        .name = std::move(name),
        .filesystem_label = std::move(label),
        .size = size,
        .fs = "ext4",
        .mount_point = std::move(mnt),
    });
}

ElementalPartitions DefaultLayout() {
    ElementalPartitions ep;
    ep.oem = Make(kOemPartName, kOemLabel, 64, kOemDir);
    ep.recovery = Make(kRecoveryPartName, kRecoveryLabel, 8192, kRecoveryDir);
    ep.state = Make(kStatePartName, kStateLabel, 15360, kStateDir);
    ep.persistent = Make(kPersistentPartName, kPersistentLabel, 0, kPersistentDir);
    return ep;
}

std::vector<std::string> Names(const PartitionList& list) {
    std::vector<std::string> out;
    for (const auto& p : list) out.push_back(p->name);
    return out;
}

TEST(PartitionTest, LookupPrefersMountedMatch) {
    auto unmounted_a = Make("a", "LBL", 10);
    auto mounted = Make("a", "LBL", 10, "/mnt");
    auto unmounted_b = Make("a", "LBL", 10);

    PartitionList list{unmounted_a, mounted, unmounted_b};
    EXPECT_EQ(GetPartitionByName(list, "a"), mounted);
    EXPECT_EQ(GetPartitionByLabel(list, "LBL"), mounted);

    PartitionList none_mounted{unmounted_a, unmounted_b};
    EXPECT_EQ(GetPartitionByName(none_mounted, "a"), unmounted_b);
    EXPECT_EQ(GetPartitionByName(none_mounted, "missing"), nullptr);
}

TEST(PartitionTest, FromListMatchesNameThenLabel) {
    auto state = Make("", kStateLabel, 0);
    auto recovery = Make(kRecoveryPartName, "OTHER", 0);
    auto ep = ElementalPartitions::FromList({state, recovery});
    EXPECT_EQ(ep.state, state);
    EXPECT_EQ(ep.recovery, recovery);
    EXPECT_EQ(ep.oem, nullptr);
    EXPECT_EQ(ep.efi, nullptr);
}

TEST(PartitionTest, InstallOrderPutsZeroSizedLast) {
    auto ep = DefaultLayout();
    ASSERT_TRUE(ep.SetFirmwarePartitions(kEfiFirmware, kGpt).is_ok());

    auto extra = Make("data", "DATA", 100);
    auto order = ep.PartitionsByInstallOrder({extra});
    EXPECT_EQ(Names(order),
              (std::vector<std::string>{"efi", "oem", "recovery", "state", "data", "persistent"}));
}

TEST(PartitionTest, InstallOrderDropsSecondZeroSizedExtra) {
    auto ep = DefaultLayout();
    ep.persistent->size = 1024;
    auto first = Make("first", "F", 0);
    auto second = Make("second", "S", 0);
    auto order = ep.PartitionsByInstallOrder({first, second});
    EXPECT_EQ(Names(order),
              (std::vector<std::string>{"oem", "recovery", "state", "persistent", "first"}));
}

TEST(PartitionTest, InstallOrderHonorsExcludes) {
    auto ep = DefaultLayout();
    auto order = ep.PartitionsByInstallOrder({}, {ep.recovery});
    EXPECT_EQ(Names(order), (std::vector<std::string>{"oem", "state", "persistent"}));
}

TEST(PartitionTest, MountPointOrder) {
    auto ep = DefaultLayout();
    ep.state->mount_point = "/run/cos/state";
    ep.persistent->mount_point = "/run/cos/state/persistent";
    ep.oem->mount_point.clear();

    EXPECT_EQ(Names(ep.PartitionsByMountPoint(false)),
              (std::vector<std::string>{"recovery", "state", "persistent"}));
    EXPECT_EQ(Names(ep.PartitionsByMountPoint(true)),
              (std::vector<std::string>{"persistent", "state", "recovery"}));
}

TEST(PartitionTest, EfiFirmwareAddsEsp) {
    auto ep = DefaultLayout();
    ASSERT_TRUE(ep.SetFirmwarePartitions(kEfiFirmware, kGpt).is_ok());
    ASSERT_NE(ep.efi, nullptr);
    EXPECT_EQ(ep.bios, nullptr);
    EXPECT_EQ(ep.efi->fs, kEfiFs);
    EXPECT_EQ(ep.efi->filesystem_label, kEfiLabel);
    EXPECT_EQ(ep.efi->size, kEfiSize);
    EXPECT_TRUE(ep.efi->HasFlag(kEspFlag));
}

TEST(PartitionTest, BiosFirmwareAddsBiosGrub) {
    auto ep = DefaultLayout();
    ASSERT_TRUE(ep.SetFirmwarePartitions(kBiosFirmware, kGpt).is_ok());
    ASSERT_NE(ep.bios, nullptr);
    EXPECT_EQ(ep.efi, nullptr);
    EXPECT_TRUE(ep.bios->fs.empty());
    EXPECT_TRUE(ep.bios->HasFlag(kBiosGrubFlag));
}

TEST(PartitionTest, MsdosFlagsStateAsBoot) {
    auto ep = DefaultLayout();
    ASSERT_TRUE(ep.SetFirmwarePartitions(kBiosFirmware, kMsdos).is_ok());
    EXPECT_EQ(ep.bios, nullptr);
    EXPECT_EQ(ep.efi, nullptr);
    EXPECT_EQ(ep.state->flags, (std::vector<std::string>{kBootFlag}));

    ElementalPartitions empty;
    auto r = empty.SetFirmwarePartitions(kBiosFirmware, kMsdos);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.msg, "nil state partition");
}

TEST(PartitionTest, DefaultLabelsOverrideUserValues) {
    auto ep = DefaultLayout();
    ep.state->filesystem_label = "MYSTATE";
    ep.oem->name = "custom";
    ep.SetDefaultLabels();
    EXPECT_EQ(ep.state->filesystem_label, kStateLabel);
    EXPECT_EQ(ep.oem->name, kOemPartName);
}

} // namespace
} // namespace elemental
