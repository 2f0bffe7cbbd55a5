#include <gtest/gtest.h>

#include "system/mounter.hpp"
#include "testing.hpp"

#include <sys/mount.h>

namespace elemental {
namespace {

TEST(SystemMounterTest, ParseOptions) {
    unsigned long flags = 0;
    std::string data;

    SystemMounter::ParseOptions({"ro", "nosuid", "nodev"}, flags, data);
    EXPECT_EQ(flags, static_cast<unsigned long>(MS_RDONLY | MS_NOSUID | MS_NODEV));
    EXPECT_TRUE(data.empty());

    SystemMounter::ParseOptions({"remount", "ro", "rw"}, flags, data);
    EXPECT_EQ(flags, static_cast<unsigned long>(MS_REMOUNT));

    SystemMounter::ParseOptions({"rbind", "defaults", ""}, flags, data);
    EXPECT_EQ(flags, static_cast<unsigned long>(MS_BIND | MS_REC));
    EXPECT_TRUE(data.empty());

    SystemMounter::ParseOptions({"rw", "errors=remount-ro", "noatime", "discard"}, flags, data);
    EXPECT_EQ(flags, static_cast<unsigned long>(MS_NOATIME));
    EXPECT_EQ(data, "errors=remount-ro,discard");
}

TEST(SystemMounterTest, PlainDirectoryIsNotAMountPoint) {
    testutil::TemporaryDirectory tmp;
    SystemMounter mounter;
    bool not_mounted = false;
    ASSERT_TRUE(mounter.IsLikelyNotMountPoint(tmp.Path(), not_mounted).is_ok());
    EXPECT_TRUE(not_mounted);

    auto r = mounter.IsLikelyNotMountPoint(tmp.Path() + "/missing", not_mounted);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ENOENT);
}

} // namespace
} // namespace elemental
