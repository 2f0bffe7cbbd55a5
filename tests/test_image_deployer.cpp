#include <gtest/gtest.h>

#include "deploy/image_deployer.hpp"
#include "testing.hpp"
#include "util/constants.hpp"

#include <linux/loop.h>

namespace elemental {
namespace {

using testutil::LsblkJson;
using testutil::TestEnv;

constexpr std::uint64_t kMiB = 1024 * 1024;

Image ActiveImage() {
    Image img;
    img.file = "/run/cos/state/cOS/active.img";
    img.label = "COS_ACTIVE";
    img.size = 16;
    img.fs = "ext2";
    img.source = ImageSource::FromDir("/run/rootfs");
    img.mount_point = "/run/cos/active";
    return img;
}

PartitionPtr MountablePart(const std::string& name, const std::string& path, const std::string& mnt) {
    return std::make_shared<Partition>(Partition{.name = name, .mount_point = mnt, .path = path});
}

TEST(ImageDeployerTest, DeploysDirectoryIntoFilesystemImage) {
    TestEnv env;
    ImageDeployer deployer(env.cfg);
    Image img = ActiveImage();

    ImageSourceMetadata meta;
    auto r = deployer.DeployImage(img, false, meta);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    std::uint64_t size = 0;
    ASSERT_TRUE(env.fs->FileSize(img.file, size).is_ok());
    EXPECT_EQ(size, 16 * kMiB);
    EXPECT_TRUE(env.runner->Called("mkfs.ext2 -F -L COS_ACTIVE /run/cos/state/cOS/active.img"));
    EXPECT_TRUE(env.runner->Called("rsync"));
    EXPECT_EQ(env.runner->calls.back().args.back(), "/run/cos/active/");

    ASSERT_EQ(env.mounter->mounts.size(), 1u);
    EXPECT_EQ(env.mounter->mounts[0].source, "/dev/loop3");
    EXPECT_EQ(env.mounter->mounts[0].target, "/run/cos/active");
    EXPECT_EQ(env.mounter->mounts[0].fs_type, "ext2");

    for (const char* dir : {"/sys", "/proc", "/dev", "/tmp", "/boot", "/usr/local", "/oem"}) {
        EXPECT_TRUE(env.Exists(std::string("/run/cos/active") + dir)) << dir;
    }

    EXPECT_EQ(env.mounter->unmounts, (std::vector<std::string>{"/run/cos/active"}));
    EXPECT_EQ(env.syscall->IoctlCount(LOOP_CLR_FD), 1);
    EXPECT_TRUE(img.loop_device.empty());
    EXPECT_TRUE(env.syscall->open_fds.empty());
}

TEST(ImageDeployerTest, LeavesImageMounted) {
    TestEnv env;
    ImageDeployer deployer(env.cfg);
    Image img = ActiveImage();

    ImageSourceMetadata meta;
    ASSERT_TRUE(deployer.DeployImage(img, true, meta).is_ok());
    EXPECT_EQ(img.loop_device, "/dev/loop3");
    EXPECT_TRUE(env.mounter->IsMounted("/run/cos/active"));
    EXPECT_EQ(env.syscall->IoctlCount(LOOP_CLR_FD), 0);

    ASSERT_TRUE(deployer.UnmountImage(img).is_ok());
    EXPECT_FALSE(env.mounter->IsMounted("/run/cos/active"));
    EXPECT_EQ(env.syscall->IoctlCount(LOOP_CLR_FD), 1);
    EXPECT_TRUE(deployer.UnmountImage(img).is_ok());
}

TEST(ImageDeployerTest, FailedDumpRemovesImage) {
    TestEnv env;
    env.runner->failures["rsync"] = Result::Fail(23, "partial transfer");
    ImageDeployer deployer(env.cfg);
    Image img = ActiveImage();

    ImageSourceMetadata meta;
    auto r = deployer.DeployImage(img, true, meta);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.msg,
              "failed dumping dir:///run/rootfs: failed syncing /run/rootfs to /run/cos/active: partial transfer");
    EXPECT_FALSE(env.Exists(img.file));
    EXPECT_FALSE(env.mounter->IsMounted("/run/cos/active"));
    EXPECT_EQ(env.syscall->IoctlCount(LOOP_CLR_FD), 1);
}

TEST(ImageDeployerTest, FailedFormatRemovesImage) {
    TestEnv env;
    env.runner->failures["mkfs.ext2"] = Result::Fail(1, "bad block");
    ImageDeployer deployer(env.cfg);
    Image img = ActiveImage();

    ImageSourceMetadata meta;
    auto r = deployer.DeployImage(img, false, meta);
    EXPECT_EQ(r.msg, "bad block");
    EXPECT_FALSE(env.Exists(img.file));
    EXPECT_TRUE(env.mounter->mounts.empty());
}

TEST(ImageDeployerTest, SquashfsImage) {
    TestEnv env;
    ImageDeployer deployer(env.cfg);
    Image img;
    img.file = "/run/cos/recovery/cOS/recovery.squashfs";
    img.fs = kSquashFs;
    img.source = ImageSource::FromDocker("elemental/os:v1");
    env.extractor->files = {{"etc/os-release", "NAME=Elemental\n"}};

    ImageSourceMetadata meta;
    auto r = deployer.DeployImage(img, false, meta);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(meta.digest, "sha256:feedface");

    ASSERT_EQ(env.runner->calls.size(), 1u);
    const auto& call = env.runner->calls[0];
    EXPECT_EQ(call.cmd, "mksquashfs");
    EXPECT_EQ(call.args[0].rfind("/tmp/elemental-squash-", 0), 0u);
    EXPECT_EQ(std::vector<std::string>(call.args.begin() + 1, call.args.end()),
              (std::vector<std::string>{img.file, "-b", "1024k", "-comp", "gzip"}));
    EXPECT_FALSE(env.Exists(call.args[0]));
    EXPECT_TRUE(env.mounter->mounts.empty());
}

TEST(ImageDeployerTest, SquashfsWithoutCompression) {
    TestEnv env;
    env.cfg.squashfs_no_compression = true;
    ImageDeployer deployer(env.cfg);
    Image img;
    img.file = "/run/cos/recovery/cOS/recovery.squashfs";
    img.fs = kSquashFs;
    img.source = ImageSource::FromDir("/run/rootfs");

    ImageSourceMetadata meta;
    ASSERT_TRUE(deployer.DeployImage(img, false, meta).is_ok());
    EXPECT_EQ(env.runner->calls.back().args.back(), "-no-compression");
}

TEST(ImageDeployerTest, FileSourceIsCopiedAndRelabelled) {
    TestEnv env;
    env.Write("/run/initramfs/live/recovery.img", "ext2 image");
    ImageDeployer deployer(env.cfg);
    Image img;
    img.file = "/run/cos/state/cOS/passive.img";
    img.label = "COS_PASSIVE";
    img.fs = "ext2";
    img.source = ImageSource::FromFile("/run/initramfs/live/recovery.img");
    img.mount_point = "/run/cos/passive";

    ImageSourceMetadata meta;
    auto r = deployer.DeployImage(img, true, meta);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(env.Read(img.file), "ext2 image");
    EXPECT_TRUE(env.runner->Called("tune2fs -L COS_PASSIVE /run/cos/state/cOS/passive.img"));
    EXPECT_FALSE(env.Exists("/run/cos/passive/proc"));
    ASSERT_EQ(env.mounter->mounts.size(), 1u);
    EXPECT_EQ(env.mounter->mounts[0].options, (std::vector<std::string>{"rw"}));
}

TEST(ImageDeployerTest, FailedRelabelRemovesCopy) {
    TestEnv env;
    env.Write("/iso/recovery.img", "ext2 image");
    env.runner->failures["tune2fs"] = Result::Fail(1, "bad superblock");
    ImageDeployer deployer(env.cfg);
    Image img;
    img.file = "/state/cOS/passive.img";
    img.label = "COS_PASSIVE";
    img.fs = "ext2";
    img.source = ImageSource::FromFile("/iso/recovery.img");

    ImageSourceMetadata meta;
    auto r = deployer.DeployImage(img, false, meta);
    EXPECT_EQ(r.msg, "failed setting label of /state/cOS/passive.img: bad superblock");
    EXPECT_FALSE(env.Exists(img.file));
}

TEST(ImageDeployerTest, MountImageDetachesOnFailure) {
    TestEnv env;
    env.mounter->mount_failures["/run/cos/active"] = Result::Fail(EINVAL, "wrong fs type");
    ImageDeployer deployer(env.cfg);
    Image img = ActiveImage();

    auto r = deployer.MountImage(img);
    EXPECT_EQ(r.msg, "failed mounting image /run/cos/state/cOS/active.img: wrong fs type");
    EXPECT_EQ(env.syscall->IoctlCount(LOOP_CLR_FD), 1);
    EXPECT_TRUE(img.loop_device.empty());

    img.mount_point.clear();
    r = deployer.MountImage(img);
    EXPECT_EQ(r.msg, "no mount point defined for image /run/cos/state/cOS/active.img");
}

TEST(ImageDeployerTest, MountPartitionsUnwindsOnFailure) {
    TestEnv env;
    env.mounter->mount_failures["/run/cos/recovery"] = Result::Fail(EBUSY, "busy");
    ImageDeployer deployer(env.cfg);
    PartitionList parts{
        MountablePart("efi", "/dev/sda1", "/run/cos/efi"),
        MountablePart("bios", "/dev/sda5", ""),
        MountablePart("oem", "/dev/sda2", "/run/cos/oem"),
        MountablePart("recovery", "/dev/sda3", "/run/cos/recovery"),
        MountablePart("state", "/dev/sda4", "/run/cos/state"),
    };

    auto r = deployer.MountPartitions(parts);
    EXPECT_EQ(r.msg, "failed mounting recovery: busy");
    EXPECT_EQ(env.mounter->mounts.size(), 3u);
    EXPECT_EQ(env.mounter->unmounts, (std::vector<std::string>{"/run/cos/oem", "/run/cos/efi"}));
    EXPECT_TRUE(env.mounter->mounted.empty());
}

TEST(ImageDeployerTest, UnmountPartitionsCollectsErrors) {
    TestEnv env;
    ImageDeployer deployer(env.cfg);
    PartitionList parts{
        MountablePart("oem", "/dev/sda2", "/run/cos/oem"),
        MountablePart("state", "/dev/sda4", "/run/cos/state"),
        MountablePart("persistent", "/dev/sda5", "/run/cos/persistent"),
    };
    ASSERT_TRUE(deployer.MountPartitions(parts).is_ok());
    env.mounter->unmount_failures["/run/cos/oem"] = Result::Fail(EBUSY, "busy");
    env.mounter->unmount_failures["/run/cos/persistent"] = Result::Fail(EBUSY, "in use");

    auto r = deployer.UnmountPartitions(parts);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.msg, "failed unmounting oem: busy; failed unmounting persistent: in use");
    EXPECT_FALSE(env.mounter->IsMounted("/run/cos/state"));

    // Not mounted partitions are skipped.
    env.mounter->unmounts.clear();
    ASSERT_TRUE(deployer.UnmountPartition(*parts[1]).is_ok());
    EXPECT_TRUE(env.mounter->unmounts.empty());
}

TEST(ImageDeployerTest, MountPartitionResolvesDeviceByLabel) {
    TestEnv env;
    env.runner->outputs["lsblk"] = LsblkJson({
        {.name = "sda", .path = "/dev/sda", .size = 8192 * kMiB},
        {.name = "sda2", .pkname = "sda", .path = "/dev/sda2", .fstype = "ext4", .size = 64 * kMiB,
         .label = "COS_OEM"},
    });
    ImageDeployer deployer(env.cfg);
    Partition oem{.name = "oem", .filesystem_label = "COS_OEM", .mount_point = "/run/cos/oem"};

    ASSERT_TRUE(deployer.MountPartition(oem, {"ro"}).is_ok());
    EXPECT_EQ(oem.path, "/dev/sda2");
    ASSERT_EQ(env.mounter->mounts.size(), 1u);
    EXPECT_EQ(env.mounter->mounts[0].source, "/dev/sda2");
    EXPECT_EQ(env.mounter->mounts[0].options, (std::vector<std::string>{"ro"}));
    EXPECT_TRUE(env.Exists("/run/cos/oem"));

    Partition missing{.name = "persistent", .filesystem_label = "COS_PERSISTENT", .mount_point = "/usr/local"};
    auto r = deployer.MountPartition(missing);
    EXPECT_EQ(r.msg, "failed mounting persistent: no device found with label COS_PERSISTENT");

    Partition nowhere{.name = "bios"};
    EXPECT_EQ(deployer.MountPartition(nowhere).msg, "no mount point defined for bios");
}

TEST(ImageDeployerTest, MountRWPartitionRemountsWhenMounted) {
    TestEnv env;
    ImageDeployer deployer(env.cfg);
    Partition state{.name = "state", .mount_point = "/run/initramfs/cos-state", .path = "/dev/sda4"};
    env.mounter->mounted.insert(state.mount_point);

    CleanupStack::Job undo;
    ASSERT_TRUE(deployer.MountRWPartition(state, undo).is_ok());
    ASSERT_EQ(env.mounter->mounts.size(), 1u);
    EXPECT_EQ(env.mounter->mounts[0].options, (std::vector<std::string>{"remount", "rw"}));

    ASSERT_TRUE(undo);
    ASSERT_TRUE(undo().is_ok());
    EXPECT_EQ(env.mounter->mounts.back().options, (std::vector<std::string>{"remount", "ro"}));
    EXPECT_TRUE(env.mounter->IsMounted(state.mount_point));
}

TEST(ImageDeployerTest, MountRWPartitionMountsWhenUnmounted) {
    TestEnv env;
    ImageDeployer deployer(env.cfg);
    Partition recovery{.name = "recovery", .mount_point = "/run/cos/recovery", .path = "/dev/sda3"};

    CleanupStack::Job undo;
    ASSERT_TRUE(deployer.MountRWPartition(recovery, undo).is_ok());
    EXPECT_TRUE(env.mounter->IsMounted("/run/cos/recovery"));
    EXPECT_EQ(env.mounter->mounts[0].options, (std::vector<std::string>{"rw"}));

    ASSERT_TRUE(undo().is_ok());
    EXPECT_FALSE(env.mounter->IsMounted("/run/cos/recovery"));
}

} // namespace
} // namespace elemental
