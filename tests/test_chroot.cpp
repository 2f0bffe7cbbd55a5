#include <gtest/gtest.h>

#include "system/chroot.hpp"
#include "testing.hpp"

#include <string>
#include <vector>

namespace elemental {
namespace {

using testutil::TestEnv;

std::vector<std::string> Targets(const std::vector<testutil::MountCall>& calls) {
    std::vector<std::string> out;
    for (const auto& c : calls) out.push_back(c.target);
    return out;
}

TEST(ChrootTest, PrepareMountsDefaultsThenExtrasByTarget) {
    TestEnv env;
    Chroot chroot("/root", env.mounter, env.syscall, env.fs);
    chroot.SetExtraMounts({{"/run/cos/persistent", "/usr/local"}, {"/run/cos/oem", "/oem"}});

    auto r = chroot.Prepare();
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(Targets(env.mounter->mounts),
              (std::vector<std::string>{"/root/dev", "/root/dev/pts", "/root/proc", "/root/sys", "/root/oem",
                                        "/root/usr/local"}));
    EXPECT_EQ(env.mounter->mounts[4].source, "/run/cos/oem");
    EXPECT_EQ(env.mounter->mounts[0].options, (std::vector<std::string>{"bind"}));
    EXPECT_TRUE(env.Exists("/root/usr/local"));

    EXPECT_FALSE(chroot.Prepare().is_ok());

    ASSERT_TRUE(chroot.Close().is_ok());
    EXPECT_EQ(env.mounter->unmounts.front(), "/root/usr/local");
    EXPECT_EQ(env.mounter->unmounts.back(), "/root/dev");
    EXPECT_TRUE(chroot.ActiveMounts().empty());
}

TEST(ChrootTest, BindsJournalWhenSystemdRuns) {
    TestEnv env;
    env.Mkdir("/run/systemd/system");
    Chroot chroot("/root", env.mounter, env.syscall, env.fs);
    ASSERT_TRUE(chroot.Prepare().is_ok());
    EXPECT_TRUE(env.mounter->IsMounted("/root/run/systemd/journal"));
    ASSERT_TRUE(chroot.Close().is_ok());
}

TEST(ChrootTest, PrepareFailureUnwinds) {
    TestEnv env;
    env.mounter->mount_failures["/root/proc"] = Result::Fail(1, "mount proc failed");
    Chroot chroot("/root", env.mounter, env.syscall, env.fs);

    auto r = chroot.Prepare();
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.msg, "mount proc failed");
    EXPECT_TRUE(chroot.ActiveMounts().empty());
    EXPECT_TRUE(env.mounter->mounted.empty());
}

TEST(ChrootTest, CloseKeepsFailedMounts) {
    TestEnv env;
    Chroot chroot("/root", env.mounter, env.syscall, env.fs);
    ASSERT_TRUE(chroot.Prepare().is_ok());
    env.mounter->unmount_failures["/root/proc"] = Result::Fail(16, "busy");

    auto r = chroot.Close();
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.msg, "failed closing chroot environment. Unmount failures: /root/proc");
    EXPECT_EQ(chroot.ActiveMounts(), (std::vector<std::string>{"/root/proc"}));

    env.mounter->unmount_failures.clear();
    EXPECT_TRUE(chroot.Close().is_ok());
}

TEST(ChrootTest, RunCallbackEntersAndLeaves) {
    TestEnv env;
    Chroot chroot("/root", env.mounter, env.syscall, env.fs);

    bool called = false;
    auto r = chroot.RunCallback([&]() {
        called = true;
        EXPECT_TRUE(env.mounter->IsMounted("/root/proc"));
        return Result::Ok();
    });
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_TRUE(called);
    EXPECT_EQ(env.syscall->chroots, (std::vector<std::string>{"/root", "."}));
    EXPECT_EQ(env.syscall->fchdir_calls, 1);
    EXPECT_EQ(env.syscall->closed.size(), 1u);
    EXPECT_TRUE(env.mounter->mounted.empty());
}

TEST(ChrootTest, RunCallbackKeepsMountsPreparedByCaller) {
    TestEnv env;
    Chroot chroot("/root", env.mounter, env.syscall, env.fs);
    ASSERT_TRUE(chroot.Prepare().is_ok());
    ASSERT_TRUE(chroot.RunCallback([]() { return Result::Ok(); }).is_ok());
    EXPECT_FALSE(chroot.ActiveMounts().empty());
    ASSERT_TRUE(chroot.Close().is_ok());
}

TEST(ChrootTest, CallbackErrorIsReturned) {
    TestEnv env;
    Chroot chroot("/root", env.mounter, env.syscall, env.fs);
    auto r = chroot.RunCallback([]() { return Result::Fail(5, "setfiles failed"); });
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.msg, "setfiles failed");
    EXPECT_TRUE(env.mounter->mounted.empty());
}

TEST(ChrootTest, ChrootFailureSkipsCallback) {
    TestEnv env;
    env.syscall->chroot_result = Result::Fail(EPERM, "operation not permitted");
    Chroot chroot("/root", env.mounter, env.syscall, env.fs);
    bool called = false;
    auto r = chroot.RunCallback([&]() { called = true; return Result::Ok(); });
    EXPECT_FALSE(r.is_ok());
    EXPECT_FALSE(called);
    EXPECT_EQ(r.msg, "can't chroot to /root: operation not permitted");
}

TEST(ChrootTest, RunExecutesThroughRunner) {
    TestEnv env;
    env.runner->outputs["setfiles"] = "done";
    Chroot chroot("/root", env.mounter, env.syscall, env.fs);
    std::string out;
    ASSERT_TRUE(chroot.Run(*env.runner, "setfiles", {"-c", "x"}, &out).is_ok());
    EXPECT_EQ(out, "done");
    EXPECT_TRUE(env.runner->Called("setfiles -c x"));
}

} // namespace
} // namespace elemental
