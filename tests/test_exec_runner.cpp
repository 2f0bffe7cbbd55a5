#include <gtest/gtest.h>

#include "system/runner.hpp"

#include <string>

namespace elemental {
namespace {

TEST(ExecRunnerTest, CapturesStdoutAndStderr) {
    ExecRunner runner;
    std::string out;
    auto r = runner.Run("sh", {"-c", "echo out; echo err 1>&2"}, &out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(out, "out\nerr\n");
}

TEST(ExecRunnerTest, ReportsExitCode) {
    ExecRunner runner;
    std::string out;
    auto r = runner.Run("sh", {"-c", "echo broken; exit 3"}, &out);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, 3);
    EXPECT_EQ(r.msg, "sh failed (exit 3): broken\n");
    EXPECT_EQ(out, "broken\n");
}

TEST(ExecRunnerTest, MissingCommandExits127) {
    ExecRunner runner;
    auto r = runner.Run("elemental-command-that-does-not-exist", {});
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, 127);
}

TEST(ExecRunnerTest, ArgumentsAreNotShellExpanded) {
    ExecRunner runner;
    std::string out;
    ASSERT_TRUE(runner.Run("echo", {"$HOME", "a b"}, &out).is_ok());
    EXPECT_EQ(out, "$HOME a b\n");
}

TEST(FormatCommandTest, JoinsWithSpaces) {
    EXPECT_EQ(FormatCommand("mkfs.ext4", {"-F", "-L", "COS_STATE", "/dev/sda4"}),
              "mkfs.ext4 -F -L COS_STATE /dev/sda4");
    EXPECT_EQ(FormatCommand("sync", {}), "sync");
}

} // namespace
} // namespace elemental
