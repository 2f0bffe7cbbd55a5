#include <gtest/gtest.h>

#include "state/install_state_store.hpp"
#include "testing.hpp"

#include <regex>

namespace elemental {
namespace {

using testutil::TestEnv;

constexpr const char* kStateYaml = R"(# Autogenerated file by elemental-agent, do not edit

date: "2026-03-01T10:00:00Z"
state:
  label: COS_STATE
  active:
    source: oci://registry.local/elemental/os:v1.2
    source-metadata:
      digest: sha256:0123abcd
      size: 734003200
    label: COS_ACTIVE
    fs: ext2
  passive:
    source: oci://registry.local/elemental/os:v1.1
    label: COS_PASSIVE
    fs: ext2
recovery:
  label: COS_RECOVERY
  recovery:
    source: dir:///run/rootfs
    source-metadata:
      digest: ""
      size: 0
    label: COS_SYSTEM
    fs: squashfs
oem:
  label: COS_OEM
)";

InstallState SampleState() {
    InstallState state;
    state.date = "2026-03-01T10:00:00Z";
    state.partitions["state"] = PartitionState{
        .fs_label = "COS_STATE",
        .images = {{"active", ImageState{.source = ImageSource::FromDocker("elemental/os:v2"),
                                         .source_metadata = ImageSourceMetadata{.digest = "sha256:beef", .size = 42},
                                         .label = "COS_ACTIVE",
                                         .fs = "ext2"}}},
    };
    state.partitions["persistent"] = PartitionState{.fs_label = "COS_PERSISTENT"};
    return state;
}

TEST(InstallStateStoreTest, ParsesStateFile) {
    auto state = InstallStateStore::Parse(kStateYaml);
    ASSERT_TRUE(state.has_value()) << state.error();
    EXPECT_EQ(state->date, "2026-03-01T10:00:00Z");
    ASSERT_EQ(state->partitions.size(), 3u);

    const auto& st = state->partitions.at("state");
    EXPECT_EQ(st.fs_label, "COS_STATE");
    const auto& active = st.images.at("active");
    EXPECT_EQ(active.source, ImageSource::FromDocker("registry.local/elemental/os:v1.2"));
    ASSERT_TRUE(active.source_metadata.has_value());
    EXPECT_EQ(active.source_metadata->digest, "sha256:0123abcd");
    EXPECT_EQ(active.source_metadata->size, 734003200);
    EXPECT_EQ(active.label, "COS_ACTIVE");
    EXPECT_FALSE(st.images.at("passive").source_metadata.has_value());

    const auto& rec = state->partitions.at("recovery").images.at("recovery");
    EXPECT_EQ(rec.source, ImageSource::FromDir("/run/rootfs"));
    EXPECT_EQ(rec.fs, "squashfs");
    EXPECT_TRUE(rec.source_metadata->Empty());

    EXPECT_TRUE(state->partitions.at("oem").images.empty());
}

TEST(InstallStateStoreTest, SerializedStateParsesBack) {
    const InstallState state = SampleState();
    const std::string text = InstallStateStore::Serialize(state);
    EXPECT_EQ(text.rfind("# Autogenerated file by elemental-agent, do not edit\n\n", 0), 0u);
    EXPECT_NE(text.find("date: \"2026-03-01T10:00:00Z\""), std::string::npos);
    EXPECT_NE(text.find("source: oci://elemental/os:v2"), std::string::npos);
    EXPECT_EQ(text.find("persistent:\n  label: COS_PERSISTENT\n"), text.find("persistent:"));

    auto parsed = InstallStateStore::Parse(text);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    EXPECT_EQ(*parsed, state);
}

TEST(InstallStateStoreTest, ParseErrors) {
    auto r = InstallStateStore::Parse("- just\n- a list\n");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), "install state is not a map");

    r = InstallStateStore::Parse("state: COS_STATE\n");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), "invalid partition state state");

    r = InstallStateStore::Parse("state:\n  active:\n    source: ftp://host/os.img\n");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), "invalid install state: invalid URI reference ftp://host/os.img: unknown scheme ftp");

    r = InstallStateStore::Parse("state: [unclosed\n");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().rfind("invalid install state: ", 0), 0u);
}

TEST(InstallStateStoreTest, WritesEveryPath) {
    TestEnv env;
    InstallStateStore store(env.fs);
    const InstallState state = SampleState();

    ASSERT_TRUE(store.Write(state, {"/run/cos/state/state.yaml", "/run/cos/recovery/state.yaml"}).is_ok());
    EXPECT_EQ(env.Read("/run/cos/state/state.yaml"), InstallStateStore::Serialize(state));
    EXPECT_EQ(env.Read("/run/cos/recovery/state.yaml"), env.Read("/run/cos/state/state.yaml"));

    auto loaded = store.Load("/run/cos/recovery/state.yaml");
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_EQ(*loaded, state);
}

TEST(InstallStateStoreTest, WriteFailureStops) {
    TestEnv env;
    env.Write("/run/cos/state", "not a directory");
    InstallStateStore store(env.fs);

    auto r = store.Write(SampleState(), {"/run/cos/state/state.yaml", "/run/cos/recovery/state.yaml"});
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.msg.rfind("failed writing install state: ", 0), 0u);
    EXPECT_FALSE(env.Exists("/run/cos/recovery/state.yaml"));
}

TEST(InstallStateStoreTest, LoadReportsFile) {
    TestEnv env;
    InstallStateStore store(env.fs);
    EXPECT_FALSE(store.Load("/missing.yaml").has_value());

    env.Write("/bad.yaml", "- 1\n");
    auto r = store.Load("/bad.yaml");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), "/bad.yaml: install state is not a map");
}

TEST(InstallStateStoreTest, LoadDefaultPrefersStatePartition) {
    TestEnv env;
    InstallStateStore store(env.fs);
    EXPECT_FALSE(store.LoadDefault().has_value());

    env.Write("/run/initramfs/isoscan/state.yaml", "date: \"iso\"\n");
    auto r = store.LoadDefault();
    ASSERT_TRUE(r.has_value()) << r.error();
    EXPECT_EQ(r->date, "iso");

    env.Write("/run/initramfs/cos-state/state.yaml", "date: \"disk\"\n");
    r = store.LoadDefault();
    ASSERT_TRUE(r.has_value()) << r.error();
    EXPECT_EQ(r->date, "disk");
}

TEST(InstallStateStoreTest, NowIsRfc3339) {
    EXPECT_TRUE(std::regex_match(InstallStateStore::Now(),
                                 std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)")));
}

} // namespace
} // namespace elemental
