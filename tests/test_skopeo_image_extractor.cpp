#include <gtest/gtest.h>

#include "system/image_extractor.hpp"
#include "testing.hpp"

namespace elemental {
namespace {

using testutil::TestEnv;

constexpr const char* kArmList = R"({
  "schemaVersion": 2,
  "manifests": [
    {"digest": "sha256:amd64", "platform": {"os": "linux", "architecture": "amd64"}},
    {"digest": "sha256:armv6", "platform": {"os": "linux", "architecture": "arm", "variant": "v6"}},
    {"digest": "sha256:armv7", "platform": {"os": "linux", "architecture": "arm", "variant": "v7"}}
  ]
})";

constexpr const char* kListRequest = "skopeo inspect --raw docker://registry.local/elemental/os:v1";

std::string Manifest(std::int64_t a, std::int64_t b) {
    return R"({"schemaVersion": 2, "layers": [{"size": )" + std::to_string(a) + R"(}, {"size": )" +
           std::to_string(b) + "}]}";
}

TEST(SkopeoImageExtractorTest, SizeOfSingleManifest) {
    TestEnv env;
    env.runner->outputs[kListRequest] = Manifest(1000, 234);
    SkopeoImageExtractor extractor(env.runner, env.fs);

    std::int64_t bytes = 0;
    ASSERT_TRUE(extractor.GetOCIImageSize("registry.local/elemental/os:v1", env.cfg.platform, bytes).is_ok());
    EXPECT_EQ(bytes, 1234);
    EXPECT_EQ(env.runner->calls.size(), 1u);
}

TEST(SkopeoImageExtractorTest, SizeSelectsPlatformVariant) {
    TestEnv env;
    env.runner->outputs[kListRequest] = kArmList;
    env.runner->outputs["skopeo inspect --raw docker://registry.local/elemental/os@sha256:armv6"] = Manifest(6, 0);
    env.runner->outputs["skopeo inspect --raw docker://registry.local/elemental/os@sha256:armv7"] = Manifest(7, 0);
    SkopeoImageExtractor extractor(env.runner, env.fs);

    std::int64_t bytes = 0;
    const Platform armv7{.os = "linux", .arch = "arm", .variant = "v7"};
    auto r = extractor.GetOCIImageSize("registry.local/elemental/os:v1", armv7, bytes);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(bytes, 7);

    const Platform arm{.os = "linux", .arch = "arm", .variant = ""};
    ASSERT_TRUE(extractor.GetOCIImageSize("registry.local/elemental/os:v1", arm, bytes).is_ok());
    EXPECT_EQ(bytes, 6);
}

TEST(SkopeoImageExtractorTest, SizeWithoutMatchingPlatform) {
    TestEnv env;
    env.runner->outputs[kListRequest] = kArmList;
    SkopeoImageExtractor extractor(env.runner, env.fs);

    std::int64_t bytes = 0;
    const Platform armv5{.os = "linux", .arch = "arm", .variant = "v5"};
    auto r = extractor.GetOCIImageSize("registry.local/elemental/os:v1", armv5, bytes);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.msg, "no manifest for platform linux/arm/v5 in registry.local/elemental/os:v1");

    env.runner->outputs[kListRequest] = "not json";
    r = extractor.GetOCIImageSize("registry.local/elemental/os:v1", env.cfg.platform, bytes);
    EXPECT_EQ(r.msg.rfind("invalid manifest for registry.local/elemental/os:v1: ", 0), 0u);
}

} // namespace
} // namespace elemental
