#include <gtest/gtest.h>

#include "types/image_source.hpp"

#include <string>

namespace elemental {
namespace {

TEST(ImageSourceTest, ParsesOciReference) {
    auto src = ImageSource::FromUri("oci://registry.suse.com/elemental/os:v1.2");
    ASSERT_TRUE(src.has_value()) << src.error();
    EXPECT_TRUE(src->IsDocker());
    EXPECT_EQ(src->Value(), "registry.suse.com/elemental/os:v1.2");
    EXPECT_EQ(src->String(), "oci://registry.suse.com/elemental/os:v1.2");
}

TEST(ImageSourceTest, BareReferenceDefaultsToLatest) {
    auto src = ImageSource::FromUri("elemental/os");
    ASSERT_TRUE(src.has_value()) << src.error();
    EXPECT_TRUE(src->IsDocker());
    EXPECT_EQ(src->Value(), "elemental/os:latest");
}

TEST(ImageSourceTest, DockerAndContainerAliases) {
    for (const char* uri : {"docker://elemental/os:1", "container://elemental/os:1"}) {
        auto src = ImageSource::FromUri(uri);
        ASSERT_TRUE(src.has_value()) << uri;
        EXPECT_TRUE(src->IsDocker());
        EXPECT_EQ(src->Value(), "elemental/os:1");
    }
}

TEST(ImageSourceTest, RegistryWithPortIsNotAScheme) {
    auto src = ImageSource::FromUri("localhost:5000/os");
    ASSERT_TRUE(src.has_value()) << src.error();
    EXPECT_EQ(src->Value(), "localhost:5000/os:latest");
}

TEST(ImageSourceTest, DigestReferenceKeptAsIs) {
    const std::string ref = "elemental/os@sha256:" + std::string(64, 'a');
    auto src = ImageSource::FromUri(ref);
    ASSERT_TRUE(src.has_value()) << src.error();
    EXPECT_EQ(src->Value(), ref);
}

TEST(ImageSourceTest, LocalSources) {
    auto dir = ImageSource::FromUri("dir:///run/rootfs");
    ASSERT_TRUE(dir.has_value()) << dir.error();
    EXPECT_TRUE(dir->IsDir());
    EXPECT_EQ(dir->Value(), "/run/rootfs");
    EXPECT_EQ(dir->String(), "dir:///run/rootfs");

    auto file = ImageSource::FromUri("file:///images/recovery.img");
    ASSERT_TRUE(file.has_value()) << file.error();
    EXPECT_TRUE(file->IsFile());
    EXPECT_EQ(file->Value(), "/images/recovery.img");

    auto oci = ImageSource::FromUri("ocifile:///images/os.tar");
    ASSERT_TRUE(oci.has_value()) << oci.error();
    EXPECT_TRUE(oci->IsOciFile());
    EXPECT_EQ(oci->String(), "ocifile:///images/os.tar");
}

TEST(ImageSourceTest, OpaqueAndUppercaseSchemes) {
    auto rel = ImageSource::FromUri("dir:relative/root");
    ASSERT_TRUE(rel.has_value()) << rel.error();
    EXPECT_TRUE(rel->IsDir());
    EXPECT_EQ(rel->Value(), "relative/root");

    auto upper = ImageSource::FromUri("DIR:///x");
    ASSERT_TRUE(upper.has_value()) << upper.error();
    EXPECT_TRUE(upper->IsDir());
    EXPECT_EQ(upper->Value(), "/x");
}

TEST(ImageSourceTest, QueryIsIgnored) {
    auto src = ImageSource::FromUri("dir:///tmp/x?opt=1");
    ASSERT_TRUE(src.has_value()) << src.error();
    EXPECT_EQ(src->Value(), "/tmp/x");
}

TEST(ImageSourceTest, RejectsFragments) {
    auto src = ImageSource::FromUri("oci://elemental/os#frag");
    ASSERT_FALSE(src.has_value());
    EXPECT_EQ(src.error(), "invalid URI reference oci://elemental/os#frag: fragments are not supported");
}

TEST(ImageSourceTest, RejectsUnknownScheme) {
    auto src = ImageSource::FromUri("ftp://host/os.img");
    ASSERT_FALSE(src.has_value());
    EXPECT_EQ(src.error(), "invalid URI reference ftp://host/os.img: unknown scheme ftp");
}

TEST(ImageSourceTest, RejectsInvalidReferences) {
    EXPECT_FALSE(ImageSource::FromUri("docker://Upper/Case").has_value());
    EXPECT_FALSE(ImageSource::FromUri("").has_value());
    EXPECT_FALSE(ImageSource::FromUri("os:bad tag").has_value());
    EXPECT_FALSE(ImageSource::FromUri("os@sha256:xyz").has_value());
}

TEST(ImageSourceTest, EmptySource) {
    ImageSource src;
    EXPECT_TRUE(src.IsEmpty());
    EXPECT_EQ(src.String(), "");
    EXPECT_EQ(src, ImageSource{});
    EXPECT_NE(ImageSource::FromDir("/a"), ImageSource::FromFile("/a"));
}

} // namespace
} // namespace elemental
