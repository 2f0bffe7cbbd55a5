#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <string>

namespace elemental {
namespace {

constexpr const char* kAbcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

std::span<const std::uint8_t> Bytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

TEST(Sha256Test, KnownVector) {
    EXPECT_EQ(Sha256Hex(Bytes("abc")), kAbcDigest);
}

TEST(Sha256Test, IncrementalMatchesOneShot) {
    Sha256Hasher hasher;
    hasher.Update(Bytes("a"));
    hasher.Update(Bytes("bc"));
    EXPECT_EQ(hasher.FinalHex(), kAbcDigest);
}

TEST(Sha256Test, HashesFiles) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/config.json";
    testutil::WriteHostFile(path, "abc");

    std::string hex;
    auto r = Sha256HexFile(path, hex);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(hex, kAbcDigest);
}

TEST(Sha256Test, MissingFileFails) {
    std::string hex;
    EXPECT_FALSE(Sha256HexFile("/nonexistent/elemental/blob", hex).is_ok());
}

} // namespace
} // namespace elemental
