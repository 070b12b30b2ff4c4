#include <gtest/gtest.h>

#include <cstring>
#include <shared/Sha256.hpp>
#include <string_view>

#include "TestHelpers.hpp"

using FileTransfer::Sha256;

namespace {

std::string hexOf(std::string_view text) {
    const auto digest = Sha256::compute(
        reinterpret_cast<const uint8_t*>(text.data()), text.size());
    EXPECT_TRUE(digest.has_value());
    return digest ? Sha256::toHex(*digest) : std::string();
}

}  // namespace

TEST(Sha256Test, KnownVectors) {
    EXPECT_EQ(hexOf(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(hexOf("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, IncrementalMatchesOneShot) {
    const auto data = makeBytes(100000);
    Sha256 hasher;
    std::size_t offset = 0;
    for (const std::size_t step : {1, 63, 64, 4096, 12345}) {
        ASSERT_TRUE(hasher.update(data.data() + offset, step));
        offset += step;
    }
    ASSERT_TRUE(hasher.update(data.data() + offset, data.size() - offset));
    EXPECT_EQ(hasher.bytesHashed(), data.size());

    const auto digest = hasher.hexDigest();
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(*digest, sha256Hex(data));
    EXPECT_EQ(digest->size(), 64);
}

TEST(Sha256Test, UnusableAfterFinalize) {
    Sha256 hasher;
    ASSERT_TRUE(hasher.finalize().has_value());
    const uint8_t byte = 1;
    EXPECT_FALSE(hasher.update(&byte, 1));
    EXPECT_FALSE(hasher.finalize().has_value());
}
