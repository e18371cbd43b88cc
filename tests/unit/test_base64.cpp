#include <gtest/gtest.h>
#include "tether/crypto/base64.hpp"
#include "tether/crypto/random.hpp"
#include <string>

using namespace tether::crypto;

namespace {
    std::vector<std::uint8_t> bytes_of(const std::string& text) {
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }
}

TEST(Base64Test, KnownVectors) {
    EXPECT_EQ(Base64::encode(bytes_of("")), "");
    EXPECT_EQ(Base64::encode(bytes_of("f")), "Zg==");
    EXPECT_EQ(Base64::encode(bytes_of("fo")), "Zm8=");
    EXPECT_EQ(Base64::encode(bytes_of("foo")), "Zm9v");
    EXPECT_EQ(Base64::encode(bytes_of("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, StandardAlphabet) {
    std::vector<std::uint8_t> high = {0xfb, 0xff, 0xbf};
    EXPECT_EQ(Base64::encode(high), "+/+/");
}

TEST(Base64Test, Decode) {
    auto decoded = Base64::decode("Zm9vYmE=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes_of("fooba"));
    
    auto empty = Base64::decode("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(Base64Test, RejectsInvalidInput) {
    EXPECT_FALSE(Base64::decode("Zm9v!").has_value());
    EXPECT_FALSE(Base64::decode("Zm9").has_value());
    EXPECT_FALSE(Base64::decode("Zm9v-_").has_value());
}

TEST(Base64Test, EncodedLength) {
    EXPECT_EQ(Base64::encoded_length(0), 0u);
    EXPECT_EQ(Base64::encoded_length(1), 4u);
    EXPECT_EQ(Base64::encoded_length(65536), Base64::encode(std::vector<std::uint8_t>(65536)).size());
}

TEST(Base64Test, BinaryChunkSurvives) {
    ASSERT_TRUE(SecureRandom::initialize());
    
    std::vector<std::uint8_t> chunk(65536);
    for (std::size_t i = 0; i < chunk.size(); ++i) {
        chunk[i] = static_cast<std::uint8_t>(SecureRandom::generate_uniform(256));
    }
    
    auto decoded = Base64::decode(Base64::encode(chunk));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, chunk);
}

TEST(SecureRandomTest, IdentifierAlphabets) {
    auto hex = SecureRandom::generate_hex(4);
    EXPECT_EQ(hex.size(), 8u);
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
    
    auto base36 = SecureRandom::generate_base36(9);
    EXPECT_EQ(base36.size(), 9u);
    EXPECT_EQ(base36.find_first_not_of("0123456789abcdefghijklmnopqrstuvwxyz"), std::string::npos);
    
    auto text = SecureRandom::generate_alphanumeric(100000);
    EXPECT_EQ(text.size(), 100000u);
    EXPECT_EQ(text.find_first_not_of(
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz"), std::string::npos);
}
