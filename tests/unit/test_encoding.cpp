#include <gtest/gtest.h>
#include "beamdrop/crypto/encoding.hpp"
#include "beamdrop/crypto/random.hpp"
#include <algorithm>
#include <set>

using namespace beamdrop::crypto;

class EncodingTest : public ::testing::Test {
protected:
    static std::vector<std::uint8_t> bytes_of(const std::string& text) {
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }
};

TEST_F(EncodingTest, KnownVectors) {
    EXPECT_EQ(base64_encode(bytes_of("")), "");
    EXPECT_EQ(base64_encode(bytes_of("f")), "Zg==");
    EXPECT_EQ(base64_encode(bytes_of("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(bytes_of("foo")), "Zm9v");
    EXPECT_EQ(base64_encode(bytes_of("foobar")), "Zm9vYmFy");
}

TEST_F(EncodingTest, BinaryRoundTrip) {
    std::vector<std::uint8_t> data(256);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>(i);
    }

    auto decoded = base64_decode(base64_encode(data));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

TEST_F(EncodingTest, DecodeEmpty) {
    auto decoded = base64_decode("");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST_F(EncodingTest, RejectsInvalidInput) {
    EXPECT_FALSE(base64_decode("not base64!").has_value());
    EXPECT_FALSE(base64_decode("Zm9v$").has_value());
}

class SecureRandomTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecureRandom::initialize());
    }
};

TEST_F(SecureRandomTest, TokenAlphabetAndLength) {
    auto token = SecureRandom::generate_token();
    EXPECT_EQ(token.size(), 9);
    EXPECT_TRUE(std::all_of(token.begin(), token.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z');
    }));

    EXPECT_EQ(SecureRandom::generate_token(16).size(), 16);
}

TEST_F(SecureRandomTest, TokensAreDistinct) {
    std::set<std::string> tokens;
    for (int i = 0; i < 100; ++i) {
        tokens.insert(SecureRandom::generate_token());
    }
    EXPECT_EQ(tokens.size(), 100);
}

TEST_F(SecureRandomTest, PeerIdIsUuidV4) {
    auto id = SecureRandom::generate_peer_id();
    ASSERT_EQ(id.size(), 36);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_EQ(id[18], '-');
    EXPECT_TRUE(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
    EXPECT_EQ(id[23], '-');
}

TEST_F(SecureRandomTest, UniformStaysInRange) {
    for (int i = 0; i < 1000; ++i) {
        EXPECT_LT(SecureRandom::generate_uniform(36), 36u);
    }
}
