#include "util.hpp"
#include <gtest/gtest.h>
#include <cctype>

TEST(Base58Test, EncodesKnownVector) {
    std::string text = "Hello World!";
    std::vector<uint8_t> bytes(text.begin(), text.end());
    EXPECT_EQ(util::base58_encode(bytes), "2NEpo7TZRRrLZSi2U");
}

TEST(Base58Test, LeadingZeroBytesBecomeOnes) {
    EXPECT_EQ(util::base58_encode({0, 0, 1}), "112");
    EXPECT_EQ(util::base58_encode(std::vector<uint8_t>(32, 0)), std::string(32, '1'));
}

TEST(Base58Test, DecodeInvertsEncode) {
    std::vector<uint8_t> key(32);
    for (size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<uint8_t>(i * 7 + 3);
    }
    key[0] = 0;
    EXPECT_EQ(util::base58_decode(util::base58_encode(key)), key);
}

TEST(Base58Test, RejectsInvalidCharacters) {
    EXPECT_THROW(util::base58_decode("0OIl"), std::invalid_argument);
}

TEST(VersionTest, ComparesNumerically) {
    EXPECT_GT(util::compare_versions("0.16.0", "0.15.9"), 0);
    EXPECT_LT(util::compare_versions("0.9.1", "0.10.0"), 0);
    EXPECT_EQ(util::compare_versions("0.16", "0.16.0"), 0);
}

TEST(TimeTest, TimestampRoundTripKeepsMilliseconds) {
    auto now = std::chrono::system_clock::now();
    auto parsed = util::parse_iso8601(util::format_timestamp(now));
    auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(now - parsed).count();
    EXPECT_GE(diff, 0);
    EXPECT_LT(diff, 1);
}

TEST(RandomTest, HexHasRequestedLength) {
    auto hex = util::random_hex(32);
    ASSERT_EQ(hex.size(), 32u);
    for (char c : hex) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)));
    }
}

TEST(RandomTest, BetweenStaysInRange) {
    for (int i = 0; i < 200; ++i) {
        auto v = util::random_between(10, 20);
        EXPECT_GE(v, 10u);
        EXPECT_LE(v, 20u);
    }
    EXPECT_EQ(util::random_between(5, 5), 5u);
}
