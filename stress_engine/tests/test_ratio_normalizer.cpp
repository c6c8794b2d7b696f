#include "ratio_normalizer.hpp"
#include <gtest/gtest.h>

namespace {

const std::string kSmallMint = "AAAA1111111111111111111111111111";
const std::string kLargeMint = "ZZZZ1111111111111111111111111111";

} // namespace

TEST(RatioNormalizerTest, KeepsCanonicalOrder) {
    RatioNormalizer normalizer;
    auto config = normalizer.normalize(kSmallMint, kLargeMint, 1000000000ULL, 5000000ULL);

    EXPECT_FALSE(config.was_swapped);
    EXPECT_EQ(config.token_a_mint, kSmallMint);
    EXPECT_EQ(config.token_b_mint, kLargeMint);
    EXPECT_EQ(config.ratio_a_numerator, 1000000000ULL);
    EXPECT_EQ(config.ratio_b_denominator, 5000000ULL);
}

TEST(RatioNormalizerTest, SwapsMintsAndRatioTogether) {
    RatioNormalizer normalizer;
    auto config = normalizer.normalize(kLargeMint, kSmallMint, 1000000000ULL, 5000000ULL);

    EXPECT_TRUE(config.was_swapped);
    EXPECT_EQ(config.token_a_mint, kSmallMint);
    EXPECT_EQ(config.token_b_mint, kLargeMint);
    EXPECT_EQ(config.ratio_a_numerator, 5000000ULL);
    EXPECT_EQ(config.ratio_b_denominator, 1000000000ULL);

    // Each mint keeps its own amount, so the price between them is unchanged
    double input_rate = 5000000.0 / 1000000000.0;
    EXPECT_DOUBLE_EQ(1.0 / config.exchange_rate(), input_rate);
}

TEST(RatioNormalizerTest, NormalizeIsFixedPoint) {
    RatioNormalizer normalizer;
    auto once = normalizer.normalize(kLargeMint, kSmallMint, 1000000000ULL, 5000000ULL);
    auto twice = normalizer.normalize(once.token_a_mint, once.token_b_mint,
                                      once.ratio_a_numerator, once.ratio_b_denominator);

    EXPECT_EQ(twice, once);
    EXPECT_FALSE(twice.was_swapped);

    auto canonical = normalizer.normalize(kSmallMint, kLargeMint, 3, 7);
    EXPECT_EQ(normalizer.normalize(canonical.token_a_mint, canonical.token_b_mint,
                                   canonical.ratio_a_numerator, canonical.ratio_b_denominator),
              canonical);
}

TEST(RatioNormalizerTest, PoolIdIgnoresInputOrder) {
    RatioNormalizer normalizer;
    auto forward = normalizer.normalize(kSmallMint, kLargeMint, 1, 2);
    auto reversed = normalizer.normalize(kLargeMint, kSmallMint, 2, 1);

    EXPECT_EQ(forward.pool_id, reversed.pool_id);
    EXPECT_EQ(forward.pool_id, RatioNormalizer::derive_pool_id(kSmallMint, kLargeMint));
    EXPECT_DOUBLE_EQ(forward.exchange_rate(), reversed.exchange_rate());
}

TEST(RatioNormalizerTest, RejectsIdenticalOrEmptyMints) {
    RatioNormalizer normalizer;
    EXPECT_THROW(normalizer.normalize(kSmallMint, kSmallMint, 1, 1), std::invalid_argument);
    EXPECT_THROW(normalizer.normalize("", kSmallMint, 1, 1), std::invalid_argument);
}

TEST(RatioNormalizerTest, ValidateRequiresOneAnchoredSide) {
    RatioNormalizer normalizer;

    PoolRatioConfig anchored_a;
    anchored_a.ratio_a_numerator = 1000000000ULL;
    anchored_a.ratio_b_denominator = 7123456ULL;
    EXPECT_NO_THROW(normalizer.validate(anchored_a, 9, 6));

    PoolRatioConfig anchored_b;
    anchored_b.ratio_a_numerator = 3000000000ULL;
    anchored_b.ratio_b_denominator = 1000000ULL;
    EXPECT_NO_THROW(normalizer.validate(anchored_b, 9, 6));

    PoolRatioConfig neither;
    neither.ratio_a_numerator = 2000000000ULL;
    neither.ratio_b_denominator = 3000000ULL;
    EXPECT_THROW(normalizer.validate(neither, 9, 6), std::invalid_argument);
}

TEST(RatioNormalizerTest, Pow10RejectsOutOfRangeDecimals) {
    EXPECT_EQ(RatioNormalizer::pow10(0), 1u);
    EXPECT_EQ(RatioNormalizer::pow10(9), 1000000000ULL);
    EXPECT_THROW(RatioNormalizer::pow10(-1), std::invalid_argument);
    EXPECT_THROW(RatioNormalizer::pow10(20), std::invalid_argument);
}
