#include "ratio_normalizer.hpp"
#include "util.hpp"
#include <openssl/sha.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <stdexcept>
#include <vector>

PoolRatioConfig RatioNormalizer::normalize(const std::string& mint_a, const std::string& mint_b,
                                           uint64_t ratio_a, uint64_t ratio_b) const {
    if (mint_a.empty() || mint_b.empty()) {
        throw std::invalid_argument("Both token mints are required");
    }
    if (mint_a == mint_b) {
        throw std::invalid_argument("Token mints must differ");
    }

    spdlog::info("Normalizing pool config: first={}, second={}, ratio_a={}, ratio_b={}",
                 mint_a, mint_b, ratio_a, ratio_b);

    PoolRatioConfig config;
    if (mint_a.compare(mint_b) > 0) {
        spdlog::warn("Token order swap required, exchanging tokens and ratio sides");
        config.token_a_mint = mint_b;
        config.token_b_mint = mint_a;
        config.ratio_a_numerator = ratio_b;
        config.ratio_b_denominator = ratio_a;
        config.was_swapped = true;
    } else {
        config.token_a_mint = mint_a;
        config.token_b_mint = mint_b;
        config.ratio_a_numerator = ratio_a;
        config.ratio_b_denominator = ratio_b;
        config.was_swapped = false;
    }
    config.pool_id = derive_pool_id(config.token_a_mint, config.token_b_mint);

    if (config.was_swapped) {
        spdlog::info("After normalization: token_a={}, token_b={}, ratio={}:{}",
                     config.token_a_mint, config.token_b_mint,
                     config.ratio_a_numerator, config.ratio_b_denominator);
    }
    return config;
}

void RatioNormalizer::validate(const PoolRatioConfig& config, int token_a_decimals, int token_b_decimals) const {
    uint64_t expected_a = pow10(token_a_decimals);
    uint64_t expected_b = pow10(token_b_decimals);

    bool a_anchored = config.ratio_a_numerator == expected_a;
    bool b_anchored = config.ratio_b_denominator == expected_b;

    if (!a_anchored && !b_anchored) {
        auto msg = fmt::format("Invalid pool ratio: neither side is anchored to 1. "
                               "Expected A={} or B={}, got A={}, B={}",
                               expected_a, expected_b, config.ratio_a_numerator, config.ratio_b_denominator);
        spdlog::error(msg);
        throw std::invalid_argument(msg);
    }

    double rate = config.exchange_rate();
    spdlog::info("Pool ratio validated: 1 Token A = {:.6f} Token B", rate);

    if (rate > 1000000.0 || rate < 0.000001) {
        spdlog::warn("Extreme exchange rate detected: {:.6f}. Please verify this is intentional.", rate);
    }
}

std::string RatioNormalizer::exchange_rate_display(const PoolRatioConfig& config) const {
    return fmt::format("1 {} = {:.6f} {}", config.token_a_mint, config.exchange_rate(), config.token_b_mint);
}

std::string RatioNormalizer::derive_pool_id(const std::string& token_a, const std::string& token_b) {
    std::string combined = token_a + token_b;
    std::vector<uint8_t> digest(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(combined.data()), combined.size(), digest.data());
    return util::base58_encode(digest);
}

uint64_t RatioNormalizer::pow10(int decimals) {
    if (decimals < 0 || decimals > 19) {
        throw std::invalid_argument("Token decimals must be between 0 and 19, got " + std::to_string(decimals));
    }
    uint64_t value = 1;
    for (int i = 0; i < decimals; ++i) {
        value *= 10;
    }
    return value;
}
