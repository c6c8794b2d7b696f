#pragma once
#include "types.hpp"
#include <string>
#include <cstdint>

// Canonical pool ordering: the byte-wise smaller mint is always token A.
// When the caller's order is reversed, the ratio sides are exchanged with it
// so the exchange rate is preserved.
class RatioNormalizer {
public:
    PoolRatioConfig normalize(const std::string& mint_a, const std::string& mint_b,
                              uint64_t ratio_a, uint64_t ratio_b) const;

    // Throws std::invalid_argument unless one side equals exactly 10^decimals
    void validate(const PoolRatioConfig& config, int token_a_decimals, int token_b_decimals) const;

    std::string exchange_rate_display(const PoolRatioConfig& config) const;

    // SHA-256 of the ordered pair, base58 encoded
    static std::string derive_pool_id(const std::string& token_a, const std::string& token_b);

    static uint64_t pow10(int decimals);
};
