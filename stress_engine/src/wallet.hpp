#pragma once
#include "types.hpp"
#include <string>
#include <vector>
#include <cstdint>

// Ed25519 keypairs in the Solana layout: 64-byte secret (seed + public key), base58 encoded
class Wallet {
public:
    static WalletCredential generate();

    // Rebuilds the credential from its base58 secret key; throws std::invalid_argument when malformed
    static WalletCredential restore(const std::string& secret_key);

    // True when the public key is the one derived from the secret key
    static bool verify(const WalletCredential& credential);

private:
    static WalletCredential from_seed(const std::vector<uint8_t>& seed);
};
