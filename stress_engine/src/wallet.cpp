#include "wallet.hpp"
#include "util.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <memory>
#include <stdexcept>

namespace {

constexpr size_t kSeedSize = 32;
constexpr size_t kPublicKeySize = 32;

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

} // namespace

WalletCredential Wallet::generate() {
    std::vector<uint8_t> seed(kSeedSize);
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
        throw std::runtime_error("Failed to generate wallet seed: " + openssl_error());
    }
    return from_seed(seed);
}

WalletCredential Wallet::restore(const std::string& secret_key) {
    std::vector<uint8_t> raw = util::base58_decode(secret_key);
    if (raw.size() != kSeedSize + kPublicKeySize && raw.size() != kSeedSize) {
        throw std::invalid_argument("Secret key must decode to 32 or 64 bytes, got " + std::to_string(raw.size()));
    }
    std::vector<uint8_t> seed(raw.begin(), raw.begin() + kSeedSize);
    WalletCredential credential = from_seed(seed);

    if (raw.size() == kSeedSize + kPublicKeySize) {
        std::vector<uint8_t> embedded(raw.begin() + kSeedSize, raw.end());
        if (util::base58_encode(embedded) != credential.public_key) {
            throw std::invalid_argument("Secret key does not match its embedded public key");
        }
    }
    return credential;
}

bool Wallet::verify(const WalletCredential& credential) {
    if (credential.empty()) {
        return false;
    }
    try {
        return restore(credential.secret_key).public_key == credential.public_key;
    } catch (const std::exception&) {
        return false;
    }
}

WalletCredential Wallet::from_seed(const std::vector<uint8_t>& seed) {
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey(
        EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()),
        &EVP_PKEY_free);
    if (!pkey) {
        throw std::runtime_error("Failed to build Ed25519 key: " + openssl_error());
    }

    std::vector<uint8_t> public_key(kPublicKeySize);
    size_t len = public_key.size();
    if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.data(), &len) != 1 || len != kPublicKeySize) {
        throw std::runtime_error("Failed to derive Ed25519 public key: " + openssl_error());
    }

    std::vector<uint8_t> secret(seed);
    secret.insert(secret.end(), public_key.begin(), public_key.end());

    WalletCredential credential;
    credential.public_key = util::base58_encode(public_key);
    credential.secret_key = util::base58_encode(secret);
    return credential;
}
