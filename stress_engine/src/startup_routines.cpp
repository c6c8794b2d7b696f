#include "startup_routines.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

ContractVersionStartup::ContractVersionStartup(ChainClient& chain, std::string min_version, std::string max_version)
    : chain_(chain), min_version_(std::move(min_version)), max_version_(std::move(max_version)) {}

void ContractVersionStartup::start() {
    spdlog::info("Validating contract version...");
    validated_ = false;

    std::string deployed;
    try {
        deployed = chain_.get_contract_version();
    } catch (const std::exception& e) {
        spdlog::critical("Could not retrieve contract version: {}", e.what());
        throw std::runtime_error("Cannot retrieve contract version - engine cannot start safely");
    }

    if (util::compare_versions(deployed, min_version_) < 0) {
        spdlog::critical("Contract version {} is older than the minimum supported {}", deployed, min_version_);
        throw std::runtime_error("Contract version " + deployed + " is below " + min_version_);
    }
    if (util::compare_versions(deployed, max_version_) > 0) {
        spdlog::critical("Contract version {} is newer than the maximum supported {}", deployed, max_version_);
        throw std::runtime_error("Contract version " + deployed + " is above " + max_version_);
    }

    validated_ = true;
    spdlog::info("Contract version {} accepted (supported {} - {})", deployed, min_version_, max_version_);
}

StateStoreStartup::StateStoreStartup(StateStore& store) : store_(store) {}

void StateStoreStartup::start() {
    if (!store_.is_healthy()) {
        throw std::runtime_error("State store is not available");
    }
}

bool StateStoreStartup::is_healthy() const {
    return store_.is_healthy();
}

CoreWalletStartup::CoreWalletStartup(ChainClient& chain, StateStore& store, WorkerPool& workers,
                                     uint64_t minimum_balance, uint64_t airdrop_amount)
    : chain_(chain),
      store_(store),
      workers_(workers),
      minimum_balance_(minimum_balance),
      airdrop_amount_(airdrop_amount) {}

void CoreWalletStartup::start() {
    loaded_ = false;

    CoreWallet wallet;
    if (auto existing = store_.load_core_wallet()) {
        wallet = *existing;
        WalletCredential restored = chain_.restore_wallet(wallet.credential.secret_key);
        if (restored.public_key != wallet.credential.public_key) {
            throw std::runtime_error("Stored core wallet is corrupt: public key mismatch");
        }
        spdlog::info("Loaded existing core wallet: {}", wallet.credential.public_key);
    } else {
        wallet.credential = chain_.generate_wallet();
        wallet.created_at = std::chrono::system_clock::now();
        store_.save_core_wallet(wallet);
        spdlog::info("Created new core wallet: {}", wallet.credential.public_key);
    }

    try {
        uint64_t balance = chain_.get_native_balance(wallet.credential.public_key);
        if (balance < minimum_balance_) {
            spdlog::warn("Core wallet balance is low: {} lamports (minimum {}), requesting airdrop",
                         balance, minimum_balance_);
            chain_.request_airdrop(wallet.credential.public_key, airdrop_amount_);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Could not top up core wallet: {}", e.what());
    }

    workers_.set_core_wallet(wallet.credential);
    loaded_ = true;
}

PoolRegistryStartup::PoolRegistryStartup(PoolManager& pools) : pools_(pools) {}

void PoolRegistryStartup::start() {
    try {
        size_t count = pools_.load_and_validate();
        if (count == 0) {
            spdlog::debug("No existing pools found - use create_pool to create pools on demand");
        }
    } catch (const std::exception& e) {
        spdlog::error("Pool registry startup failed: {}", e.what());
        spdlog::warn("Engine will continue but pool operations may not work correctly");
    }
}

AuditLogStartup::AuditLogStartup(AuditLogger& audit) : audit_(audit) {}

void AuditLogStartup::start() {
    if (!audit_.check_health()) {
        spdlog::warn("Audit trail is not reachable; events will be dropped until it recovers");
    }
}

bool AuditLogStartup::is_healthy() const {
    return audit_.check_health();
}
