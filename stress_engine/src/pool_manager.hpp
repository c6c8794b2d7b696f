#pragma once
#include "types.hpp"
#include "chain_client.hpp"
#include "state_store.hpp"
#include "worker_pool.hpp"
#include "ratio_normalizer.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct PoolCreationParams {
    int token_a_decimals = 9;
    int token_b_decimals = 9;
    uint64_t ratio_whole_number = 1000;
    // "a_to_b": 1 A = N B (A anchored). "b_to_a": 1 B = N A (B anchored).
    std::string ratio_direction = "a_to_b";

    static PoolCreationParams from_json(const nlohmann::json& j);
};

// Registry of pools this service created, backed by the state store
class PoolManager {
public:
    PoolManager(ChainClient& chain, StateStore& store, WorkerPool& workers);

    // Creates two fresh mints, normalizes and validates the ratio, creates the pool on chain
    PoolRegistryEntry create_pool(const PoolCreationParams& params);

    // Loads the persisted registry and drops pools the chain no longer knows; returns pools kept
    size_t load_and_validate();

    std::vector<PoolRegistryEntry> list_pools() const;
    std::optional<PoolRegistryEntry> find_pool(const std::string& pool_id) const;

    const RatioNormalizer& normalizer() const { return normalizer_; }

private:
    void ensure_core_funds(const WalletCredential& core);

    ChainClient& chain_;
    StateStore& store_;
    WorkerPool& workers_;
    RatioNormalizer normalizer_;

    mutable std::mutex mutex_;
    std::map<std::string, PoolRegistryEntry> pools_;
};
