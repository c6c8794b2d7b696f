#include "pool_manager.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <limits>
#include <stdexcept>

namespace {

constexpr uint64_t kPoolCreationLamports = 2 * kLamportsPerSol;
constexpr uint64_t kPoolCreationAirdrop = 10 * kLamportsPerSol;

uint64_t checked_multiply(uint64_t a, uint64_t b) {
    if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
        throw std::invalid_argument("Pool ratio overflows 64 bits");
    }
    return a * b;
}

} // namespace

PoolCreationParams PoolCreationParams::from_json(const nlohmann::json& j) {
    PoolCreationParams params;
    params.token_a_decimals = j.value("token_a_decimals", 9);
    params.token_b_decimals = j.value("token_b_decimals", 9);
    params.ratio_whole_number = j.value("ratio_whole_number", uint64_t{1000});
    params.ratio_direction = util::to_lower(j.value("ratio_direction", std::string("a_to_b")));
    return params;
}

PoolManager::PoolManager(ChainClient& chain, StateStore& store, WorkerPool& workers)
    : chain_(chain), store_(store), workers_(workers) {}

PoolRegistryEntry PoolManager::create_pool(const PoolCreationParams& params) {
    if (params.ratio_whole_number == 0) {
        throw std::invalid_argument("ratio_whole_number must be positive");
    }
    if (params.ratio_direction != "a_to_b" && params.ratio_direction != "b_to_a") {
        throw std::invalid_argument("ratio_direction must be 'a_to_b' or 'b_to_a'");
    }

    uint64_t unit_first = RatioNormalizer::pow10(params.token_a_decimals);
    uint64_t unit_second = RatioNormalizer::pow10(params.token_b_decimals);

    uint64_t ratio_first;
    uint64_t ratio_second;
    if (params.ratio_direction == "a_to_b") {
        ratio_first = unit_first;
        ratio_second = checked_multiply(params.ratio_whole_number, unit_second);
    } else {
        ratio_first = checked_multiply(params.ratio_whole_number, unit_first);
        ratio_second = unit_second;
    }

    WalletCredential core = workers_.core_wallet();
    if (core.empty()) {
        throw std::runtime_error("Core wallet is not initialized");
    }
    ensure_core_funds(core);

    std::string first_mint = chain_.create_token_mint(core, params.token_a_decimals);
    std::string second_mint = chain_.create_token_mint(core, params.token_b_decimals);

    PoolRatioConfig ratio = normalizer_.normalize(first_mint, second_mint, ratio_first, ratio_second);
    int decimals_a = ratio.was_swapped ? params.token_b_decimals : params.token_a_decimals;
    int decimals_b = ratio.was_swapped ? params.token_a_decimals : params.token_b_decimals;
    normalizer_.validate(ratio, decimals_a, decimals_b);

    uint32_t units = workers_.budgeter().get_budget("process_pool_initialize");
    PoolState state = chain_.create_pool(core, ratio, decimals_a, decimals_b, units);
    if (state.pool_id != ratio.pool_id) {
        spdlog::warn("Chain returned pool id {} but normalized id is {}", state.pool_id, ratio.pool_id);
        ratio.pool_id = state.pool_id;
    }

    PoolRegistryEntry entry;
    entry.pool_id = state.pool_id;
    entry.ratio = ratio;
    entry.token_a_decimals = decimals_a;
    entry.token_b_decimals = decimals_b;
    entry.created_at = std::chrono::system_clock::now();

    store_.save_pool(entry);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pools_[entry.pool_id] = entry;
    }

    spdlog::info("Created pool {}: {}", entry.pool_id, normalizer_.exchange_rate_display(ratio));
    return entry;
}

size_t PoolManager::load_and_validate() {
    auto saved = store_.load_pools();
    std::map<std::string, PoolRegistryEntry> valid;

    for (const auto& entry : saved) {
        try {
            PoolState state = chain_.get_pool_state(entry.pool_id);
            if (state.token_a_mint != entry.ratio.token_a_mint || state.token_b_mint != entry.ratio.token_b_mint) {
                spdlog::warn("Saved pool {} does not match on-chain mints, removing", entry.pool_id);
                store_.delete_pool(entry.pool_id);
                continue;
            }
            valid[entry.pool_id] = entry;
        } catch (const AccountNotFoundError& e) {
            spdlog::warn("Saved pool {} not found on chain, removing: {}", entry.pool_id, e.what());
            store_.delete_pool(entry.pool_id);
        } catch (const ChainError& e) {
            spdlog::warn("Could not verify saved pool {}, keeping it: {}", entry.pool_id, e.what());
            valid[entry.pool_id] = entry;
        }
    }

    size_t count = valid.size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pools_ = std::move(valid);
    }
    spdlog::info("Pool registry loaded: {} valid pools ({} saved)", count, saved.size());
    return count;
}

std::vector<PoolRegistryEntry> PoolManager::list_pools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PoolRegistryEntry> pools;
    for (const auto& entry : pools_) {
        pools.push_back(entry.second);
    }
    return pools;
}

std::optional<PoolRegistryEntry> PoolManager::find_pool(const std::string& pool_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(pool_id);
    if (it == pools_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PoolManager::ensure_core_funds(const WalletCredential& core) {
    uint64_t balance = chain_.get_native_balance(core.public_key);
    if (balance >= kPoolCreationLamports) {
        return;
    }
    spdlog::info("Core wallet balance {} lamports is low, requesting airdrop for pool creation", balance);
    chain_.request_airdrop(core.public_key, kPoolCreationAirdrop);
}
