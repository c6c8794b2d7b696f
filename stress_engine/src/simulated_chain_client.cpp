#include "simulated_chain_client.hpp"
#include "contract_errors.hpp"
#include "ratio_normalizer.hpp"
#include "wallet.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <vector>

SimulatedChainClient::SimulatedChainClient() : SimulatedChainClient(Options{}) {}

SimulatedChainClient::SimulatedChainClient(Options options) : options_(std::move(options)) {}

WalletCredential SimulatedChainClient::generate_wallet() {
    return Wallet::generate();
}

WalletCredential SimulatedChainClient::restore_wallet(const std::string& secret_key) {
    try {
        return Wallet::restore(secret_key);
    } catch (const std::invalid_argument& e) {
        throw ChainError(std::string("Invalid wallet secret key: ") + e.what());
    }
}

uint64_t SimulatedChainClient::get_native_balance(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("get_native_balance");
    auto it = native_balances_.find(owner);
    return it == native_balances_.end() ? 0 : it->second;
}

uint64_t SimulatedChainClient::get_token_balance(const std::string& owner, const std::string& mint) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("get_token_balance");
    auto it = token_balances_.find({owner, mint});
    return it == token_balances_.end() ? 0 : it->second;
}

OperationResult SimulatedChainClient::deposit(const WalletCredential& wallet, const std::string& pool_id,
                                              TokenSide side, uint64_t amount, uint32_t compute_units) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("deposit");

    if (system_paused_) throw contract_failure(contract_error::SystemPaused);
    PoolRecord& pool = find_pool(pool_id);
    if (pool.state.pool_paused) throw contract_failure(contract_error::PoolPaused);
    if (amount == 0) throw contract_failure(contract_error::InvalidAmount);

    uint64_t& balance = token_account(wallet.public_key, pool.state.token_mint(side));
    if (balance < amount) throw contract_failure(contract_error::InsufficientFunds);

    charge_fee(wallet.public_key);
    balance -= amount;
    pool.reserve(side) += amount;
    token_account(wallet.public_key, pool.state.lp_mint(side)) += amount;
    mints_[pool.state.lp_mint(side)].supply += amount;

    OperationResult result;
    result.signature = new_signature();
    result.input_amount = amount;
    result.output_amount = amount;
    result.network_fee = options_.network_fee;
    spdlog::debug("[sim] deposit {} side {} into {} ({} CUs)", amount, to_string(side), pool_id, compute_units);
    return result;
}

OperationResult SimulatedChainClient::withdraw(const WalletCredential& wallet, const std::string& pool_id,
                                               TokenSide side, uint64_t lp_amount, uint32_t compute_units) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("withdraw");

    if (system_paused_) throw contract_failure(contract_error::SystemPaused);
    PoolRecord& pool = find_pool(pool_id);
    if (pool.state.pool_paused) throw contract_failure(contract_error::PoolPaused);
    if (lp_amount == 0) throw contract_failure(contract_error::InvalidAmount);

    uint64_t& lp_balance = token_account(wallet.public_key, pool.state.lp_mint(side));
    if (lp_balance < lp_amount) throw contract_failure(contract_error::InsufficientLpTokens);
    if (pool.reserve(side) < lp_amount) throw contract_failure(contract_error::InsufficientLiquidity);

    charge_fee(wallet.public_key);
    lp_balance -= lp_amount;
    mints_[pool.state.lp_mint(side)].supply -= lp_amount;
    pool.reserve(side) -= lp_amount;
    token_account(wallet.public_key, pool.state.token_mint(side)) += lp_amount;

    OperationResult result;
    result.signature = new_signature();
    result.input_amount = lp_amount;
    result.output_amount = lp_amount;
    result.network_fee = options_.network_fee;
    spdlog::debug("[sim] withdraw {} LP side {} from {} ({} CUs)", lp_amount, to_string(side), pool_id, compute_units);
    return result;
}

OperationResult SimulatedChainClient::swap(const WalletCredential& wallet, const std::string& pool_id,
                                           SwapDirection direction, uint64_t amount, uint64_t minimum_output,
                                           uint32_t compute_units) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("swap");

    if (system_paused_) throw contract_failure(contract_error::SystemPaused);
    PoolRecord& pool = find_pool(pool_id);
    if (pool.state.pool_paused) throw contract_failure(contract_error::PoolPaused);
    if (pool.state.swaps_paused) throw contract_failure(contract_error::PoolSwapsPaused);
    if (amount == 0) throw contract_failure(contract_error::InvalidInputAmount);

    TokenSide in_side = direction == SwapDirection::AToB ? TokenSide::A : TokenSide::B;
    TokenSide out_side = direction == SwapDirection::AToB ? TokenSide::B : TokenSide::A;

    uint64_t& in_balance = token_account(wallet.public_key, pool.state.token_mint(in_side));
    if (in_balance < amount) throw contract_failure(contract_error::InsufficientFunds);

    uint64_t output = pool.state.swap_output(direction, amount);
    if (output == 0) throw contract_failure(contract_error::SwapAmountTooSmall);
    if (pool.reserve(out_side) < output) throw contract_failure(contract_error::InsufficientLiquidity);
    if (output < minimum_output) throw contract_failure(contract_error::SlippageExceeded);

    charge_fee(wallet.public_key);
    in_balance -= amount;
    pool.reserve(in_side) += amount;
    pool.reserve(out_side) -= output;
    token_account(wallet.public_key, pool.state.token_mint(out_side)) += output;

    OperationResult result;
    result.signature = new_signature();
    result.input_amount = amount;
    result.output_amount = output;
    result.network_fee = options_.network_fee;
    spdlog::debug("[sim] swap {} {} -> {} on {} ({} CUs)", amount, to_string(direction), output, pool_id, compute_units);
    return result;
}

std::string SimulatedChainClient::mint_tokens(const WalletCredential& authority, const std::string& mint,
                                              const std::string& destination_owner, uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("mint_tokens");

    auto it = mints_.find(mint);
    if (it == mints_.end()) {
        throw ChainError("Mint account not found: " + mint);
    }
    if (it->second.authority != authority.public_key) {
        throw contract_failure(contract_error::InvalidMintAuthority);
    }

    charge_fee(authority.public_key);
    it->second.supply += amount;
    token_account(destination_owner, mint) += amount;
    return new_signature();
}

std::string SimulatedChainClient::transfer_tokens(const WalletCredential& from, const std::string& destination_owner,
                                                  const std::string& mint, uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("transfer_tokens");

    uint64_t& source = token_account(from.public_key, mint);
    if (source < amount) throw contract_failure(contract_error::InsufficientFunds);

    charge_fee(from.public_key);
    source -= amount;
    token_account(destination_owner, mint) += amount;
    return new_signature();
}

std::string SimulatedChainClient::transfer_native(const WalletCredential& from, const std::string& destination,
                                                  uint64_t lamports) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("transfer_native");

    uint64_t& source = native_balances_[from.public_key];
    if (source < lamports + options_.network_fee) {
        throw ChainError("Transaction simulation failed: insufficient lamports " +
                         std::to_string(source) + ", need " + std::to_string(lamports + options_.network_fee));
    }
    source -= lamports + options_.network_fee;
    native_balances_[destination] += lamports;
    return new_signature();
}

std::string SimulatedChainClient::request_airdrop(const std::string& owner, uint64_t lamports) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("request_airdrop");
    native_balances_[owner] += lamports;
    return new_signature();
}

bool SimulatedChainClient::is_system_paused() {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("is_system_paused");
    return system_paused_;
}

bool SimulatedChainClient::is_pool_paused(const std::string& pool_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("is_pool_paused");
    return find_pool(pool_id).state.pool_paused;
}

bool SimulatedChainClient::are_swaps_paused(const std::string& pool_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("are_swaps_paused");
    return find_pool(pool_id).state.swaps_paused;
}

PoolState SimulatedChainClient::get_pool_state(const std::string& pool_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("get_pool_state");
    return find_pool(pool_id).state;
}

std::string SimulatedChainClient::submit_transaction(const std::string& serialized_transaction) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("submit_transaction");
    if (serialized_transaction.empty()) {
        throw ChainError("Transaction payload is empty");
    }
    return new_signature();
}

bool SimulatedChainClient::confirm_transaction(const std::string& signature, std::chrono::milliseconds /*timeout*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("confirm_transaction");
    return signatures_.count(signature) > 0;
}

std::string SimulatedChainClient::create_token_mint(const WalletCredential& authority, int decimals) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("create_token_mint");

    if (decimals < 0 || decimals > 19) throw contract_failure(contract_error::InvalidTokenDecimals);

    charge_fee(authority.public_key);
    std::string mint = Wallet::generate().public_key;
    MintInfo info;
    info.authority = authority.public_key;
    info.decimals = decimals;
    mints_[mint] = info;
    spdlog::debug("[sim] created mint {} with {} decimals", mint, decimals);
    return mint;
}

PoolState SimulatedChainClient::create_pool(const WalletCredential& payer, const PoolRatioConfig& ratio,
                                            int token_a_decimals, int token_b_decimals, uint32_t compute_units) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("create_pool");

    if (system_paused_) throw contract_failure(contract_error::SystemPaused);
    if (ratio.token_a_mint.compare(ratio.token_b_mint) >= 0) throw contract_failure(contract_error::InvalidTokenMints);

    auto mint_a = mints_.find(ratio.token_a_mint);
    auto mint_b = mints_.find(ratio.token_b_mint);
    if (mint_a == mints_.end() || mint_b == mints_.end()) throw contract_failure(contract_error::InvalidTokenMints);
    if (mint_a->second.decimals != token_a_decimals || mint_b->second.decimals != token_b_decimals) {
        throw contract_failure(contract_error::InvalidTokenDecimals);
    }

    bool a_anchored = ratio.ratio_a_numerator == RatioNormalizer::pow10(token_a_decimals);
    bool b_anchored = ratio.ratio_b_denominator == RatioNormalizer::pow10(token_b_decimals);
    if (!a_anchored && !b_anchored) throw contract_failure(contract_error::InvalidRatio);

    std::string pool_id = RatioNormalizer::derive_pool_id(ratio.token_a_mint, ratio.token_b_mint);
    if (pools_.count(pool_id) > 0) throw contract_failure(contract_error::PoolAlreadyExists);

    charge_fee(payer.public_key);

    PoolRecord record;
    record.state.pool_id = pool_id;
    record.state.token_a_mint = ratio.token_a_mint;
    record.state.token_b_mint = ratio.token_b_mint;
    record.state.token_a_decimals = token_a_decimals;
    record.state.token_b_decimals = token_b_decimals;
    record.state.ratio_a_numerator = ratio.ratio_a_numerator;
    record.state.ratio_b_denominator = ratio.ratio_b_denominator;
    record.state.lp_mint_a = Wallet::generate().public_key;
    record.state.lp_mint_b = Wallet::generate().public_key;
    record.state.created_at = std::chrono::system_clock::now();

    MintInfo lp_a;
    lp_a.authority = pool_id;
    lp_a.decimals = token_a_decimals;
    MintInfo lp_b;
    lp_b.authority = pool_id;
    lp_b.decimals = token_b_decimals;
    mints_[record.state.lp_mint_a] = lp_a;
    mints_[record.state.lp_mint_b] = lp_b;

    pools_[pool_id] = record;
    spdlog::info("[sim] created pool {} ({} CUs)", pool_id, compute_units);
    return record.state;
}

std::string SimulatedChainClient::get_contract_version() {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call("get_contract_version");
    return options_.contract_version;
}

bool SimulatedChainClient::check_health() {
    return true;
}

void SimulatedChainClient::set_system_paused(bool paused) {
    std::lock_guard<std::mutex> lock(mutex_);
    system_paused_ = paused;
}

void SimulatedChainClient::set_pool_paused(const std::string& pool_id, bool paused) {
    std::lock_guard<std::mutex> lock(mutex_);
    find_pool(pool_id).state.pool_paused = paused;
}

void SimulatedChainClient::set_swaps_paused(const std::string& pool_id, bool paused) {
    std::lock_guard<std::mutex> lock(mutex_);
    find_pool(pool_id).state.swaps_paused = paused;
}

void SimulatedChainClient::set_contract_version(const std::string& version) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.contract_version = version;
}

void SimulatedChainClient::fail_next(const std::string& operation, const std::string& message, int times) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& queue = scripted_failures_[operation];
    for (int i = 0; i < times; ++i) {
        queue.push_back(message);
    }
}

void SimulatedChainClient::fail_next_with_code(const std::string& operation, int code, int times) {
    fail_next(operation, "Transaction simulation failed: Error processing Instruction 0: " +
                         contract_error::program_log(code), times);
}

uint64_t SimulatedChainClient::call_count(const std::string& operation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = call_counts_.find(operation);
    return it == call_counts_.end() ? 0 : it->second;
}

uint64_t SimulatedChainClient::pool_reserve(const std::string& pool_id, TokenSide side) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(pool_id);
    if (it == pools_.end()) {
        return 0;
    }
    return side == TokenSide::A ? it->second.reserve_a : it->second.reserve_b;
}

void SimulatedChainClient::begin_call(const std::string& operation) {
    call_counts_[operation]++;

    auto it = scripted_failures_.find(operation);
    if (it != scripted_failures_.end() && !it->second.empty()) {
        std::string message = it->second.front();
        it->second.pop_front();
        throw ChainError(message);
    }
}

void SimulatedChainClient::charge_fee(const std::string& payer) {
    uint64_t& lamports = native_balances_[payer];
    if (lamports < options_.network_fee) {
        throw ChainError("Transaction simulation failed: Attempt to debit an account but found no record of a prior credit.");
    }
    lamports -= options_.network_fee;
}

uint64_t& SimulatedChainClient::token_account(const std::string& owner, const std::string& mint) {
    return token_balances_[{owner, mint}];
}

SimulatedChainClient::PoolRecord& SimulatedChainClient::find_pool(const std::string& pool_id) {
    auto it = pools_.find(pool_id);
    if (it == pools_.end()) {
        throw AccountNotFoundError(contract_failure(contract_error::PoolNotFound).what());
    }
    return it->second;
}

std::string SimulatedChainClient::new_signature() {
    std::vector<uint8_t> bytes(64);
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(util::random_between(0, 255));
    }
    std::string signature = util::base58_encode(bytes);
    signatures_.insert(signature);
    return signature;
}

ChainError SimulatedChainClient::contract_failure(int code) const {
    return ChainError("Transaction simulation failed: Error processing Instruction 0: " +
                      contract_error::program_log(code));
}
