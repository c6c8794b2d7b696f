#pragma once
#include "chain_client.hpp"
#include <map>
#include <set>
#include <deque>
#include <mutex>
#include <string>
#include <utility>

// In-process fixed-ratio contract. Used for dry runs (CHAIN_MODE=simulated) and tests.
// Failures are reported with the same program-log text the real contract emits.
class SimulatedChainClient : public ChainClient {
public:
    struct Options {
        uint64_t network_fee = 5000;
        std::string contract_version = "0.16.0";
    };

    SimulatedChainClient();
    explicit SimulatedChainClient(Options options);

    WalletCredential generate_wallet() override;
    WalletCredential restore_wallet(const std::string& secret_key) override;

    uint64_t get_native_balance(const std::string& owner) override;
    uint64_t get_token_balance(const std::string& owner, const std::string& mint) override;

    OperationResult deposit(const WalletCredential& wallet, const std::string& pool_id,
                            TokenSide side, uint64_t amount, uint32_t compute_units) override;
    OperationResult withdraw(const WalletCredential& wallet, const std::string& pool_id,
                             TokenSide side, uint64_t lp_amount, uint32_t compute_units) override;
    OperationResult swap(const WalletCredential& wallet, const std::string& pool_id,
                         SwapDirection direction, uint64_t amount, uint64_t minimum_output,
                         uint32_t compute_units) override;

    std::string mint_tokens(const WalletCredential& authority, const std::string& mint,
                            const std::string& destination_owner, uint64_t amount) override;
    std::string transfer_tokens(const WalletCredential& from, const std::string& destination_owner,
                                const std::string& mint, uint64_t amount) override;
    std::string transfer_native(const WalletCredential& from, const std::string& destination,
                                uint64_t lamports) override;
    std::string request_airdrop(const std::string& owner, uint64_t lamports) override;

    bool is_system_paused() override;
    bool is_pool_paused(const std::string& pool_id) override;
    bool are_swaps_paused(const std::string& pool_id) override;
    PoolState get_pool_state(const std::string& pool_id) override;

    std::string submit_transaction(const std::string& serialized_transaction) override;
    bool confirm_transaction(const std::string& signature, std::chrono::milliseconds timeout) override;

    std::string create_token_mint(const WalletCredential& authority, int decimals) override;
    PoolState create_pool(const WalletCredential& payer, const PoolRatioConfig& ratio,
                          int token_a_decimals, int token_b_decimals, uint32_t compute_units) override;

    std::string get_contract_version() override;
    bool check_health() override;

    // Operator controls
    void set_system_paused(bool paused);
    void set_pool_paused(const std::string& pool_id, bool paused);
    void set_swaps_paused(const std::string& pool_id, bool paused);
    void set_contract_version(const std::string& version);

    // Scripted failures: the next `times` calls of `operation` throw ChainError(message).
    // Operation names match the method names ("deposit", "swap", "transfer_tokens", ...).
    void fail_next(const std::string& operation, const std::string& message, int times = 1);
    void fail_next_with_code(const std::string& operation, int code, int times = 1);

    uint64_t call_count(const std::string& operation) const;
    uint64_t pool_reserve(const std::string& pool_id, TokenSide side) const;

private:
    struct MintInfo {
        std::string authority;
        int decimals = 0;
        uint64_t supply = 0;
    };

    struct PoolRecord {
        PoolState state;
        uint64_t reserve_a = 0;
        uint64_t reserve_b = 0;

        uint64_t& reserve(TokenSide side) { return side == TokenSide::A ? reserve_a : reserve_b; }
    };

    // All helpers expect mutex_ to be held
    void begin_call(const std::string& operation);
    void charge_fee(const std::string& payer);
    uint64_t& token_account(const std::string& owner, const std::string& mint);
    PoolRecord& find_pool(const std::string& pool_id);
    std::string new_signature();
    ChainError contract_failure(int code) const;

    Options options_;
    mutable std::mutex mutex_;
    bool system_paused_ = false;
    std::map<std::pair<std::string, std::string>, uint64_t> token_balances_;
    std::map<std::string, uint64_t> native_balances_;
    std::map<std::string, MintInfo> mints_;
    std::map<std::string, PoolRecord> pools_;
    std::map<std::string, std::deque<std::string>> scripted_failures_;
    std::map<std::string, uint64_t> call_counts_;
    std::set<std::string> signatures_;
};
