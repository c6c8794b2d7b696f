#pragma once
#include "types.hpp"
#include <string>
#include <chrono>
#include <stdexcept>
#include <cstdint>

// Raised for any failure reported by the chain or the contract. what() carries the
// raw message (program logs included) so the error classifier can parse it.
class ChainError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The chain answered and the requested account does not exist
class AccountNotFoundError : public ChainError {
public:
    using ChainError::ChainError;
};

// Unspendable destination used for burns
constexpr const char* kBurnAddress = "11111111111111111111111111111111";

constexpr uint64_t kLamportsPerSol = 1000000000ULL;

class ChainClient {
public:
    virtual ~ChainClient() = default;

    // Wallets
    virtual WalletCredential generate_wallet() = 0;
    virtual WalletCredential restore_wallet(const std::string& secret_key) = 0;

    // Balances
    virtual uint64_t get_native_balance(const std::string& owner) = 0;
    virtual uint64_t get_token_balance(const std::string& owner, const std::string& mint) = 0;

    // Contract operations
    virtual OperationResult deposit(const WalletCredential& wallet, const std::string& pool_id,
                                    TokenSide side, uint64_t amount, uint32_t compute_units) = 0;
    virtual OperationResult withdraw(const WalletCredential& wallet, const std::string& pool_id,
                                     TokenSide side, uint64_t lp_amount, uint32_t compute_units) = 0;
    virtual OperationResult swap(const WalletCredential& wallet, const std::string& pool_id,
                                 SwapDirection direction, uint64_t amount, uint64_t minimum_output,
                                 uint32_t compute_units) = 0;

    // Token and native transfers; each returns the transaction signature
    virtual std::string mint_tokens(const WalletCredential& authority, const std::string& mint,
                                    const std::string& destination_owner, uint64_t amount) = 0;
    virtual std::string transfer_tokens(const WalletCredential& from, const std::string& destination_owner,
                                        const std::string& mint, uint64_t amount) = 0;
    virtual std::string transfer_native(const WalletCredential& from, const std::string& destination,
                                        uint64_t lamports) = 0;
    virtual std::string request_airdrop(const std::string& owner, uint64_t lamports) = 0;

    // Pause flags and pool state
    virtual bool is_system_paused() = 0;
    virtual bool is_pool_paused(const std::string& pool_id) = 0;
    virtual bool are_swaps_paused(const std::string& pool_id) = 0;
    virtual PoolState get_pool_state(const std::string& pool_id) = 0;

    // Prepared transactions
    virtual std::string submit_transaction(const std::string& serialized_transaction) = 0;
    virtual bool confirm_transaction(const std::string& signature, std::chrono::milliseconds timeout) = 0;

    // Provisioning
    virtual std::string create_token_mint(const WalletCredential& authority, int decimals) = 0;
    virtual PoolState create_pool(const WalletCredential& payer, const PoolRatioConfig& ratio,
                                  int token_a_decimals, int token_b_decimals, uint32_t compute_units) = 0;

    virtual std::string get_contract_version() = 0;
    virtual bool check_health() = 0;
};
