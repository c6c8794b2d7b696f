#pragma once
#include "chain_client.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <string>

// ChainClient against a live cluster. Reads go to the JSON-RPC endpoint; contract
// instructions are built and signed by the transaction gateway service.
class SolanaClient : public ChainClient {
public:
    SolanaClient(const std::string& rpc_url, const std::string& gateway_url, const std::string& program_id);

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

private:
    nlohmann::json rpc_call(const std::string& method, const nlohmann::json& params);
    nlohmann::json gateway_get(const std::string& path);
    nlohmann::json gateway_post(const std::string& path, const nlohmann::json& body);

    static OperationResult operation_result(const nlohmann::json& j);

    std::string rpc_url_;
    std::string gateway_url_;
    std::string program_id_;
    std::atomic<uint64_t> request_id_{1};
};
