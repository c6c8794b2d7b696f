#include "solana_client.hpp"
#include "wallet.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <thread>

using json = nlohmann::json;

namespace {

// Splits "https://host:port/path" into the client base URL and the request path
std::pair<std::string, std::string> split_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw std::runtime_error("Invalid URL (missing scheme): " + url);
    }
    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        return {url, "/"};
    }
    return {url.substr(0, path_start), url.substr(path_start)};
}

std::string gateway_error(const json& body, int status) {
    std::string message = body.value("error", "gateway returned status " + std::to_string(status));
    if (body.contains("logs") && body.at("logs").is_array()) {
        for (const auto& line : body.at("logs")) {
            if (line.is_string()) {
                message += " | " + line.get<std::string>();
            }
        }
    }
    return message;
}

} // namespace

SolanaClient::SolanaClient(const std::string& rpc_url, const std::string& gateway_url, const std::string& program_id)
    : rpc_url_(rpc_url), gateway_url_(gateway_url), program_id_(program_id) {
    spdlog::info("Solana client configured: rpc={}, gateway={}, program={}", rpc_url_, gateway_url_, program_id_);
}

WalletCredential SolanaClient::generate_wallet() {
    return Wallet::generate();
}

WalletCredential SolanaClient::restore_wallet(const std::string& secret_key) {
    try {
        return Wallet::restore(secret_key);
    } catch (const std::invalid_argument& e) {
        throw ChainError(std::string("Invalid wallet secret key: ") + e.what());
    }
}

uint64_t SolanaClient::get_native_balance(const std::string& owner) {
    auto result = rpc_call("getBalance", json::array({owner, {{"commitment", "confirmed"}}}));
    return result.at("value").get<uint64_t>();
}

uint64_t SolanaClient::get_token_balance(const std::string& owner, const std::string& mint) {
    auto result = rpc_call("getTokenAccountsByOwner", json::array({
        owner,
        {{"mint", mint}},
        {{"encoding", "jsonParsed"}, {"commitment", "confirmed"}}
    }));

    uint64_t total = 0;
    for (const auto& account : result.at("value")) {
        try {
            const auto& info = account.at("account").at("data").at("parsed").at("info");
            total += std::stoull(info.at("tokenAmount").at("amount").get<std::string>());
        } catch (const std::exception& e) {
            spdlog::warn("Failed to parse token account for {}: {}", owner, e.what());
        }
    }
    return total;
}

OperationResult SolanaClient::deposit(const WalletCredential& wallet, const std::string& pool_id,
                                      TokenSide side, uint64_t amount, uint32_t compute_units) {
    return operation_result(gateway_post("/v1/pools/" + pool_id + "/deposit", {
        {"program_id", program_id_},
        {"secret_key", wallet.secret_key},
        {"token_side", to_string(side)},
        {"amount", amount},
        {"compute_units", compute_units}
    }));
}

OperationResult SolanaClient::withdraw(const WalletCredential& wallet, const std::string& pool_id,
                                       TokenSide side, uint64_t lp_amount, uint32_t compute_units) {
    return operation_result(gateway_post("/v1/pools/" + pool_id + "/withdraw", {
        {"program_id", program_id_},
        {"secret_key", wallet.secret_key},
        {"token_side", to_string(side)},
        {"lp_amount", lp_amount},
        {"compute_units", compute_units}
    }));
}

OperationResult SolanaClient::swap(const WalletCredential& wallet, const std::string& pool_id,
                                   SwapDirection direction, uint64_t amount, uint64_t minimum_output,
                                   uint32_t compute_units) {
    return operation_result(gateway_post("/v1/pools/" + pool_id + "/swap", {
        {"program_id", program_id_},
        {"secret_key", wallet.secret_key},
        {"direction", to_string(direction)},
        {"amount", amount},
        {"minimum_output", minimum_output},
        {"compute_units", compute_units}
    }));
}

std::string SolanaClient::mint_tokens(const WalletCredential& authority, const std::string& mint,
                                      const std::string& destination_owner, uint64_t amount) {
    auto body = gateway_post("/v1/tokens/mint", {
        {"authority_secret_key", authority.secret_key},
        {"mint", mint},
        {"destination_owner", destination_owner},
        {"amount", amount}
    });
    return body.at("signature").get<std::string>();
}

std::string SolanaClient::transfer_tokens(const WalletCredential& from, const std::string& destination_owner,
                                          const std::string& mint, uint64_t amount) {
    auto body = gateway_post("/v1/tokens/transfer", {
        {"secret_key", from.secret_key},
        {"destination_owner", destination_owner},
        {"mint", mint},
        {"amount", amount}
    });
    return body.at("signature").get<std::string>();
}

std::string SolanaClient::transfer_native(const WalletCredential& from, const std::string& destination,
                                          uint64_t lamports) {
    auto body = gateway_post("/v1/native/transfer", {
        {"secret_key", from.secret_key},
        {"destination", destination},
        {"lamports", lamports}
    });
    return body.at("signature").get<std::string>();
}

std::string SolanaClient::request_airdrop(const std::string& owner, uint64_t lamports) {
    auto result = rpc_call("requestAirdrop", json::array({owner, lamports}));
    return result.get<std::string>();
}

bool SolanaClient::is_system_paused() {
    return gateway_get("/v1/system").value("paused", false);
}

bool SolanaClient::is_pool_paused(const std::string& pool_id) {
    return get_pool_state(pool_id).pool_paused;
}

bool SolanaClient::are_swaps_paused(const std::string& pool_id) {
    return get_pool_state(pool_id).swaps_paused;
}

PoolState SolanaClient::get_pool_state(const std::string& pool_id) {
    return PoolState::from_json(gateway_get("/v1/pools/" + pool_id));
}

std::string SolanaClient::submit_transaction(const std::string& serialized_transaction) {
    auto result = rpc_call("sendTransaction", json::array({
        serialized_transaction,
        {{"encoding", "base64"}, {"preflightCommitment", "confirmed"}}
    }));
    return result.get<std::string>();
}

bool SolanaClient::confirm_transaction(const std::string& signature, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto result = rpc_call("getSignatureStatuses", json::array({json::array({signature})}));
        const auto& status = result.at("value").at(0);
        if (!status.is_null()) {
            if (!status.at("err").is_null()) {
                throw ChainError("Transaction " + signature + " failed: " + status.at("err").dump());
            }
            std::string level = status.value("confirmationStatus", "");
            if (level == "confirmed" || level == "finalized") {
                return true;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    return false;
}

std::string SolanaClient::create_token_mint(const WalletCredential& authority, int decimals) {
    auto body = gateway_post("/v1/mints", {
        {"authority_secret_key", authority.secret_key},
        {"decimals", decimals}
    });
    return body.at("mint").get<std::string>();
}

PoolState SolanaClient::create_pool(const WalletCredential& payer, const PoolRatioConfig& ratio,
                                    int token_a_decimals, int token_b_decimals, uint32_t compute_units) {
    auto body = gateway_post("/v1/pools", {
        {"program_id", program_id_},
        {"payer_secret_key", payer.secret_key},
        {"token_a_mint", ratio.token_a_mint},
        {"token_b_mint", ratio.token_b_mint},
        {"ratio_a_numerator", ratio.ratio_a_numerator},
        {"ratio_b_denominator", ratio.ratio_b_denominator},
        {"token_a_decimals", token_a_decimals},
        {"token_b_decimals", token_b_decimals},
        {"compute_units", compute_units}
    });
    return PoolState::from_json(body);
}

std::string SolanaClient::get_contract_version() {
    return gateway_get("/v1/version?program_id=" + program_id_).at("version").get<std::string>();
}

bool SolanaClient::check_health() {
    try {
        auto result = rpc_call("getHealth", json::array());
        return result.is_string() && result.get<std::string>() == "ok";
    } catch (const std::exception& e) {
        spdlog::error("Solana health check failed: {}", e.what());
        return false;
    }
}

json SolanaClient::rpc_call(const std::string& method, const json& params) {
    auto [base, path] = split_url(rpc_url_);
    httplib::Client client(base);
    client.set_connection_timeout(10, 0);
    client.set_read_timeout(30, 0);

    json request = {
        {"jsonrpc", "2.0"},
        {"id", request_id_++},
        {"method", method},
        {"params", params}
    };

    auto response = client.Post(path, request.dump(), "application/json");
    if (!response) {
        throw ChainError("RPC " + method + " failed: " + httplib::to_string(response.error()));
    }
    if (response->status != 200) {
        throw ChainError("RPC " + method + " returned status " + std::to_string(response->status));
    }

    auto body = json::parse(response->body);
    if (body.contains("error")) {
        throw ChainError("RPC " + method + " error: " + body.at("error").dump());
    }
    return body.at("result");
}

json SolanaClient::gateway_get(const std::string& path) {
    auto [base, prefix] = split_url(gateway_url_);
    httplib::Client client(base);
    client.set_connection_timeout(10, 0);
    client.set_read_timeout(30, 0);

    std::string full_path = (prefix == "/" ? "" : prefix) + path;
    auto response = client.Get(full_path);
    if (!response) {
        throw ChainError("Gateway GET " + path + " failed: " + httplib::to_string(response.error()));
    }

    auto body = json::parse(response->body, nullptr, false);
    if (body.is_discarded()) {
        throw ChainError("Gateway GET " + path + " returned invalid JSON");
    }
    if (response->status == 404) {
        throw AccountNotFoundError(gateway_error(body, response->status));
    }
    if (response->status < 200 || response->status >= 300) {
        throw ChainError(gateway_error(body, response->status));
    }
    return body;
}

json SolanaClient::gateway_post(const std::string& path, const json& request) {
    auto [base, prefix] = split_url(gateway_url_);
    httplib::Client client(base);
    client.set_connection_timeout(10, 0);
    client.set_read_timeout(60, 0);

    std::string full_path = (prefix == "/" ? "" : prefix) + path;
    auto response = client.Post(full_path, request.dump(), "application/json");
    if (!response) {
        throw ChainError("Gateway POST " + path + " failed: " + httplib::to_string(response.error()));
    }

    auto body = json::parse(response->body, nullptr, false);
    if (body.is_discarded()) {
        throw ChainError("Gateway POST " + path + " returned invalid JSON");
    }
    if (response->status < 200 || response->status >= 300) {
        throw ChainError(gateway_error(body, response->status));
    }
    spdlog::debug("Gateway {} -> {}", path, body.value("signature", ""));
    return body;
}

OperationResult SolanaClient::operation_result(const json& j) {
    OperationResult result;
    result.signature = j.at("signature").get<std::string>();
    result.input_amount = j.value("input_amount", uint64_t{0});
    result.output_amount = j.value("output_amount", uint64_t{0});
    result.pool_fee = j.value("pool_fee", uint64_t{0});
    result.network_fee = j.value("network_fee", uint64_t{0});
    return result;
}
