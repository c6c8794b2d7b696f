#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

enum class ServiceState {
    Stopped,
    Starting,
    Started,
    Pausing,
    Paused,
    Resuming,
    Stopping,
    Error
};

enum class WorkerKind {
    Deposit,
    Withdrawal,
    Swap
};

enum class TokenSide {
    A,
    B
};

enum class SwapDirection {
    AToB,
    BToA
};

enum class WorkerStatus {
    Created,
    Running,
    Stopped,
    Paused,
    Stopping,
    Failed,
    Error
};

std::string to_string(ServiceState state);
std::string to_string(WorkerKind kind);
std::string to_string(TokenSide side);
std::string to_string(SwapDirection direction);
std::string to_string(WorkerStatus status);

// Parsing is case-insensitive; throws std::invalid_argument on unknown names
WorkerKind parse_worker_kind(const std::string& value);
TokenSide parse_token_side(const std::string& value);
SwapDirection parse_swap_direction(const std::string& value);
WorkerStatus parse_worker_status(const std::string& value);

struct WalletCredential {
    std::string public_key;  // base58, 32 bytes
    std::string secret_key;  // base58, 64 bytes (seed followed by public key)

    bool empty() const { return public_key.empty() || secret_key.empty(); }
};

struct WorkerConfig {
    std::string worker_id;
    WorkerKind kind = WorkerKind::Deposit;
    std::string pool_id;
    TokenSide token_side = TokenSide::A;
    std::optional<SwapDirection> swap_direction;
    WalletCredential wallet;
    uint64_t initial_amount = 0;
    bool auto_refill = false;
    bool share_output = false;
    WorkerStatus status = WorkerStatus::Created;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> last_operation_at;

    nlohmann::json to_json(bool include_secret = true) const;
    static WorkerConfig from_json(const nlohmann::json& j);
};

struct WorkerError {
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::string operation_type;

    nlohmann::json to_json() const;
    static WorkerError from_json(const nlohmann::json& j);
};

struct WorkerStatistics {
    static constexpr size_t kMaxRecentErrors = 10;

    uint64_t successful_operations = 0;
    uint64_t failed_operations = 0;
    uint64_t total_volume_processed = 0;
    uint64_t total_fees_paid = 0;
    std::optional<std::chrono::system_clock::time_point> last_operation_at;
    std::string last_error;
    std::vector<WorkerError> recent_errors;

    uint64_t attempted_operations() const { return successful_operations + failed_operations; }

    // Appends and keeps only the newest kMaxRecentErrors entries
    void add_error(const WorkerError& error);

    nlohmann::json to_json() const;
    static WorkerStatistics from_json(const nlohmann::json& j);
};

struct PoolRatioConfig {
    std::string token_a_mint;
    std::string token_b_mint;
    uint64_t ratio_a_numerator = 0;
    uint64_t ratio_b_denominator = 0;
    std::string pool_id;
    bool was_swapped = false;

    // Token B received for one whole unit of token A
    double exchange_rate() const;

    // Canonical identity only; was_swapped records how this value was reached
    bool operator==(const PoolRatioConfig& other) const;

    nlohmann::json to_json() const;
    static PoolRatioConfig from_json(const nlohmann::json& j);
};

struct PoolState {
    std::string pool_id;
    std::string token_a_mint;
    std::string token_b_mint;
    int token_a_decimals = 9;
    int token_b_decimals = 9;
    uint64_t ratio_a_numerator = 0;
    uint64_t ratio_b_denominator = 0;
    std::string lp_mint_a;
    std::string lp_mint_b;
    bool pool_paused = false;
    bool swaps_paused = false;
    std::chrono::system_clock::time_point created_at;

    const std::string& token_mint(TokenSide side) const {
        return side == TokenSide::A ? token_a_mint : token_b_mint;
    }
    const std::string& lp_mint(TokenSide side) const {
        return side == TokenSide::A ? lp_mint_a : lp_mint_b;
    }

    // Fixed-ratio output for a swap input, rounded down
    uint64_t swap_output(SwapDirection direction, uint64_t input_amount) const;

    nlohmann::json to_json() const;
    static PoolState from_json(const nlohmann::json& j);
};

struct PoolRegistryEntry {
    std::string pool_id;
    PoolRatioConfig ratio;
    int token_a_decimals = 9;
    int token_b_decimals = 9;
    std::chrono::system_clock::time_point created_at;

    nlohmann::json to_json() const;
    static PoolRegistryEntry from_json(const nlohmann::json& j);
};

// Outcome of a deposit, withdrawal or swap submitted to the contract
struct OperationResult {
    std::string signature;
    uint64_t input_amount = 0;
    uint64_t output_amount = 0;   // LP tokens, withdrawn tokens or swap proceeds
    uint64_t pool_fee = 0;
    uint64_t network_fee = 0;
};

struct CoreWallet {
    WalletCredential credential;
    std::chrono::system_clock::time_point created_at;

    nlohmann::json to_json() const;
    static CoreWallet from_json(const nlohmann::json& j);
};

struct HealthStatus {
    bool healthy = false;
    std::string status;
    nlohmann::json metrics = nlohmann::json::object();
    std::string timestamp;

    nlohmann::json to_json() const;
};
