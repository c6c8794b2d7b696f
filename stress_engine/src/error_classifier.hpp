#pragma once
#include "types.hpp"
#include "chain_client.hpp"
#include "cancellation.hpp"
#include <string>
#include <optional>
#include <chrono>

class Config;

enum class ErrorKind {
    InsufficientFunds,
    PoolPaused,
    SystemPaused,
    InsufficientLiquidity,
    SlippageExceeded,
    InvalidTokenAccount,
    InvalidLpTokenType,
    PoolSwapsPaused,
    Unknown
};

std::string to_string(ErrorKind kind);

struct ErrorClassification {
    ErrorKind kind = ErrorKind::Unknown;
    std::optional<int> code;
    bool recovered = false;  // a contract code was found in the message
};

// Pure parse of a raw failure message. Recognizes "Custom(N)" first, then "0x<hex> (N)".
class ErrorClassifier {
public:
    static ErrorClassification classify(const std::string& raw);
    static ErrorKind kind_for_code(int code);
};

// Per-iteration view of a worker. Runtime fields persist across one retry chain.
struct WorkerContext {
    std::string worker_id;
    WorkerKind kind = WorkerKind::Deposit;
    std::string pool_id;
    TokenSide token_side = TokenSide::A;
    std::optional<SwapDirection> swap_direction;
    WalletCredential wallet;
    WalletCredential mint_authority;
    uint64_t initial_amount = 0;
    bool auto_refill = false;
    bool share_output = false;

    double slippage_tolerance = 0.01;
    int retry_count = 0;
    std::string last_operation;

    static WorkerContext from_config(const WorkerConfig& config);

    // Mint holding the tokens this worker spends
    std::string input_mint(const PoolState& pool) const;

    void reset_runtime();
};

struct RecoveryPolicy {
    std::chrono::milliseconds poll_interval{30000};
    int pool_pause_max_polls = 120;
    int system_pause_max_polls = 240;
    int swaps_pause_max_polls = 60;
    std::chrono::milliseconds insufficient_funds_delay{5000};
    std::chrono::milliseconds liquidity_delay{10000};
    std::chrono::milliseconds slippage_delay{2000};
    std::chrono::milliseconds unknown_error_delay{5000};
    int unknown_error_max_retries = 3;
    double auto_refill_threshold = 0.1;
    double max_slippage_tolerance = 0.1;
    double slippage_growth = 1.5;

    static RecoveryPolicy from_config(const Config& config);
};

enum class RecoveryVerdict {
    Retry,
    Fail,
    Cancelled
};

struct RecoveryOutcome {
    RecoveryVerdict verdict = RecoveryVerdict::Fail;
    std::optional<std::string> error_to_record;
};

// Executes the recovery policy for a classified failure. Never throws; every
// wait observes the cancellation token.
class ErrorRecovery {
public:
    ErrorRecovery(ChainClient& chain, RecoveryPolicy policy);

    RecoveryOutcome handle(const ErrorClassification& classification, WorkerContext& context,
                           const CancellationToken& token);

    const RecoveryPolicy& policy() const { return policy_; }

private:
    RecoveryOutcome handle_insufficient_funds(WorkerContext& context, const CancellationToken& token);
    RecoveryOutcome handle_pool_paused(WorkerContext& context, const CancellationToken& token);
    RecoveryOutcome handle_system_paused(WorkerContext& context, const CancellationToken& token);
    RecoveryOutcome handle_insufficient_liquidity(WorkerContext& context, const CancellationToken& token);
    RecoveryOutcome handle_slippage(WorkerContext& context, const CancellationToken& token);
    RecoveryOutcome handle_swaps_paused(WorkerContext& context, const CancellationToken& token);
    RecoveryOutcome handle_unknown(const ErrorClassification& classification, WorkerContext& context,
                                   const CancellationToken& token);

    template <typename Check>
    RecoveryOutcome poll_until_clear(Check still_paused, int max_polls, const std::string& what,
                                     const CancellationToken& token);

    RecoveryOutcome wait_then_retry(std::chrono::milliseconds delay, const CancellationToken& token);

    ChainClient& chain_;
    RecoveryPolicy policy_;
};
