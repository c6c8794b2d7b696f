#include "error_classifier.hpp"
#include "config.hpp"
#include "contract_errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <regex>

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InsufficientFunds:     return "InsufficientFunds";
        case ErrorKind::PoolPaused:            return "PoolPaused";
        case ErrorKind::SystemPaused:          return "SystemPaused";
        case ErrorKind::InsufficientLiquidity: return "InsufficientLiquidity";
        case ErrorKind::SlippageExceeded:      return "SlippageExceeded";
        case ErrorKind::InvalidTokenAccount:   return "InvalidTokenAccount";
        case ErrorKind::InvalidLpTokenType:    return "InvalidLpTokenType";
        case ErrorKind::PoolSwapsPaused:       return "PoolSwapsPaused";
        case ErrorKind::Unknown:               return "Unknown";
    }
    return "Unknown";
}

ErrorClassification ErrorClassifier::classify(const std::string& raw) {
    static const std::regex custom_pattern(R"(Custom\((\d+)\))");
    static const std::regex hex_pattern(R"(0x[0-9a-fA-F]+\s*\((\d+)\))");

    ErrorClassification result;
    std::smatch match;
    if (std::regex_search(raw, match, custom_pattern) || std::regex_search(raw, match, hex_pattern)) {
        try {
            int code = std::stoi(match[1].str());
            result.code = code;
            result.kind = kind_for_code(code);
            result.recovered = true;
        } catch (const std::exception&) {
            // Digits too long for an int; leave unclassified
            result = ErrorClassification{};
        }
    }
    return result;
}

ErrorKind ErrorClassifier::kind_for_code(int code) {
    switch (code) {
        case contract_error::InsufficientFunds:     return ErrorKind::InsufficientFunds;
        case contract_error::PoolPaused:            return ErrorKind::PoolPaused;
        case contract_error::SystemPaused:          return ErrorKind::SystemPaused;
        case contract_error::InsufficientLiquidity: return ErrorKind::InsufficientLiquidity;
        case contract_error::SlippageExceeded:      return ErrorKind::SlippageExceeded;
        case contract_error::InvalidTokenAccount:   return ErrorKind::InvalidTokenAccount;
        case contract_error::InvalidLpTokenType:    return ErrorKind::InvalidLpTokenType;
        case contract_error::PoolSwapsPaused:       return ErrorKind::PoolSwapsPaused;
        default:                                    return ErrorKind::Unknown;
    }
}

WorkerContext WorkerContext::from_config(const WorkerConfig& config) {
    WorkerContext context;
    context.worker_id = config.worker_id;
    context.kind = config.kind;
    context.pool_id = config.pool_id;
    context.token_side = config.token_side;
    context.swap_direction = config.swap_direction;
    context.wallet = config.wallet;
    context.initial_amount = config.initial_amount;
    context.auto_refill = config.auto_refill;
    context.share_output = config.share_output;
    return context;
}

std::string WorkerContext::input_mint(const PoolState& pool) const {
    if (kind == WorkerKind::Swap) {
        SwapDirection direction = swap_direction.value_or(SwapDirection::AToB);
        return direction == SwapDirection::AToB ? pool.token_a_mint : pool.token_b_mint;
    }
    return pool.token_mint(token_side);
}

void WorkerContext::reset_runtime() {
    slippage_tolerance = 0.01;
    retry_count = 0;
}

RecoveryPolicy RecoveryPolicy::from_config(const Config& config) {
    RecoveryPolicy policy;
    policy.poll_interval = std::chrono::seconds(config.poll_interval_seconds);
    policy.pool_pause_max_polls = config.pool_pause_max_polls;
    policy.system_pause_max_polls = config.system_pause_max_polls;
    policy.swaps_pause_max_polls = config.swaps_pause_max_polls;
    policy.insufficient_funds_delay = std::chrono::milliseconds(config.insufficient_funds_delay_ms);
    policy.liquidity_delay = std::chrono::milliseconds(config.liquidity_delay_ms);
    policy.slippage_delay = std::chrono::milliseconds(config.slippage_delay_ms);
    policy.unknown_error_delay = std::chrono::milliseconds(config.unknown_error_delay_ms);
    policy.unknown_error_max_retries = config.unknown_error_max_retries;
    policy.auto_refill_threshold = config.auto_refill_threshold;
    return policy;
}

ErrorRecovery::ErrorRecovery(ChainClient& chain, RecoveryPolicy policy)
    : chain_(chain), policy_(std::move(policy)) {}

RecoveryOutcome ErrorRecovery::handle(const ErrorClassification& classification, WorkerContext& context,
                                      const CancellationToken& token) {
    if (token.is_cancelled()) {
        return {RecoveryVerdict::Cancelled, std::nullopt};
    }

    if (classification.code) {
        spdlog::warn("Contract error {} for worker {}: {}", *classification.code, context.worker_id,
                     contract_error::message(*classification.code));
    }

    switch (classification.kind) {
        case ErrorKind::InsufficientFunds:
            return handle_insufficient_funds(context, token);
        case ErrorKind::PoolPaused:
            return handle_pool_paused(context, token);
        case ErrorKind::SystemPaused:
            return handle_system_paused(context, token);
        case ErrorKind::InsufficientLiquidity:
            return handle_insufficient_liquidity(context, token);
        case ErrorKind::SlippageExceeded:
            return handle_slippage(context, token);
        case ErrorKind::InvalidTokenAccount:
            spdlog::error("Invalid token account for worker {}", context.worker_id);
            return {RecoveryVerdict::Fail, std::string("Invalid token account - check pool configuration")};
        case ErrorKind::InvalidLpTokenType:
            spdlog::error("Invalid LP token type for worker {}", context.worker_id);
            return {RecoveryVerdict::Fail, std::string("LP token type mismatch - check token configuration")};
        case ErrorKind::PoolSwapsPaused:
            return handle_swaps_paused(context, token);
        case ErrorKind::Unknown:
            return handle_unknown(classification, context, token);
    }
    return handle_unknown(classification, context, token);
}

RecoveryOutcome ErrorRecovery::handle_insufficient_funds(WorkerContext& context, const CancellationToken& token) {
    spdlog::warn("Insufficient funds for worker {}", context.worker_id);

    if (context.auto_refill && context.initial_amount > 0 && context.kind != WorkerKind::Withdrawal) {
        try {
            PoolState pool = chain_.get_pool_state(context.pool_id);
            std::string mint = context.input_mint(pool);
            uint64_t balance = chain_.get_token_balance(context.wallet.public_key, mint);
            auto threshold = static_cast<uint64_t>(static_cast<double>(context.initial_amount) *
                                                   policy_.auto_refill_threshold);
            if (balance < threshold) {
                spdlog::info("Minting {} tokens for worker {}", context.initial_amount, context.worker_id);
                chain_.mint_tokens(context.mint_authority, mint, context.wallet.public_key, context.initial_amount);
            }
        } catch (const std::exception& e) {
            spdlog::error("Failed to refill worker {}: {}", context.worker_id, e.what());
            return {RecoveryVerdict::Fail, "Token refill failed: " + std::string(e.what())};
        }
    }

    return wait_then_retry(policy_.insufficient_funds_delay, token);
}

RecoveryOutcome ErrorRecovery::handle_pool_paused(WorkerContext& context, const CancellationToken& token) {
    spdlog::info("Pool {} is paused, waiting for unpause", context.pool_id);
    const std::string pool_id = context.pool_id;
    return poll_until_clear([this, &pool_id] { return chain_.is_pool_paused(pool_id); },
                            policy_.pool_pause_max_polls, "pool " + pool_id, token);
}

RecoveryOutcome ErrorRecovery::handle_system_paused(WorkerContext& /*context*/, const CancellationToken& token) {
    spdlog::info("System is paused, waiting for unpause");
    return poll_until_clear([this] { return chain_.is_system_paused(); },
                            policy_.system_pause_max_polls, "system", token);
}

RecoveryOutcome ErrorRecovery::handle_insufficient_liquidity(WorkerContext& context, const CancellationToken& token) {
    spdlog::warn("Insufficient liquidity in pool {} for worker {}", context.pool_id, context.worker_id);

    if (context.kind == WorkerKind::Withdrawal || context.kind == WorkerKind::Swap) {
        return wait_then_retry(policy_.liquidity_delay, token);
    }

    spdlog::error("Unexpected insufficient liquidity error for deposit worker {}", context.worker_id);
    return {RecoveryVerdict::Fail, std::string("Insufficient liquidity reported for a deposit")};
}

RecoveryOutcome ErrorRecovery::handle_slippage(WorkerContext& context, const CancellationToken& token) {
    context.slippage_tolerance = std::min(context.slippage_tolerance * policy_.slippage_growth,
                                          policy_.max_slippage_tolerance);
    spdlog::warn("Slippage exceeded for worker {}, tolerance now {:.2f}%", context.worker_id,
                 context.slippage_tolerance * 100.0);
    return wait_then_retry(policy_.slippage_delay, token);
}

RecoveryOutcome ErrorRecovery::handle_swaps_paused(WorkerContext& context, const CancellationToken& token) {
    // Not a swap: nothing to record, the loop's normal delay applies
    if (context.kind != WorkerKind::Swap) {
        return {RecoveryVerdict::Fail, std::nullopt};
    }

    spdlog::info("Swaps are paused for pool {}, waiting", context.pool_id);
    const std::string pool_id = context.pool_id;
    return poll_until_clear([this, &pool_id] { return chain_.are_swaps_paused(pool_id); },
                            policy_.swaps_pause_max_polls, "swaps on pool " + pool_id, token);
}

RecoveryOutcome ErrorRecovery::handle_unknown(const ErrorClassification& classification, WorkerContext& context,
                                              const CancellationToken& token) {
    std::string description = classification.code
        ? "Unknown contract error: " + std::to_string(*classification.code)
        : std::string("Unclassified error");

    if (context.retry_count < policy_.unknown_error_max_retries) {
        context.retry_count++;
        spdlog::warn("{} for worker {}, retry {}/{}", description, context.worker_id,
                     context.retry_count, policy_.unknown_error_max_retries);
        return wait_then_retry(policy_.unknown_error_delay, token);
    }

    spdlog::error("{} for worker {}, retries exhausted", description, context.worker_id);
    context.retry_count = 0;
    return {RecoveryVerdict::Fail, description};
}

template <typename Check>
RecoveryOutcome ErrorRecovery::poll_until_clear(Check still_paused, int max_polls, const std::string& what,
                                                const CancellationToken& token) {
    int polls = 0;
    while (true) {
        bool paused = true;
        try {
            paused = still_paused();
        } catch (const std::exception& e) {
            spdlog::warn("Pause check for {} failed: {}", what, e.what());
        }

        if (!paused) {
            spdlog::info("{} is now unpaused, resuming operations", what);
            return {RecoveryVerdict::Retry, std::nullopt};
        }

        if (polls >= max_polls) {
            spdlog::error("Pause timeout for {} after {} polls", what, polls);
            return {RecoveryVerdict::Fail, "Timed out waiting for " + what + " to unpause"};
        }
        polls++;

        if (token.wait_for(policy_.poll_interval)) {
            return {RecoveryVerdict::Cancelled, std::nullopt};
        }

        if (polls % 4 == 0) {
            spdlog::info("Still waiting for {} to unpause ({} polls)", what, polls);
        }
    }
}

RecoveryOutcome ErrorRecovery::wait_then_retry(std::chrono::milliseconds delay, const CancellationToken& token) {
    if (token.wait_for(delay)) {
        return {RecoveryVerdict::Cancelled, std::nullopt};
    }
    return {RecoveryVerdict::Retry, std::nullopt};
}
