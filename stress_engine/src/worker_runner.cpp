#include "worker_runner.hpp"
#include "audit_logger.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

// Uniform amount in [low, high] where both bounds are at least 1
uint64_t pick_amount(uint64_t low, uint64_t high) {
    low = std::max<uint64_t>(low, 1);
    high = std::max<uint64_t>(high, low);
    return util::random_between(low, high);
}

} // namespace

WorkerRunner::WorkerRunner(std::shared_ptr<WorkerRecord> record,
                           ChainClient& chain,
                           StateStore& store,
                           const SystemState& system_state,
                           const ResourceBudgeter& budgeter,
                           RecoveryPolicy policy,
                           WorkerLoopOptions options,
                           WalletCredential core_wallet,
                           ShareTargetResolver share_target,
                           AuditLogger* audit)
    : record_(std::move(record)),
      chain_(chain),
      store_(store),
      system_state_(system_state),
      budgeter_(budgeter),
      recovery_(chain, std::move(policy)),
      options_(options),
      core_wallet_(std::move(core_wallet)),
      share_target_(std::move(share_target)),
      audit_(audit) {}

void WorkerRunner::run(const CancellationToken& token) {
    WorkerContext context = build_context();
    spdlog::info("Worker {} loop started ({} on pool {})", context.worker_id,
                 to_string(context.kind), context.pool_id);

    bool retrying = false;
    while (!token.is_cancelled()) {
        if (system_state_.is_paused()) {
            if (token.wait_for(options_.pause_check_interval)) {
                break;
            }
            continue;
        }

        // Rebuilt every iteration; runtime fields survive only within a retry chain
        WorkerContext fresh = build_context();
        if (retrying) {
            fresh.slippage_tolerance = context.slippage_tolerance;
            fresh.retry_count = context.retry_count;
            fresh.last_operation = context.last_operation;
        }
        context = std::move(fresh);

        try {
            auto result = execute_once(context);
            if (result) {
                record_success(*result);
                spdlog::debug("Worker {} {} ok: in={} out={} sig={}", context.worker_id, context.last_operation,
                              result->input_amount, result->output_amount, result->signature);
            }
            context.reset_runtime();
            retrying = false;
        } catch (const std::exception& e) {
            std::string message = e.what();
            record_failure(message);

            auto classification = ErrorClassifier::classify(message);
            spdlog::warn("Worker {} {} failed ({}): {}", context.worker_id, context.last_operation,
                         to_string(classification.kind), message);

            auto outcome = recovery_.handle(classification, context, token);
            if (outcome.error_to_record) {
                record_error(*outcome.error_to_record, context.last_operation);
            }

            if (outcome.verdict == RecoveryVerdict::Cancelled) {
                break;
            }
            if (outcome.verdict == RecoveryVerdict::Retry) {
                retrying = true;
                continue;
            }
            retrying = false;
            context.reset_runtime();
        }

        auto delay = std::chrono::milliseconds(util::random_int(
            static_cast<int>(options_.min_delay.count()), static_cast<int>(options_.max_delay.count())));
        if (token.wait_for(delay)) {
            break;
        }
    }

    spdlog::info("Worker {} loop exited", context.worker_id);
}

std::optional<OperationResult> WorkerRunner::execute_once(WorkerContext& context) {
    PoolState pool = chain_.get_pool_state(context.pool_id);

    switch (context.kind) {
        case WorkerKind::Deposit:
            context.last_operation = "deposit";
            return run_deposit(context, pool);
        case WorkerKind::Withdrawal:
            context.last_operation = "withdrawal";
            return run_withdrawal(context, pool);
        case WorkerKind::Swap:
            context.last_operation = "swap";
            return run_swap(context, pool);
    }
    return std::nullopt;
}

std::optional<OperationResult> WorkerRunner::run_deposit(WorkerContext& context, const PoolState& pool) {
    const std::string& mint = pool.token_mint(context.token_side);
    uint64_t balance = spendable_balance(context, mint);
    if (balance == 0) {
        spdlog::debug("Worker {} has no token {} to deposit", context.worker_id, to_string(context.token_side));
        return std::nullopt;
    }

    // 1 bp .. 5% of the balance
    uint64_t amount = pick_amount(balance / 10000, balance / 20);
    uint32_t units = budgeter_.get_budget("process_liquidity_deposit");
    OperationResult result = chain_.deposit(context.wallet, context.pool_id, context.token_side, amount, units);

    if (context.share_output && result.output_amount > 0) {
        share_output(context, pool.lp_mint(context.token_side), result.output_amount);
    }
    return result;
}

std::optional<OperationResult> WorkerRunner::run_withdrawal(WorkerContext& context, const PoolState& pool) {
    const std::string& lp_mint = pool.lp_mint(context.token_side);
    uint64_t lp_balance = chain_.get_token_balance(context.wallet.public_key, lp_mint);
    if (lp_balance == 0) {
        spdlog::debug("Worker {} holds no LP tokens, idle", context.worker_id);
        return std::nullopt;
    }

    // 1% .. 5% of LP holdings
    uint64_t amount = pick_amount(lp_balance / 100, lp_balance / 20);
    uint32_t units = budgeter_.get_budget("process_liquidity_withdraw");
    return chain_.withdraw(context.wallet, context.pool_id, context.token_side, amount, units);
}

std::optional<OperationResult> WorkerRunner::run_swap(WorkerContext& context, const PoolState& pool) {
    SwapDirection direction = context.swap_direction.value_or(SwapDirection::AToB);
    std::string input_mint = context.input_mint(pool);
    uint64_t balance = spendable_balance(context, input_mint);
    if (balance == 0) {
        spdlog::debug("Worker {} has no input tokens to swap", context.worker_id);
        return std::nullopt;
    }

    // 1 bp .. 2% of the balance
    uint64_t amount = pick_amount(balance / 10000, balance / 50);
    uint64_t expected = pool.swap_output(direction, amount);
    auto minimum_output = static_cast<uint64_t>(static_cast<double>(expected) * (1.0 - context.slippage_tolerance));
    uint32_t units = budgeter_.get_budget("process_swap_execute");

    OperationResult result = chain_.swap(context.wallet, context.pool_id, direction, amount, minimum_output, units);

    if (context.share_output && result.output_amount > 0) {
        const std::string& output_mint = direction == SwapDirection::AToB ? pool.token_b_mint : pool.token_a_mint;
        share_output(context, output_mint, result.output_amount);
    }
    return result;
}

uint64_t WorkerRunner::spendable_balance(WorkerContext& context, const std::string& mint) {
    uint64_t balance = chain_.get_token_balance(context.wallet.public_key, mint);
    if (balance > 0 || !context.auto_refill || context.initial_amount == 0) {
        return balance;
    }
    if (core_wallet_.empty()) {
        spdlog::warn("Worker {} needs a refill but no core wallet is loaded", context.worker_id);
        return 0;
    }

    spdlog::info("Auto-refill: minting {} tokens for worker {}", context.initial_amount, context.worker_id);
    chain_.mint_tokens(core_wallet_, mint, context.wallet.public_key, context.initial_amount);
    return chain_.get_token_balance(context.wallet.public_key, mint);
}

void WorkerRunner::share_output(const WorkerContext& context, const std::string& mint, uint64_t amount) {
    WorkerConfig self;
    {
        std::lock_guard<std::mutex> lock(record_->mutex);
        self = record_->config;
    }

    auto target = share_target_ ? share_target_(self) : std::nullopt;
    if (!target) {
        spdlog::debug("Worker {} has no peer to share {} tokens with", context.worker_id, amount);
        return;
    }

    try {
        chain_.transfer_tokens(context.wallet, *target, mint, amount);
        spdlog::debug("Worker {} shared {} tokens with {}", context.worker_id, amount, *target);
    } catch (const std::exception& e) {
        spdlog::warn("Worker {} failed to share output: {}", context.worker_id, e.what());
    }
}

WorkerContext WorkerRunner::build_context() {
    WorkerContext context;
    {
        std::lock_guard<std::mutex> lock(record_->mutex);
        context = WorkerContext::from_config(record_->config);
    }
    context.mint_authority = core_wallet_;
    return context;
}

void WorkerRunner::record_success(const OperationResult& result) {
    std::lock_guard<std::mutex> lock(record_->mutex);
    auto now = std::chrono::system_clock::now();
    auto& stats = record_->stats;
    stats.successful_operations++;
    stats.total_volume_processed += result.input_amount;
    stats.total_fees_paid += result.network_fee + result.pool_fee;
    stats.last_operation_at = now;
    record_->config.last_operation_at = now;
    persist_locked();
}

void WorkerRunner::record_failure(const std::string& message) {
    std::lock_guard<std::mutex> lock(record_->mutex);
    auto now = std::chrono::system_clock::now();
    auto& stats = record_->stats;
    stats.failed_operations++;
    stats.last_error = message;
    stats.last_operation_at = now;
    record_->config.last_operation_at = now;
    persist_locked();
}

void WorkerRunner::record_error(const std::string& message, const std::string& operation) {
    WorkerError error;
    error.timestamp = std::chrono::system_clock::now();
    error.message = message;
    error.operation_type = operation;

    std::string worker_id;
    {
        std::lock_guard<std::mutex> lock(record_->mutex);
        worker_id = record_->config.worker_id;
        record_->stats.add_error(error);
        persist_locked();
        try {
            store_.append_error(worker_id, error);
        } catch (const std::exception& e) {
            spdlog::error("Failed to persist error for worker {}: {}", worker_id, e.what());
        }
    }

    if (audit_) {
        AuditEvent event;
        event.timestamp = error.timestamp;
        event.worker_id = worker_id;
        event.event_type = "worker_error";
        event.outcome = "failed";
        event.details = error.to_json();
        audit_->log_event(event);
    }
}

void WorkerRunner::persist_locked() {
    try {
        store_.save_statistics(record_->config.worker_id, record_->stats);
        store_.save_worker(record_->config);
    } catch (const std::exception& e) {
        spdlog::error("Failed to persist worker {}: {}", record_->config.worker_id, e.what());
    }
}
