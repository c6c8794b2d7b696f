#include "drain_handler.hpp"
#include "audit_logger.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

json DrainResult::to_json() const {
    return {
        {"worker_id", worker_id},
        {"nothing_to_drain", nothing_to_drain},
        {"burned_amount", burned_amount},
        {"burn_signature", burn_signature},
        {"operation_attempted", operation_attempted},
        {"operation_succeeded", operation_succeeded},
        {"operation_input", operation_input},
        {"operation_output", operation_output},
        {"burned_output", burned_output},
        {"operation_signature", operation_signature},
        {"operation_error", operation_error},
        {"output_burn_error", output_burn_error},
        {"swept_lamports", swept_lamports},
        {"sweep_error", sweep_error}
    };
}

DrainHandler::DrainHandler(WorkerPool& pool, ChainClient& chain, DrainOptions options, AuditLogger* audit)
    : pool_(pool), chain_(chain), options_(options), audit_(audit) {}

DrainResult DrainHandler::drain(const std::string& worker_id) {
    WorkerConfig config = pool_.get_config(worker_id);

    if (pool_.is_running(worker_id)) {
        spdlog::info("Stopping worker {} before drain", worker_id);
        pool_.stop(worker_id);
        config = pool_.get_config(worker_id);
    }

    DrainResult result;
    result.worker_id = worker_id;

    PoolState pool = chain_.get_pool_state(config.pool_id);
    std::string mint;
    if (config.kind == WorkerKind::Withdrawal) {
        mint = pool.lp_mint(config.token_side);
    } else {
        mint = WorkerContext::from_config(config).input_mint(pool);
    }

    uint64_t balance = chain_.get_token_balance(config.wallet.public_key, mint);
    if (balance == 0) {
        spdlog::info("Worker {} has nothing to drain", worker_id);
        result.nothing_to_drain = true;
        audit(result);
        return result;
    }

    // The burn is recorded before the terminal operation runs
    result.burn_signature = chain_.transfer_tokens(config.wallet, kBurnAddress, mint, balance);
    result.burned_amount = balance;
    spdlog::info("Drain {}: burned {} tokens of {}", worker_id, balance, mint);

    result.operation_attempted = true;
    std::pair<std::string, uint64_t> output;
    try {
        output = run_terminal_operation(config, pool, balance, result);
        result.operation_succeeded = true;
    } catch (const std::exception& e) {
        result.operation_error = e.what();
        spdlog::error("Drain {}: terminal operation failed: {}", worker_id, e.what());
    }

    if (result.operation_succeeded && output.second > 0) {
        try {
            chain_.transfer_tokens(config.wallet, kBurnAddress, output.first, output.second);
            result.burned_output = output.second;
            spdlog::info("Drain {}: burned {} output tokens of {}", worker_id, output.second, output.first);
        } catch (const std::exception& e) {
            result.output_burn_error = e.what();
            spdlog::error("Drain {}: burning {} output tokens failed: {}", worker_id, output.second, e.what());
        }
    }

    sweep_native(config, result);
    audit(result);
    return result;
}

std::pair<std::string, uint64_t> DrainHandler::run_terminal_operation(const WorkerConfig& config, const PoolState& pool,
                                                                     uint64_t amount, DrainResult& result) {
    const ResourceBudgeter& budgeter = pool_.budgeter();
    OperationResult op;
    std::string output_mint;

    switch (config.kind) {
        case WorkerKind::Deposit:
            op = chain_.deposit(config.wallet, config.pool_id, config.token_side, amount,
                                budgeter.get_budget("process_liquidity_deposit"));
            output_mint = pool.lp_mint(config.token_side);
            break;
        case WorkerKind::Withdrawal:
            op = chain_.withdraw(config.wallet, config.pool_id, config.token_side, amount,
                                 budgeter.get_budget("process_liquidity_withdraw"));
            output_mint = pool.token_mint(config.token_side);
            break;
        case WorkerKind::Swap: {
            SwapDirection direction = config.swap_direction.value_or(SwapDirection::AToB);
            op = chain_.swap(config.wallet, config.pool_id, direction, amount, 0,
                             budgeter.get_budget("process_swap_execute"));
            output_mint = direction == SwapDirection::AToB ? pool.token_b_mint : pool.token_a_mint;
            break;
        }
    }

    result.operation_signature = op.signature;
    result.operation_input = op.input_amount;
    result.operation_output = op.output_amount;
    return {output_mint, op.output_amount};
}

void DrainHandler::sweep_native(const WorkerConfig& config, DrainResult& result) {
    WalletCredential core = pool_.core_wallet();
    if (core.empty()) {
        result.sweep_error = "no core wallet loaded";
        spdlog::warn("Drain {}: skipping native sweep, no core wallet", config.worker_id);
        return;
    }

    try {
        uint64_t native = chain_.get_native_balance(config.wallet.public_key);
        if (native <= options_.fee_reserve_lamports) {
            return;
        }
        uint64_t amount = native - options_.fee_reserve_lamports;
        chain_.transfer_native(config.wallet, core.public_key, amount);
        result.swept_lamports = amount;
        spdlog::info("Drain {}: swept {} lamports to core wallet", config.worker_id, amount);
    } catch (const std::exception& e) {
        result.sweep_error = e.what();
        spdlog::error("Drain {}: native sweep failed: {}", config.worker_id, e.what());
    }
}

void DrainHandler::audit(const DrainResult& result) {
    if (!audit_) {
        return;
    }
    AuditEvent event;
    event.worker_id = result.worker_id;
    event.event_type = "drain";
    if (result.nothing_to_drain) {
        event.outcome = "nothing_to_drain";
    } else if (!result.operation_succeeded) {
        event.outcome = "operation_failed";
    } else {
        event.outcome = result.output_burn_error.empty() ? "completed" : "output_burn_failed";
    }
    event.details = result.to_json();
    audit_->log_event(event);
}
