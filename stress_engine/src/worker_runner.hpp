#pragma once
#include "types.hpp"
#include "chain_client.hpp"
#include "state_store.hpp"
#include "system_state.hpp"
#include "compute_budget.hpp"
#include "error_classifier.hpp"
#include "cancellation.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <chrono>

class AuditLogger;

// Live state of one worker. Status is written by the pool, statistics and
// last-operation time by the worker's own loop; both under `mutex`.
struct WorkerRecord {
    std::mutex mutex;
    WorkerConfig config;
    WorkerStatistics stats;
};

struct WorkerLoopOptions {
    std::chrono::milliseconds min_delay{750};
    std::chrono::milliseconds max_delay{2000};
    std::chrono::milliseconds pause_check_interval{1000};
};

// Resolves the wallet that should receive a worker's output when share-output is on
using ShareTargetResolver = std::function<std::optional<std::string>(const WorkerConfig&)>;

// Body of a worker thread. Loops until cancelled; an operation failure never ends the loop.
class WorkerRunner {
public:
    WorkerRunner(std::shared_ptr<WorkerRecord> record,
                 ChainClient& chain,
                 StateStore& store,
                 const SystemState& system_state,
                 const ResourceBudgeter& budgeter,
                 RecoveryPolicy policy,
                 WorkerLoopOptions options,
                 WalletCredential core_wallet,
                 ShareTargetResolver share_target,
                 AuditLogger* audit = nullptr);

    void run(const CancellationToken& token);

    // One operation for the worker's kind. Returns nothing when there was
    // nothing to do (empty balance without auto-refill).
    std::optional<OperationResult> execute_once(WorkerContext& context);

private:
    std::optional<OperationResult> run_deposit(WorkerContext& context, const PoolState& pool);
    std::optional<OperationResult> run_withdrawal(WorkerContext& context, const PoolState& pool);
    std::optional<OperationResult> run_swap(WorkerContext& context, const PoolState& pool);

    // Current balance of `mint`, minting the initial amount first when empty and auto-refill is on
    uint64_t spendable_balance(WorkerContext& context, const std::string& mint);
    void share_output(const WorkerContext& context, const std::string& mint, uint64_t amount);

    WorkerContext build_context();
    void record_success(const OperationResult& result);
    void record_failure(const std::string& message);
    void record_error(const std::string& message, const std::string& operation);
    void persist_locked();

    std::shared_ptr<WorkerRecord> record_;
    ChainClient& chain_;
    StateStore& store_;
    const SystemState& system_state_;
    const ResourceBudgeter& budgeter_;
    ErrorRecovery recovery_;
    WorkerLoopOptions options_;
    WalletCredential core_wallet_;
    ShareTargetResolver share_target_;
    AuditLogger* audit_;
};
