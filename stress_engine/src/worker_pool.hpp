#pragma once
#include "types.hpp"
#include "chain_client.hpp"
#include "state_store.hpp"
#include "system_state.hpp"
#include "compute_budget.hpp"
#include "error_classifier.hpp"
#include "cancellation.hpp"
#include "worker_runner.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class Config;
class AuditLogger;

struct WorkerPoolOptions {
    WorkerLoopOptions loop;
    RecoveryPolicy recovery;
    uint64_t min_native_balance = kLamportsPerSol / 10;
    uint64_t native_funding_lamports = kLamportsPerSol;

    static WorkerPoolOptions from_config(const Config& config);
};

// Owns every worker record and the thread running each active worker.
// Lock order: active_mutex_, then records_mutex_, then a record's own mutex.
class WorkerPool {
public:
    WorkerPool(ChainClient& chain, StateStore& store, SystemState& system_state,
               WorkerPoolOptions options, AuditLogger* audit = nullptr);
    ~WorkerPool();

    // Validates the config, assigns an id and wallet, persists with zeroed statistics
    std::string create(const WorkerConfig& config);
    // Throws std::runtime_error while the pool is not accepting workers
    void start(const std::string& worker_id);
    void stop(const std::string& worker_id);
    void force_stop_all();
    void delete_worker(const std::string& worker_id);

    WorkerConfig get_config(const std::string& worker_id) const;
    std::vector<WorkerConfig> list_all() const;
    WorkerStatistics get_statistics(const std::string& worker_id) const;

    // Stops every running worker leaving it Paused; returns the ids paused
    std::vector<std::string> pause_running();
    // Starts every Paused worker again
    void resume_paused();
    // Stops running workers bound to a pool; swap workers only when include_swaps
    std::vector<std::string> stop_all_for_pool(const std::string& pool_id, bool include_swaps);

    // Opened by the lifecycle once an engine is up, closed before its workers are force stopped
    void set_accepting(bool accepting);
    bool is_accepting() const { return accepting_.load(); }

    bool is_running(const std::string& worker_id) const;
    size_t running_count() const;
    std::map<WorkerStatus, size_t> status_counts() const;

    void set_core_wallet(const WalletCredential& wallet);
    WalletCredential core_wallet() const;

    // Recipient for share-output: a withdrawal worker on the same pool and side
    // for deposits, a swap worker in the opposite direction for swaps
    std::optional<std::string> find_share_target(const WorkerConfig& source) const;

    const ResourceBudgeter& budgeter() const { return budgeter_; }

    // Non-copyable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

private:
    struct ActiveWorker {
        CancellationSource source;
        std::thread thread;
    };

    std::shared_ptr<WorkerRecord> find_record(const std::string& worker_id) const;
    void set_status(const std::shared_ptr<WorkerRecord>& record, WorkerStatus status);
    void prepare_wallet(const std::shared_ptr<WorkerRecord>& record);
    void stop_with_status(const std::string& worker_id, WorkerStatus final_status);
    void join_all(std::vector<std::pair<std::string, ActiveWorker>>& workers, WorkerStatus final_status);
    void recover_persisted_workers();

    ChainClient& chain_;
    StateStore& store_;
    SystemState& system_state_;
    WorkerPoolOptions options_;
    AuditLogger* audit_;
    ResourceBudgeter budgeter_;

    mutable std::mutex records_mutex_;
    std::map<std::string, std::shared_ptr<WorkerRecord>> records_;

    mutable std::mutex active_mutex_;
    std::map<std::string, ActiveWorker> active_;
    std::atomic<bool> accepting_{false};

    mutable std::mutex core_wallet_mutex_;
    WalletCredential core_wallet_;
};
