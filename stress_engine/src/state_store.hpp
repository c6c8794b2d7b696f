#pragma once
#include "types.hpp"
#include <string>
#include <vector>
#include <optional>

// Durable storage for worker records, pool registry and the core wallet.
// Implementations throw std::runtime_error on persistence failure.
class StateStore {
public:
    virtual ~StateStore() = default;

    // Workers
    virtual std::vector<WorkerConfig> load_workers() = 0;
    virtual std::optional<WorkerConfig> load_worker(const std::string& worker_id) = 0;
    virtual void save_worker(const WorkerConfig& config) = 0;
    // Removes the config together with its statistics and error history
    virtual void delete_worker(const std::string& worker_id) = 0;

    // Statistics and errors
    virtual std::optional<WorkerStatistics> load_statistics(const std::string& worker_id) = 0;
    virtual void save_statistics(const std::string& worker_id, const WorkerStatistics& stats) = 0;
    virtual void append_error(const std::string& worker_id, const WorkerError& error) = 0;
    virtual std::vector<WorkerError> load_errors(const std::string& worker_id, size_t limit) = 0;

    // Pool registry
    virtual std::vector<PoolRegistryEntry> load_pools() = 0;
    virtual void save_pool(const PoolRegistryEntry& entry) = 0;
    virtual void delete_pool(const std::string& pool_id) = 0;

    // Core wallet
    virtual std::optional<CoreWallet> load_core_wallet() = 0;
    virtual void save_core_wallet(const CoreWallet& wallet) = 0;

    virtual bool is_healthy() const = 0;
};
