#pragma once
#include "state_store.hpp"
#include <memory>
#include <string>

class SqliteStateStore : public StateStore {
public:
    explicit SqliteStateStore(const std::string& db_path);
    ~SqliteStateStore() override;

    std::vector<WorkerConfig> load_workers() override;
    std::optional<WorkerConfig> load_worker(const std::string& worker_id) override;
    void save_worker(const WorkerConfig& config) override;
    void delete_worker(const std::string& worker_id) override;

    std::optional<WorkerStatistics> load_statistics(const std::string& worker_id) override;
    void save_statistics(const std::string& worker_id, const WorkerStatistics& stats) override;
    void append_error(const std::string& worker_id, const WorkerError& error) override;
    std::vector<WorkerError> load_errors(const std::string& worker_id, size_t limit) override;

    std::vector<PoolRegistryEntry> load_pools() override;
    void save_pool(const PoolRegistryEntry& entry) override;
    void delete_pool(const std::string& pool_id) override;

    std::optional<CoreWallet> load_core_wallet() override;
    void save_core_wallet(const CoreWallet& wallet) override;

    bool is_healthy() const override;

    // Non-copyable
    SqliteStateStore(const SqliteStateStore&) = delete;
    SqliteStateStore& operator=(const SqliteStateStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
