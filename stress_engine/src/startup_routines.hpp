#pragma once
#include "chain_client.hpp"
#include "state_store.hpp"
#include "worker_pool.hpp"
#include "pool_manager.hpp"
#include "audit_logger.hpp"
#include <atomic>
#include <string>

// A unit of engine startup. Routines start in order and stop in reverse.
class StartupRoutine {
public:
    virtual ~StartupRoutine() = default;

    virtual std::string name() const = 0;
    virtual void start() = 0;
    virtual void stop() {}
    virtual bool is_healthy() const { return true; }
};

// Refuses to start against a contract outside the supported version range
class ContractVersionStartup : public StartupRoutine {
public:
    ContractVersionStartup(ChainClient& chain, std::string min_version, std::string max_version);

    std::string name() const override { return "contract_version"; }
    void start() override;
    bool is_healthy() const override { return validated_.load(); }

private:
    ChainClient& chain_;
    std::string min_version_;
    std::string max_version_;
    std::atomic<bool> validated_{false};
};

class StateStoreStartup : public StartupRoutine {
public:
    explicit StateStoreStartup(StateStore& store);

    std::string name() const override { return "state_store"; }
    void start() override;
    bool is_healthy() const override;

private:
    StateStore& store_;
};

// Loads or creates the core wallet and hands it to the worker pool
class CoreWalletStartup : public StartupRoutine {
public:
    CoreWalletStartup(ChainClient& chain, StateStore& store, WorkerPool& workers,
                      uint64_t minimum_balance, uint64_t airdrop_amount);

    std::string name() const override { return "core_wallet"; }
    void start() override;
    bool is_healthy() const override { return loaded_.load(); }

private:
    ChainClient& chain_;
    StateStore& store_;
    WorkerPool& workers_;
    uint64_t minimum_balance_;
    uint64_t airdrop_amount_;
    std::atomic<bool> loaded_{false};
};

// Revalidates saved pools. Failure is logged; the engine still starts.
class PoolRegistryStartup : public StartupRoutine {
public:
    explicit PoolRegistryStartup(PoolManager& pools);

    std::string name() const override { return "pool_registry"; }
    void start() override;

private:
    PoolManager& pools_;
};

// Reports the audit database in engine health. An unreachable database never blocks startup.
class AuditLogStartup : public StartupRoutine {
public:
    explicit AuditLogStartup(AuditLogger& audit);

    std::string name() const override { return "audit_log"; }
    void start() override;
    bool is_healthy() const override;

private:
    AuditLogger& audit_;
};
