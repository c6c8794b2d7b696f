#pragma once
#include "types.hpp"
#include "chain_client.hpp"
#include "worker_pool.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

class AuditLogger;

struct DrainResult {
    std::string worker_id;
    bool nothing_to_drain = false;
    uint64_t burned_amount = 0;            // balance burned before the terminal operation
    std::string burn_signature;
    bool operation_attempted = false;
    bool operation_succeeded = false;
    uint64_t operation_input = 0;
    uint64_t operation_output = 0;
    uint64_t burned_output = 0;            // proceeds of the terminal operation, burned
    std::string operation_signature;
    std::string operation_error;
    std::string output_burn_error;         // set when the operation succeeded but its output was not burned
    uint64_t swept_lamports = 0;
    std::string sweep_error;

    nlohmann::json to_json() const;
};

struct DrainOptions {
    uint64_t fee_reserve_lamports = 5000;
};

// Decommissions a worker's holdings: burn the balance, run the closing
// operation with it, burn its output, then sweep native funds back.
// The first burn is final even when the operation fails.
class DrainHandler {
public:
    DrainHandler(WorkerPool& pool, ChainClient& chain, DrainOptions options, AuditLogger* audit = nullptr);

    DrainResult drain(const std::string& worker_id);

private:
    // Runs the closing operation; returns the mint and amount of its output
    std::pair<std::string, uint64_t> run_terminal_operation(const WorkerConfig& config, const PoolState& pool,
                                                            uint64_t amount, DrainResult& result);
    void sweep_native(const WorkerConfig& config, DrainResult& result);
    void audit(const DrainResult& result);

    WorkerPool& pool_;
    ChainClient& chain_;
    DrainOptions options_;
    AuditLogger* audit_;
};
