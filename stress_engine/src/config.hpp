#pragma once
#include <string>
#include <cstdint>
#include <stdexcept>

class Config {
public:
    // Service info
    std::string service_name = "stress_engine";
    std::string log_level = "info";

    // Persistent state (SQLite)
    std::string state_db_path = "./data/stress_engine.db";

    // Chain access: "simulated" runs against the in-process contract, "rpc" against a cluster
    std::string chain_mode = "simulated";
    std::string solana_rpc_url = "http://127.0.0.1:8899";
    std::string tx_gateway_url = "http://127.0.0.1:3030";
    std::string program_id = "4aeVqtWhrUh6wpX8acNj2hpWXKEQwxjA3PYb2sHhNyCn";
    std::string min_contract_version = "0.15.0";
    std::string max_contract_version = "0.19.99";

    // Redis command bus
    bool commands_enabled = true;
    std::string redis_url = "tcp://127.0.0.1:6379";
    std::string command_stream = "stress.cmd.requests";
    std::string reply_stream = "stress.cmd.replies";

    // PostgreSQL audit trail (optional)
    std::string pg_dsn;

    // Health check
    std::string health_host = "0.0.0.0";
    int health_port = 8085;

    // Worker loop pacing
    int worker_min_delay_ms = 750;
    int worker_max_delay_ms = 2000;

    // Recovery policy
    int poll_interval_seconds = 30;
    int pool_pause_max_polls = 120;
    int system_pause_max_polls = 240;
    int swaps_pause_max_polls = 60;
    int insufficient_funds_delay_ms = 5000;
    int liquidity_delay_ms = 10000;
    int slippage_delay_ms = 2000;
    int unknown_error_delay_ms = 5000;
    int unknown_error_max_retries = 3;
    double auto_refill_threshold = 0.1;

    // Wallet funding and drain
    uint64_t worker_sol_funding_lamports = 1000000000;
    uint64_t drain_fee_reserve_lamports = 5000;

    static Config from_env();
    void validate() const;
};
