#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = util::get_env_var("SERVICE_NAME", "stress_engine");
    config.log_level = util::get_env_var("LOG_LEVEL", "info");

    // State
    config.state_db_path = util::get_env_var("STATE_DB_PATH", "./data/stress_engine.db");

    // Chain
    config.chain_mode = util::to_lower(util::get_env_var("CHAIN_MODE", "simulated"));
    config.solana_rpc_url = util::get_env_var("SOLANA_RPC_URL", "http://127.0.0.1:8899");
    config.tx_gateway_url = util::get_env_var("TX_GATEWAY_URL", "http://127.0.0.1:3030");
    config.program_id = util::get_env_var("PROGRAM_ID", config.program_id);
    config.min_contract_version = util::get_env_var("MIN_CONTRACT_VERSION", config.min_contract_version);
    config.max_contract_version = util::get_env_var("MAX_CONTRACT_VERSION", config.max_contract_version);

    // Redis
    config.commands_enabled = util::get_env_bool("COMMANDS_ENABLED", true);
    config.redis_url = util::get_env_var("REDIS_URL", "tcp://127.0.0.1:6379");
    config.command_stream = util::get_env_var("COMMAND_STREAM", "stress.cmd.requests");
    config.reply_stream = util::get_env_var("REPLY_STREAM", "stress.cmd.replies");

    // Postgres
    config.pg_dsn = util::get_env_var("PG_DSN");

    // Health
    config.health_host = util::get_env_var("HEALTH_HOST", "0.0.0.0");
    config.health_port = util::get_env_int("HEALTH_PORT", 8085);

    // Worker pacing
    config.worker_min_delay_ms = util::get_env_int("WORKER_MIN_DELAY_MS", 750);
    config.worker_max_delay_ms = util::get_env_int("WORKER_MAX_DELAY_MS", 2000);

    // Recovery
    config.poll_interval_seconds = util::get_env_int("POLL_INTERVAL_SECONDS", 30);
    config.pool_pause_max_polls = util::get_env_int("POOL_PAUSE_MAX_POLLS", 120);
    config.system_pause_max_polls = util::get_env_int("SYSTEM_PAUSE_MAX_POLLS", 240);
    config.swaps_pause_max_polls = util::get_env_int("SWAPS_PAUSE_MAX_POLLS", 60);
    config.insufficient_funds_delay_ms = util::get_env_int("INSUFFICIENT_FUNDS_DELAY_MS", 5000);
    config.liquidity_delay_ms = util::get_env_int("LIQUIDITY_DELAY_MS", 10000);
    config.slippage_delay_ms = util::get_env_int("SLIPPAGE_DELAY_MS", 2000);
    config.unknown_error_delay_ms = util::get_env_int("UNKNOWN_ERROR_DELAY_MS", 5000);
    config.unknown_error_max_retries = util::get_env_int("UNKNOWN_ERROR_MAX_RETRIES", 3);
    config.auto_refill_threshold = util::get_env_double("AUTO_REFILL_THRESHOLD", 0.1);

    // Funding / drain
    config.worker_sol_funding_lamports = util::get_env_u64("WORKER_SOL_FUNDING_LAMPORTS", 1000000000);
    config.drain_fee_reserve_lamports = util::get_env_u64("DRAIN_FEE_RESERVE_LAMPORTS", 5000);

    return config;
}

void Config::validate() const {
    if (state_db_path.empty()) {
        throw std::runtime_error("STATE_DB_PATH cannot be empty");
    }

    if (chain_mode != "simulated" && chain_mode != "rpc") {
        throw std::runtime_error("CHAIN_MODE must be 'simulated' or 'rpc'");
    }

    if (chain_mode == "rpc" && (solana_rpc_url.empty() || tx_gateway_url.empty())) {
        throw std::runtime_error("SOLANA_RPC_URL and TX_GATEWAY_URL are required in rpc mode");
    }

    if (commands_enabled && redis_url.empty()) {
        throw std::runtime_error("REDIS_URL is required when commands are enabled");
    }

    if (health_port < 0 || health_port > 65535) {
        throw std::runtime_error("HEALTH_PORT must be between 0 and 65535");
    }

    if (worker_min_delay_ms < 0 || worker_max_delay_ms < worker_min_delay_ms) {
        throw std::runtime_error("Worker delay range is invalid");
    }

    if (poll_interval_seconds < 1) {
        throw std::runtime_error("POLL_INTERVAL_SECONDS must be at least 1");
    }

    if (pool_pause_max_polls < 1 || system_pause_max_polls < 1 || swaps_pause_max_polls < 1) {
        throw std::runtime_error("Pause poll caps must be positive");
    }

    if (unknown_error_max_retries < 0) {
        throw std::runtime_error("UNKNOWN_ERROR_MAX_RETRIES cannot be negative");
    }

    if (auto_refill_threshold < 0.0 || auto_refill_threshold > 1.0) {
        throw std::runtime_error("AUTO_REFILL_THRESHOLD must be between 0 and 1");
    }

    spdlog::info("Configuration validated successfully");
}
