#include "config.hpp"
#include "types.hpp"
#include "system_state.hpp"
#include "sqlite_state_store.hpp"
#include "simulated_chain_client.hpp"
#include "solana_client.hpp"
#include "audit_logger.hpp"
#include "worker_pool.hpp"
#include "pool_manager.hpp"
#include "drain_handler.hpp"
#include "startup_routines.hpp"
#include "stress_engine.hpp"
#include "lifecycle_controller.hpp"
#include "command_handler.hpp"
#include "redis_bus.hpp"
#include "health.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
    g_shutdown_requested = true;
}

std::unique_ptr<ChainClient> make_chain_client(const Config& config) {
    if (config.chain_mode == "rpc") {
        spdlog::info("Using Solana RPC {} with transaction gateway {}", config.solana_rpc_url, config.tx_gateway_url);
        return std::make_unique<SolanaClient>(config.solana_rpc_url, config.tx_gateway_url, config.program_id);
    }
    spdlog::warn("Using the simulated chain: no transactions leave this process");
    return std::make_unique<SimulatedChainClient>();
}

} // namespace

int main() {
    try {
        // 1. Load configuration
        Config config = Config::from_env();
        config.validate();

        // 2. Setup logging
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
        spdlog::info("Log level set to '{}'", config.log_level);
        spdlog::info("Starting {}...", config.service_name);

        // 3. Register signal handlers for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 4. Build the long-lived collaborators
        SystemState system_state;
        SqliteStateStore store(config.state_db_path);
        auto chain = make_chain_client(config);

        std::unique_ptr<AuditLogger> audit;
        if (!config.pg_dsn.empty()) {
            audit = std::make_unique<AuditLogger>(config.pg_dsn);
        } else {
            spdlog::info("PG_DSN not set, audit log disabled");
        }

        WorkerPool workers(*chain, store, system_state, WorkerPoolOptions::from_config(config), audit.get());
        PoolManager pools(*chain, store, workers);

        DrainOptions drain_options;
        drain_options.fee_reserve_lamports = config.drain_fee_reserve_lamports;
        DrainHandler drainer(workers, *chain, drain_options, audit.get());

        auto engine_factory = [&]() {
            std::vector<std::unique_ptr<StartupRoutine>> routines;
            routines.push_back(std::make_unique<StateStoreStartup>(store));
            routines.push_back(std::make_unique<ContractVersionStartup>(
                *chain, config.min_contract_version, config.max_contract_version));
            routines.push_back(std::make_unique<CoreWalletStartup>(
                *chain, store, workers, 2 * kLamportsPerSol, 10 * kLamportsPerSol));
            routines.push_back(std::make_unique<PoolRegistryStartup>(pools));
            if (audit) {
                routines.push_back(std::make_unique<AuditLogStartup>(*audit));
            }
            return std::make_unique<StressEngine>(std::move(routines), workers);
        };

        LifecycleController lifecycle(engine_factory, workers, system_state);
        lifecycle.on_state_changed([](const StateChange& change) {
            spdlog::debug("State change: {}", change.to_json().dump());
        });

        // 5. Start the engine and the outer surfaces
        lifecycle.start();

        HealthServer health(config, lifecycle);
        health.start();

        CommandHandler commands(lifecycle, workers, pools, drainer);
        std::unique_ptr<RedisBus> bus;
        if (config.commands_enabled) {
            bus = std::make_unique<RedisBus>(config);
            if (bus->connect()) {
                bus->start_command_consumer([&commands](const nlohmann::json& request) {
                    return commands.handle_json(request);
                });
            } else {
                spdlog::warn("Command bus unavailable; continuing without remote commands");
            }
        }

        spdlog::info("{} is running", config.service_name);
        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        // 6. Shut down in reverse
        spdlog::info("Shutdown requested, stopping...");
        if (bus) {
            bus->stop_consumer();
        }
        health.stop();
        lifecycle.stop();

        spdlog::info("{} has shut down.", config.service_name);

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error during initialization or runtime: {}", e.what());
        return 1;
    }

    return 0;
}
