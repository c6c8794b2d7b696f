#include "worker_pool.hpp"
#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

WorkerPoolOptions WorkerPoolOptions::from_config(const Config& config) {
    WorkerPoolOptions options;
    options.loop.min_delay = std::chrono::milliseconds(config.worker_min_delay_ms);
    options.loop.max_delay = std::chrono::milliseconds(config.worker_max_delay_ms);
    options.recovery = RecoveryPolicy::from_config(config);
    options.native_funding_lamports = config.worker_sol_funding_lamports;
    return options;
}

WorkerPool::WorkerPool(ChainClient& chain, StateStore& store, SystemState& system_state,
                       WorkerPoolOptions options, AuditLogger* audit)
    : chain_(chain),
      store_(store),
      system_state_(system_state),
      options_(std::move(options)),
      audit_(audit) {
    recover_persisted_workers();
}

WorkerPool::~WorkerPool() {
    try {
        force_stop_all();
    } catch (const std::exception& e) {
        spdlog::error("Error stopping workers during shutdown: {}", e.what());
    }
}

std::string WorkerPool::create(const WorkerConfig& config) {
    WorkerConfig worker = config;

    if (worker.pool_id.empty()) {
        throw std::invalid_argument("Worker config requires a pool id");
    }
    if (worker.kind == WorkerKind::Swap && !worker.swap_direction) {
        throw std::invalid_argument("Swap workers require a swap direction");
    }
    if (worker.kind != WorkerKind::Swap) {
        worker.swap_direction.reset();
    }

    try {
        chain_.get_pool_state(worker.pool_id);
    } catch (const ChainError& e) {
        throw std::invalid_argument("Pool " + worker.pool_id + " not found: " + e.what());
    }

    worker.worker_id = to_string(worker.kind) + "_" + util::random_hex(32);
    worker.wallet = chain_.generate_wallet();
    worker.status = WorkerStatus::Created;
    worker.created_at = std::chrono::system_clock::now();
    worker.last_operation_at.reset();

    auto record = std::make_shared<WorkerRecord>();
    record->config = worker;

    store_.save_worker(worker);
    store_.save_statistics(worker.worker_id, record->stats);

    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        records_[worker.worker_id] = record;
    }

    spdlog::info("Created {} worker {} on pool {} (wallet {})", to_string(worker.kind),
                 worker.worker_id, worker.pool_id, worker.wallet.public_key);
    return worker.worker_id;
}

void WorkerPool::start(const std::string& worker_id) {
    auto record = find_record(worker_id);

    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        if (!accepting_) {
            throw std::runtime_error("Cannot start worker " + worker_id + ": the engine is not running");
        }
        if (active_.count(worker_id) > 0) {
            throw std::runtime_error("Worker " + worker_id + " is already running");
        }
    }

    prepare_wallet(record);

    std::lock_guard<std::mutex> lock(active_mutex_);
    // Checked again under the lock so no worker slips in after the engine stops
    if (!accepting_) {
        throw std::runtime_error("Cannot start worker " + worker_id + ": the engine is not running");
    }
    if (active_.count(worker_id) > 0) {
        throw std::runtime_error("Worker " + worker_id + " is already running");
    }

    set_status(record, WorkerStatus::Running);

    auto runner = std::make_shared<WorkerRunner>(
        record, chain_, store_, system_state_, budgeter_, options_.recovery, options_.loop, core_wallet(),
        [this](const WorkerConfig& source) { return find_share_target(source); }, audit_);

    ActiveWorker worker;
    CancellationToken token = worker.source.token();
    worker.thread = std::thread([this, runner, record, token]() {
        try {
            runner->run(token);
        } catch (const std::exception& e) {
            spdlog::critical("Worker {} loop terminated: {}", record->config.worker_id, e.what());
            set_status(record, WorkerStatus::Error);
        }
    });
    active_.emplace(worker_id, std::move(worker));

    spdlog::info("Started worker {}", worker_id);
}

void WorkerPool::stop(const std::string& worker_id) {
    stop_with_status(worker_id, WorkerStatus::Stopped);
}

void WorkerPool::set_accepting(bool accepting) {
    std::lock_guard<std::mutex> lock(active_mutex_);
    accepting_ = accepting;
    spdlog::info("Worker pool {} new workers", accepting ? "accepting" : "no longer accepting");
}

void WorkerPool::force_stop_all() {
    std::vector<std::pair<std::string, ActiveWorker>> workers;
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        for (auto& entry : active_) {
            entry.second.source.cancel();
            workers.emplace_back(entry.first, std::move(entry.second));
        }
        active_.clear();
    }

    if (!workers.empty()) {
        spdlog::info("Force stopping {} workers", workers.size());
    }
    join_all(workers, WorkerStatus::Stopped);
}

void WorkerPool::delete_worker(const std::string& worker_id) {
    find_record(worker_id);
    if (is_running(worker_id)) {
        stop(worker_id);
    }

    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        records_.erase(worker_id);
    }
    store_.delete_worker(worker_id);
    spdlog::info("Deleted worker {}", worker_id);
}

WorkerConfig WorkerPool::get_config(const std::string& worker_id) const {
    auto record = find_record(worker_id);
    std::lock_guard<std::mutex> lock(record->mutex);
    return record->config;
}

std::vector<WorkerConfig> WorkerPool::list_all() const {
    std::vector<WorkerConfig> configs;
    std::lock_guard<std::mutex> lock(records_mutex_);
    for (const auto& entry : records_) {
        std::lock_guard<std::mutex> record_lock(entry.second->mutex);
        configs.push_back(entry.second->config);
    }
    return configs;
}

WorkerStatistics WorkerPool::get_statistics(const std::string& worker_id) const {
    auto record = find_record(worker_id);
    std::lock_guard<std::mutex> lock(record->mutex);
    return record->stats;
}

std::vector<std::string> WorkerPool::pause_running() {
    std::vector<std::pair<std::string, ActiveWorker>> workers;
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        for (auto& entry : active_) {
            entry.second.source.cancel();
            workers.emplace_back(entry.first, std::move(entry.second));
        }
        active_.clear();
    }

    std::vector<std::string> ids;
    for (const auto& entry : workers) {
        ids.push_back(entry.first);
    }
    join_all(workers, WorkerStatus::Paused);
    spdlog::info("Paused {} workers", ids.size());
    return ids;
}

void WorkerPool::resume_paused() {
    std::vector<std::string> paused;
    for (const auto& config : list_all()) {
        if (config.status == WorkerStatus::Paused) {
            paused.push_back(config.worker_id);
        }
    }

    for (const auto& id : paused) {
        try {
            start(id);
        } catch (const std::exception& e) {
            spdlog::error("Failed to resume worker {}: {}", id, e.what());
            auto record = find_record(id);
            set_status(record, WorkerStatus::Error);
        }
    }
    spdlog::info("Resumed {} workers", paused.size());
}

std::vector<std::string> WorkerPool::stop_all_for_pool(const std::string& pool_id, bool include_swaps) {
    std::vector<std::string> targets;
    for (const auto& config : list_all()) {
        if (config.pool_id != pool_id) continue;
        if (config.kind == WorkerKind::Swap && !include_swaps) continue;
        if (is_running(config.worker_id)) {
            targets.push_back(config.worker_id);
        }
    }

    for (const auto& id : targets) {
        stop(id);
    }
    spdlog::info("Stopped {} workers on pool {}", targets.size(), pool_id);
    return targets;
}

bool WorkerPool::is_running(const std::string& worker_id) const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    return active_.count(worker_id) > 0;
}

size_t WorkerPool::running_count() const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    return active_.size();
}

std::map<WorkerStatus, size_t> WorkerPool::status_counts() const {
    std::map<WorkerStatus, size_t> counts;
    for (const auto& config : list_all()) {
        counts[config.status]++;
    }
    return counts;
}

void WorkerPool::set_core_wallet(const WalletCredential& wallet) {
    std::lock_guard<std::mutex> lock(core_wallet_mutex_);
    core_wallet_ = wallet;
}

WalletCredential WorkerPool::core_wallet() const {
    std::lock_guard<std::mutex> lock(core_wallet_mutex_);
    return core_wallet_;
}

std::optional<std::string> WorkerPool::find_share_target(const WorkerConfig& source) const {
    std::vector<std::string> running;
    std::vector<std::string> others;

    for (const auto& config : list_all()) {
        if (config.worker_id == source.worker_id || config.pool_id != source.pool_id) {
            continue;
        }

        bool match = false;
        if (source.kind == WorkerKind::Deposit) {
            match = config.kind == WorkerKind::Withdrawal && config.token_side == source.token_side;
        } else if (source.kind == WorkerKind::Swap) {
            match = config.kind == WorkerKind::Swap && config.swap_direction && source.swap_direction &&
                    *config.swap_direction != *source.swap_direction;
        }
        if (!match) continue;

        if (config.status == WorkerStatus::Running) {
            running.push_back(config.wallet.public_key);
        } else {
            others.push_back(config.wallet.public_key);
        }
    }

    const auto& pool = running.empty() ? others : running;
    if (pool.empty()) {
        return std::nullopt;
    }
    return pool[util::random_between(0, pool.size() - 1)];
}

std::shared_ptr<WorkerRecord> WorkerPool::find_record(const std::string& worker_id) const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(worker_id);
    if (it == records_.end()) {
        throw std::out_of_range("Worker not found: " + worker_id);
    }
    return it->second;
}

void WorkerPool::set_status(const std::shared_ptr<WorkerRecord>& record, WorkerStatus status) {
    std::lock_guard<std::mutex> lock(record->mutex);
    record->config.status = status;
    try {
        store_.save_worker(record->config);
    } catch (const std::exception& e) {
        spdlog::error("Failed to persist status of worker {}: {}", record->config.worker_id, e.what());
    }
}

void WorkerPool::prepare_wallet(const std::shared_ptr<WorkerRecord>& record) {
    WorkerConfig config;
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        config = record->config;
    }

    WalletCredential restored = chain_.restore_wallet(config.wallet.secret_key);
    if (restored.public_key != config.wallet.public_key) {
        throw std::runtime_error("Wallet of worker " + config.worker_id + " does not match its stored public key");
    }

    const std::string& owner = config.wallet.public_key;
    WalletCredential core = core_wallet();

    uint64_t native = chain_.get_native_balance(owner);
    if (native < options_.min_native_balance) {
        bool funded = false;
        if (!core.empty()) {
            try {
                chain_.transfer_native(core, owner, options_.native_funding_lamports);
                funded = true;
                spdlog::info("Funded worker {} with {} lamports from core wallet",
                             config.worker_id, options_.native_funding_lamports);
            } catch (const std::exception& e) {
                spdlog::warn("Core wallet funding failed for {}: {}, falling back to airdrop",
                             config.worker_id, e.what());
            }
        }
        if (!funded) {
            chain_.request_airdrop(owner, options_.native_funding_lamports);
            spdlog::info("Airdropped {} lamports to worker {}", options_.native_funding_lamports, config.worker_id);
        }
    }

    if (config.kind == WorkerKind::Withdrawal || config.initial_amount == 0) {
        return;
    }

    PoolState pool = chain_.get_pool_state(config.pool_id);
    std::string mint = WorkerContext::from_config(config).input_mint(pool);
    if (chain_.get_token_balance(owner, mint) > 0) {
        return;
    }
    if (core.empty()) {
        spdlog::warn("Worker {} holds no tokens and no core wallet is loaded to mint them", config.worker_id);
        return;
    }
    chain_.mint_tokens(core, mint, owner, config.initial_amount);
    spdlog::info("Seeded worker {} with {} tokens", config.worker_id, config.initial_amount);
}

void WorkerPool::stop_with_status(const std::string& worker_id, WorkerStatus final_status) {
    auto record = find_record(worker_id);

    ActiveWorker worker;
    bool was_active = false;
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        auto it = active_.find(worker_id);
        if (it != active_.end()) {
            worker = std::move(it->second);
            active_.erase(it);
            was_active = true;
        }
    }

    if (!was_active) {
        WorkerStatus current;
        {
            std::lock_guard<std::mutex> lock(record->mutex);
            current = record->config.status;
        }
        if (current == WorkerStatus::Running || current == WorkerStatus::Paused ||
            current == WorkerStatus::Stopping) {
            set_status(record, final_status);
        }
        spdlog::debug("Worker {} was not running", worker_id);
        return;
    }

    set_status(record, WorkerStatus::Stopping);
    worker.source.cancel();
    if (worker.thread.joinable()) {
        worker.thread.join();
    }
    set_status(record, final_status);
    spdlog::info("Stopped worker {}", worker_id);
}

void WorkerPool::join_all(std::vector<std::pair<std::string, ActiveWorker>>& workers, WorkerStatus final_status) {
    for (auto& entry : workers) {
        if (entry.second.thread.joinable()) {
            entry.second.thread.join();
        }
        try {
            set_status(find_record(entry.first), final_status);
        } catch (const std::out_of_range&) {
            spdlog::debug("Worker {} was deleted while stopping", entry.first);
        }
    }
}

void WorkerPool::recover_persisted_workers() {
    auto configs = store_.load_workers();
    for (auto& config : configs) {
        // No loop survives a restart
        if (config.status == WorkerStatus::Running || config.status == WorkerStatus::Stopping) {
            config.status = WorkerStatus::Stopped;
            store_.save_worker(config);
        }

        auto record = std::make_shared<WorkerRecord>();
        record->config = config;
        if (auto stats = store_.load_statistics(config.worker_id)) {
            record->stats = *stats;
        }

        std::lock_guard<std::mutex> lock(records_mutex_);
        records_[config.worker_id] = record;
    }

    if (!configs.empty()) {
        spdlog::info("Recovered {} persisted workers", configs.size());
    }
}
