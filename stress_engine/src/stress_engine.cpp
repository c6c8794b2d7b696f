#include "stress_engine.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

StressEngine::StressEngine(std::vector<std::unique_ptr<StartupRoutine>> routines, WorkerPool& workers)
    : routines_(std::move(routines)), workers_(workers) {}

StressEngine::~StressEngine() {
    if (running_) {
        stop();
    }
}

void StressEngine::start() {
    spdlog::info("Starting engine with {} startup routines", routines_.size());
    started_count_ = 0;

    for (auto& routine : routines_) {
        spdlog::debug("Starting routine '{}'", routine->name());
        try {
            routine->start();
        } catch (const std::exception& e) {
            spdlog::error("Startup routine '{}' failed: {}", routine->name(), e.what());
            stop_started(started_count_);
            started_count_ = 0;
            throw;
        }
        ++started_count_;
    }

    running_ = true;
    spdlog::info("Engine started");
}

void StressEngine::stop() {
    spdlog::info("Stopping engine");
    stop_started(started_count_);
    started_count_ = 0;
    running_ = false;
}

void StressEngine::stop_started(size_t count) {
    for (size_t i = count; i > 0; --i) {
        auto& routine = routines_[i - 1];
        try {
            routine->stop();
        } catch (const std::exception& e) {
            spdlog::error("Failed to stop routine '{}': {}", routine->name(), e.what());
        }
    }
}

HealthStatus StressEngine::get_health() const {
    HealthStatus health;
    health.timestamp = util::current_iso8601();

    nlohmann::json routines = nlohmann::json::object();
    bool routines_healthy = true;
    for (const auto& routine : routines_) {
        bool ok = routine->is_healthy();
        routines[routine->name()] = ok ? "healthy" : "unhealthy";
        routines_healthy = routines_healthy && ok;
    }

    auto counts = workers_.status_counts();
    size_t total = 0;
    nlohmann::json by_status = nlohmann::json::object();
    for (const auto& [status, count] : counts) {
        by_status[to_string(status)] = count;
        total += count;
    }
    size_t failed = 0;
    if (auto it = counts.find(WorkerStatus::Failed); it != counts.end()) failed += it->second;
    if (auto it = counts.find(WorkerStatus::Error); it != counts.end()) failed += it->second;

    health.metrics["routines"] = routines;
    health.metrics["workers_total"] = total;
    health.metrics["workers_running"] = workers_.running_count();
    health.metrics["workers_failed"] = failed;
    health.metrics["workers_by_status"] = by_status;

    if (!running_ || !routines_healthy) {
        health.status = "Unhealthy";
        health.healthy = false;
    } else if (total > 0 && failed * 2 > total) {
        health.status = "Degraded";
        health.healthy = false;
    } else {
        health.status = "Healthy";
        health.healthy = true;
    }
    return health;
}
