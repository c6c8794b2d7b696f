#pragma once
#include "startup_routines.hpp"
#include "worker_pool.hpp"
#include "types.hpp"
#include <atomic>
#include <memory>
#include <vector>

// One engine instance: an ordered set of startup routines over a worker pool.
// Created and disposed as a unit by the lifecycle controller.
class StressEngine {
public:
    StressEngine(std::vector<std::unique_ptr<StartupRoutine>> routines, WorkerPool& workers);
    ~StressEngine();

    // Starts routines in order. If one throws, the ones already started are
    // stopped in reverse and the error is rethrown.
    void start();
    // Stops started routines in reverse order
    void stop();

    bool is_running() const { return running_.load(); }

    // Unhealthy if any routine is; Degraded when more than half of all workers are Failed or Error
    HealthStatus get_health() const;

    StressEngine(const StressEngine&) = delete;
    StressEngine& operator=(const StressEngine&) = delete;

private:
    void stop_started(size_t count);

    std::vector<std::unique_ptr<StartupRoutine>> routines_;
    WorkerPool& workers_;
    std::atomic<bool> running_{false};
    size_t started_count_ = 0;
};
