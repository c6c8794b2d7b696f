#pragma once
#include "stress_engine.hpp"
#include "system_state.hpp"
#include "worker_pool.hpp"
#include "types.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct StateChange {
    ServiceState previous = ServiceState::Stopped;
    ServiceState current = ServiceState::Stopped;
    std::string reason;
    std::string timestamp;

    nlohmann::json to_json() const;
};

// Top-level state machine. The engine exists only between a successful start and
// the next stop; every transition is serialized on one mutex.
class LifecycleController {
public:
    using EngineFactory = std::function<std::unique_ptr<StressEngine>()>;
    using StateObserver = std::function<void(const StateChange&)>;

    LifecycleController(EngineFactory factory, WorkerPool& workers, SystemState& system_state);
    ~LifecycleController();

    void start();
    void stop();
    void pause();
    void resume();

    // Does not take the transition mutex
    HealthStatus get_health() const;

    ServiceState state() const { return state_.load(); }

    void on_state_changed(StateObserver observer);

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

private:
    void change_state(ServiceState next, const std::string& reason);
    std::shared_ptr<StressEngine> current_engine() const;
    void set_engine(std::shared_ptr<StressEngine> engine);

    EngineFactory factory_;
    WorkerPool& workers_;
    SystemState& system_state_;

    std::mutex transition_mutex_;
    std::atomic<ServiceState> state_{ServiceState::Stopped};

    mutable std::mutex engine_mutex_;
    std::shared_ptr<StressEngine> engine_;

    mutable std::mutex observers_mutex_;
    std::vector<StateObserver> observers_;
};
