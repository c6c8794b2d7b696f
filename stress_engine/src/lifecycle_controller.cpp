#include "lifecycle_controller.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

nlohmann::json StateChange::to_json() const {
    return {
        {"previous", to_string(previous)},
        {"current", to_string(current)},
        {"reason", reason},
        {"timestamp", timestamp}
    };
}

LifecycleController::LifecycleController(EngineFactory factory, WorkerPool& workers, SystemState& system_state)
    : factory_(std::move(factory)), workers_(workers), system_state_(system_state) {
    system_state_.update(ServiceState::Stopped);
}

LifecycleController::~LifecycleController() {
    try {
        stop();
    } catch (const std::exception& e) {
        spdlog::error("Error stopping lifecycle controller during shutdown: {}", e.what());
    }
}

void LifecycleController::start() {
    std::lock_guard<std::mutex> lock(transition_mutex_);

    ServiceState current = state_.load();
    if (current != ServiceState::Stopped) {
        spdlog::warn("Start ignored because state is {}", to_string(current));
        return;
    }

    change_state(ServiceState::Starting, "Creating engine");
    std::shared_ptr<StressEngine> engine;
    try {
        engine = factory_();
        engine->start();
    } catch (const std::exception& e) {
        spdlog::error("Engine failed to start: {}", e.what());
        engine.reset();
        set_engine(nullptr);
        workers_.set_accepting(false);
        change_state(ServiceState::Error, e.what());
        throw;
    }

    set_engine(engine);
    workers_.set_accepting(true);
    change_state(ServiceState::Started, "Engine started");
    spdlog::info("System started");
}

void LifecycleController::stop() {
    std::lock_guard<std::mutex> lock(transition_mutex_);

    if (state_.load() == ServiceState::Stopped) {
        return;
    }

    spdlog::warn("Stopping system: all workers will be terminated");
    change_state(ServiceState::Stopping, "Stopping and destroying engine");

    try {
        workers_.set_accepting(false);
        workers_.force_stop_all();
    } catch (const std::exception& e) {
        spdlog::error("Failed to force stop workers: {}", e.what());
        change_state(ServiceState::Error, e.what());
        throw;
    }

    auto engine = current_engine();
    set_engine(nullptr);
    if (engine) {
        try {
            engine->stop();
        } catch (const std::exception& e) {
            spdlog::error("Error stopping engine: {}", e.what());
        }
    }

    change_state(ServiceState::Stopped, "Engine destroyed and system stopped");
    spdlog::info("System stopped");
}

void LifecycleController::pause() {
    std::lock_guard<std::mutex> lock(transition_mutex_);

    ServiceState current = state_.load();
    if (current != ServiceState::Started) {
        spdlog::warn("Pause ignored because state is {}", to_string(current));
        return;
    }

    change_state(ServiceState::Pausing, "Pausing worker operations");
    try {
        auto paused = workers_.pause_running();
        spdlog::info("Paused {} running workers", paused.size());
    } catch (const std::exception& e) {
        spdlog::error("Failed to pause workers: {}", e.what());
        change_state(ServiceState::Error, e.what());
        throw;
    }
    change_state(ServiceState::Paused, "System paused");
}

void LifecycleController::resume() {
    std::lock_guard<std::mutex> lock(transition_mutex_);

    ServiceState current = state_.load();
    if (current != ServiceState::Paused) {
        spdlog::warn("Resume ignored because state is {}", to_string(current));
        return;
    }

    change_state(ServiceState::Resuming, "Resuming worker operations");
    try {
        workers_.resume_paused();
    } catch (const std::exception& e) {
        spdlog::error("Failed to resume workers: {}", e.what());
        change_state(ServiceState::Error, e.what());
        throw;
    }
    change_state(ServiceState::Started, "System resumed");
}

HealthStatus LifecycleController::get_health() const {
    bool paused = system_state_.is_paused();
    ServiceState current = state_.load();

    if (auto engine = current_engine()) {
        HealthStatus health = engine->get_health();
        health.metrics["system_paused"] = paused;
        health.metrics["engine_exists"] = true;
        health.metrics["state"] = to_string(current);
        health.healthy = health.healthy && !paused;
        if (paused) {
            health.status = "Paused";
        }
        return health;
    }

    HealthStatus health;
    health.healthy = current == ServiceState::Stopped;
    health.status = current == ServiceState::Stopped ? "Stopped" : to_string(current);
    health.metrics["state"] = to_string(current);
    health.metrics["system_paused"] = paused;
    health.metrics["engine_exists"] = false;
    health.timestamp = util::current_iso8601();
    return health;
}

void LifecycleController::on_state_changed(StateObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.push_back(std::move(observer));
}

void LifecycleController::change_state(ServiceState next, const std::string& reason) {
    StateChange change;
    change.previous = state_.exchange(next);
    change.current = next;
    change.reason = reason;
    change.timestamp = util::current_iso8601();

    system_state_.update(next);
    spdlog::info("Service state {} -> {}: {}", to_string(change.previous), to_string(next), reason);

    std::vector<StateObserver> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }
    for (const auto& observer : observers) {
        try {
            observer(change);
        } catch (const std::exception& e) {
            spdlog::error("State change observer failed: {}", e.what());
        }
    }
}

std::shared_ptr<StressEngine> LifecycleController::current_engine() const {
    std::lock_guard<std::mutex> lock(engine_mutex_);
    return engine_;
}

void LifecycleController::set_engine(std::shared_ptr<StressEngine> engine) {
    std::lock_guard<std::mutex> lock(engine_mutex_);
    engine_ = std::move(engine);
}
