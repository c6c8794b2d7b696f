#pragma once
#include "types.hpp"
#include <atomic>

// Process-wide state read by worker loops, written only by the lifecycle controller
class SystemState {
public:
    bool is_paused() const { return paused_.load(); }
    ServiceState service_state() const { return state_.load(); }

    void update(ServiceState state);

private:
    std::atomic<bool> paused_{false};
    std::atomic<ServiceState> state_{ServiceState::Stopped};
};
