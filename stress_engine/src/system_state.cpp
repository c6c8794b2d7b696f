#include "system_state.hpp"

void SystemState::update(ServiceState state) {
    state_.store(state);
    paused_.store(state == ServiceState::Paused || state == ServiceState::Pausing);
}
