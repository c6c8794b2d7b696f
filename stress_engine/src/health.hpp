#pragma once
#include "config.hpp"
#include "lifecycle_controller.hpp"
#include <memory>

class HealthServer {
public:
    HealthServer(const Config& config, const LifecycleController& lifecycle);
    ~HealthServer();

    // Binds synchronously; with HEALTH_PORT=0 an ephemeral port is chosen
    void start();
    void stop();

    // Bound port, 0 when not listening
    int port() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
