#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <thread>

class HealthServer::Impl {
public:
    Impl(const Config& config, const LifecycleController& lifecycle)
        : config_(config), lifecycle_(lifecycle), running_(false) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) return;
        running_ = true;

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            HealthStatus health = lifecycle_.get_health();
            nlohmann::json body = health.to_json();
            body["service"] = config_.service_name;

            res.status = health.healthy ? 200 : 503;
            res.set_content(body.dump(2), "application/json");
        });

        // Bound before the thread starts so stop() always has a listener to close
        if (config_.health_port == 0) {
            port_ = server_.bind_to_any_port(config_.health_host.c_str());
        } else if (server_.bind_to_port(config_.health_host.c_str(), config_.health_port)) {
            port_ = config_.health_port;
        }
        if (port_ <= 0) {
            spdlog::error("Health check server failed to bind {}:{}", config_.health_host, config_.health_port);
            running_ = false;
            port_ = 0;
            return;
        }

        server_thread_ = std::thread([this]() {
            spdlog::info("Health check server listening on {}:{}", config_.health_host, port_);
            if (!server_.listen_after_bind()) {
                spdlog::error("Health check server on port {} stopped with an error", port_);
            }
        });
        server_.wait_until_ready();
    }

    int port() const { return port_; }

    void stop() {
        if (running_) {
            running_ = false;
            server_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            spdlog::info("Health check server stopped");
        }
    }

private:
    Config config_;
    const LifecycleController& lifecycle_;
    std::atomic<bool> running_;
    int port_ = 0;
    httplib::Server server_;
    std::thread server_thread_;
};

HealthServer::HealthServer(const Config& config, const LifecycleController& lifecycle)
    : pImpl_(std::make_unique<Impl>(config, lifecycle)) {}

HealthServer::~HealthServer() = default;

void HealthServer::start() {
    pImpl_->start();
}

void HealthServer::stop() {
    pImpl_->stop();
}

int HealthServer::port() const {
    return pImpl_->port();
}
