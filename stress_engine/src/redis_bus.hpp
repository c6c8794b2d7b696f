#pragma once
#include "config.hpp"
#include "cancellation.hpp"
#include <sw/redis++/redis++.h>
#include <nlohmann/json.hpp>
#include <functional>
#include <thread>
#include <atomic>
#include <memory>

// Command transport over Redis streams: requests are read through a consumer
// group, each reply is appended to the reply stream before the request is acked.
class RedisBus {
public:
    using CommandCallback = std::function<nlohmann::json(const nlohmann::json&)>;

    explicit RedisBus(const Config& config);
    ~RedisBus();

    bool connect();
    void disconnect();
    bool is_connected() const;

    bool publish_reply(const nlohmann::json& reply);

    void start_command_consumer(CommandCallback callback);
    void stop_consumer();

private:
    void command_consumer_loop(CommandCallback callback);

    const Config& config_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> running_;
    CancellationSource stop_source_;
    std::thread consumer_thread_;
};
