#include "redis_bus.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <iterator>
#include <unordered_map>
#include <vector>
#include <unistd.h>

RedisBus::RedisBus(const Config& config) : config_(config), running_(false) {}

RedisBus::~RedisBus() {
    stop_consumer();
    disconnect();
}

bool RedisBus::connect() {
    try {
        redis_ = std::make_unique<sw::redis::Redis>(config_.redis_url);
        redis_->ping();
        spdlog::info("Connected to Redis: {}", config_.redis_url);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        redis_.reset();
        return false;
    }
}

void RedisBus::disconnect() {
    redis_.reset();
}

bool RedisBus::is_connected() const {
    if (!redis_) return false;

    try {
        redis_->ping();
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool RedisBus::publish_reply(const nlohmann::json& reply) {
    if (!redis_) return false;

    try {
        redis_->xadd(config_.reply_stream, "*", {{"data", reply.dump()}});
        spdlog::debug("Published reply for {}", reply.value("corr_id", ""));
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish reply: {}", e.what());
        return false;
    }
}

void RedisBus::start_command_consumer(CommandCallback callback) {
    if (running_ || !redis_) return;

    running_ = true;
    consumer_thread_ = std::thread([this, callback]() {
        command_consumer_loop(callback);
    });
}

void RedisBus::stop_consumer() {
    running_ = false;
    stop_source_.cancel();

    if (consumer_thread_.joinable()) {
        consumer_thread_.join();
    }
}

void RedisBus::command_consumer_loop(CommandCallback callback) {
    std::string consumer_group = config_.service_name + "_commands";
    std::string consumer_name = config_.service_name + "_" + std::to_string(getpid());
    auto token = stop_source_.token();

    try {
        redis_->xgroup_create(config_.command_stream, consumer_group, "$", true);
    } catch (const sw::redis::ReplyError& e) {
        spdlog::debug("Consumer group {} not created: {}", consumer_group, e.what());
    }

    spdlog::info("Consuming commands from {} as {}", config_.command_stream, consumer_name);

    using Attrs = std::vector<std::pair<std::string, std::string>>;
    using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
    using ItemStream = std::vector<Item>;

    while (running_) {
        try {
            std::unordered_map<std::string, ItemStream> result;
            redis_->xreadgroup(consumer_group, consumer_name, config_.command_stream, ">",
                               std::chrono::milliseconds(1000), 10,
                               std::inserter(result, result.end()));

            for (const auto& stream : result) {
                for (const auto& item : stream.second) {
                    const std::string& message_id = item.first;
                    try {
                        if (item.second) {
                            for (const auto& field : *item.second) {
                                if (field.first != "data") continue;
                                auto request = nlohmann::json::parse(field.second);
                                publish_reply(callback(request));
                            }
                        }
                    } catch (const std::exception& e) {
                        spdlog::error("Failed to process command message {}: {}", message_id, e.what());
                    }
                    redis_->xack(config_.command_stream, consumer_group, message_id);
                }
            }
        } catch (const std::exception& e) {
            if (running_) {
                spdlog::error("Command consumer error: {}", e.what());
                if (token.wait_for(std::chrono::seconds(5))) break;
            }
        }
    }

    spdlog::info("Command consumer stopped");
}
