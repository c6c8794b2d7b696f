#pragma once
#include "lifecycle_controller.hpp"
#include "worker_pool.hpp"
#include "pool_manager.hpp"
#include "drain_handler.hpp"
#include <nlohmann/json.hpp>
#include <string>

struct CommandRequest {
    std::string cmd;
    std::string corr_id;
    nlohmann::json args = nlohmann::json::object();

    static CommandRequest from_json(const nlohmann::json& j);
};

struct CommandReply {
    std::string corr_id;
    bool ok = false;
    nlohmann::json result;
    std::string error;
    std::string ts;

    nlohmann::json to_json() const;
};

// Transport-neutral dispatch of engine operations. Caller errors become
// {"ok": false, "error": ...} replies; handle() itself does not throw.
class CommandHandler {
public:
    CommandHandler(LifecycleController& lifecycle, WorkerPool& workers, PoolManager& pools, DrainHandler& drainer);

    CommandReply handle(const CommandRequest& request);
    nlohmann::json handle_json(const nlohmann::json& request);

private:
    nlohmann::json dispatch(const CommandRequest& request);

    nlohmann::json handle_create_worker(const nlohmann::json& args);
    nlohmann::json handle_list_workers();
    nlohmann::json handle_normalize_pool(const nlohmann::json& args);
    nlohmann::json handle_get_compute_budget(const nlohmann::json& args);
    nlohmann::json handle_list_pools();

    LifecycleController& lifecycle_;
    WorkerPool& workers_;
    PoolManager& pools_;
    DrainHandler& drainer_;
};
