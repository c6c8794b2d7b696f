#include "command_handler.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace {

std::string required_string(const json& args, const char* key) {
    if (!args.contains(key) || !args.at(key).is_string() || args.at(key).get<std::string>().empty()) {
        throw std::invalid_argument(std::string("Missing argument: ") + key);
    }
    return args.at(key).get<std::string>();
}

json state_result(const LifecycleController& lifecycle) {
    return {{"state", to_string(lifecycle.state())}};
}

} // namespace

CommandRequest CommandRequest::from_json(const json& j) {
    CommandRequest req;
    req.cmd = j.at("cmd").get<std::string>();
    req.corr_id = j.value("corr_id", "");
    if (j.contains("args") && j.at("args").is_object()) {
        req.args = j.at("args");
    }
    return req;
}

json CommandReply::to_json() const {
    json j;
    j["corr_id"] = corr_id;
    j["ok"] = ok;
    if (ok) {
        j["result"] = result;
    } else {
        j["error"] = error;
    }
    j["ts"] = ts;
    return j;
}

CommandHandler::CommandHandler(LifecycleController& lifecycle, WorkerPool& workers,
                               PoolManager& pools, DrainHandler& drainer)
    : lifecycle_(lifecycle), workers_(workers), pools_(pools), drainer_(drainer) {}

json CommandHandler::handle_json(const json& request) {
    CommandRequest req;
    try {
        req = CommandRequest::from_json(request);
    } catch (const std::exception& e) {
        CommandReply reply;
        reply.corr_id = request.is_object() ? request.value("corr_id", "") : "";
        reply.error = std::string("Malformed request: ") + e.what();
        reply.ts = util::current_iso8601();
        return reply.to_json();
    }
    return handle(req).to_json();
}

CommandReply CommandHandler::handle(const CommandRequest& request) {
    CommandReply reply;
    reply.corr_id = request.corr_id;

    spdlog::info("Received command: {} ({})", request.cmd, request.corr_id);
    try {
        reply.result = dispatch(request);
        reply.ok = true;
    } catch (const std::exception& e) {
        spdlog::warn("Command {} failed: {}", request.cmd, e.what());
        reply.ok = false;
        reply.error = e.what();
    }

    reply.ts = util::current_iso8601();
    return reply;
}

json CommandHandler::dispatch(const CommandRequest& req) {
    const json& args = req.args;

    if (req.cmd == "create_worker") {
        return handle_create_worker(args);
    } else if (req.cmd == "start_worker") {
        auto id = required_string(args, "worker_id");
        workers_.start(id);
        return {{"worker_id", id}, {"status", to_string(workers_.get_config(id).status)}};
    } else if (req.cmd == "stop_worker") {
        auto id = required_string(args, "worker_id");
        workers_.stop(id);
        return {{"worker_id", id}, {"status", to_string(workers_.get_config(id).status)}};
    } else if (req.cmd == "force_stop_all") {
        workers_.force_stop_all();
        return {{"running", workers_.running_count()}};
    } else if (req.cmd == "delete_worker") {
        auto id = required_string(args, "worker_id");
        workers_.delete_worker(id);
        return {{"worker_id", id}, {"deleted", true}};
    } else if (req.cmd == "list_workers") {
        return handle_list_workers();
    } else if (req.cmd == "get_worker_config") {
        return workers_.get_config(required_string(args, "worker_id")).to_json(false);
    } else if (req.cmd == "get_worker_statistics") {
        return workers_.get_statistics(required_string(args, "worker_id")).to_json();
    } else if (req.cmd == "drain") {
        return drainer_.drain(required_string(args, "worker_id")).to_json();
    } else if (req.cmd == "normalize_pool") {
        return handle_normalize_pool(args);
    } else if (req.cmd == "get_compute_budget") {
        return handle_get_compute_budget(args);
    } else if (req.cmd == "create_pool") {
        return pools_.create_pool(PoolCreationParams::from_json(args)).to_json();
    } else if (req.cmd == "list_pools") {
        return handle_list_pools();
    } else if (req.cmd == "start") {
        lifecycle_.start();
        return state_result(lifecycle_);
    } else if (req.cmd == "stop") {
        lifecycle_.stop();
        return state_result(lifecycle_);
    } else if (req.cmd == "pause") {
        lifecycle_.pause();
        return state_result(lifecycle_);
    } else if (req.cmd == "resume") {
        lifecycle_.resume();
        return state_result(lifecycle_);
    } else if (req.cmd == "health") {
        return lifecycle_.get_health().to_json();
    }

    throw std::invalid_argument("Unknown command: " + req.cmd);
}

json CommandHandler::handle_create_worker(const json& args) {
    WorkerConfig config;
    config.kind = parse_worker_kind(required_string(args, "kind"));
    config.pool_id = required_string(args, "pool_id");
    config.token_side = parse_token_side(args.value("token_side", "A"));
    if (args.contains("swap_direction") && !args.at("swap_direction").is_null()) {
        config.swap_direction = parse_swap_direction(args.at("swap_direction").get<std::string>());
    }
    config.initial_amount = args.value("initial_amount", uint64_t{0});
    config.auto_refill = args.value("auto_refill", false);
    config.share_output = args.value("share_output", false);

    auto id = workers_.create(config);
    return {{"worker_id", id}, {"public_key", workers_.get_config(id).wallet.public_key}};
}

json CommandHandler::handle_list_workers() {
    json list = json::array();
    for (const auto& config : workers_.list_all()) {
        list.push_back(config.to_json(false));
    }
    return list;
}

json CommandHandler::handle_normalize_pool(const json& args) {
    const auto& normalizer = pools_.normalizer();
    auto ratio = normalizer.normalize(required_string(args, "token_a_mint"),
                                      required_string(args, "token_b_mint"),
                                      args.at("ratio_a").get<uint64_t>(),
                                      args.at("ratio_b").get<uint64_t>());
    if (args.contains("token_a_decimals") && args.contains("token_b_decimals")) {
        int dec_a = args.at("token_a_decimals").get<int>();
        int dec_b = args.at("token_b_decimals").get<int>();
        // Decimals follow the caller's order; swap them along with the mints
        if (ratio.was_swapped) std::swap(dec_a, dec_b);
        normalizer.validate(ratio, dec_a, dec_b);
    }

    json result = ratio.to_json();
    result["exchange_rate"] = normalizer.exchange_rate_display(ratio);
    return result;
}

json CommandHandler::handle_get_compute_budget(const json& args) {
    auto operation = required_string(args, "operation");
    std::optional<BudgetContext> context;
    if (args.contains("pool_count") || args.contains("donation_amount")) {
        BudgetContext ctx;
        ctx.pool_count = args.value("pool_count", 0);
        ctx.donation_amount = args.value("donation_amount", uint64_t{0});
        context = ctx;
    }
    return {{"operation", operation}, {"compute_units", workers_.budgeter().get_budget(operation, context)}};
}

json CommandHandler::handle_list_pools() {
    json list = json::array();
    for (const auto& entry : pools_.list_pools()) {
        list.push_back(entry.to_json());
    }
    return list;
}
