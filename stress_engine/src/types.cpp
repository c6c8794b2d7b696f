#include "types.hpp"
#include "util.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace {

json optional_time(const std::optional<std::chrono::system_clock::time_point>& tp) {
    return tp ? json(util::format_timestamp(*tp)) : json(nullptr);
}

std::optional<std::chrono::system_clock::time_point> optional_time_from(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return util::parse_iso8601(j.at(key).get<std::string>());
}

} // namespace

std::string to_string(ServiceState state) {
    switch (state) {
        case ServiceState::Stopped:  return "Stopped";
        case ServiceState::Starting: return "Starting";
        case ServiceState::Started:  return "Started";
        case ServiceState::Pausing:  return "Pausing";
        case ServiceState::Paused:   return "Paused";
        case ServiceState::Resuming: return "Resuming";
        case ServiceState::Stopping: return "Stopping";
        case ServiceState::Error:    return "Error";
    }
    return "Unknown";
}

std::string to_string(WorkerKind kind) {
    switch (kind) {
        case WorkerKind::Deposit:    return "deposit";
        case WorkerKind::Withdrawal: return "withdrawal";
        case WorkerKind::Swap:       return "swap";
    }
    return "unknown";
}

std::string to_string(TokenSide side) {
    return side == TokenSide::A ? "A" : "B";
}

std::string to_string(SwapDirection direction) {
    return direction == SwapDirection::AToB ? "AToB" : "BToA";
}

std::string to_string(WorkerStatus status) {
    switch (status) {
        case WorkerStatus::Created:  return "Created";
        case WorkerStatus::Running:  return "Running";
        case WorkerStatus::Stopped:  return "Stopped";
        case WorkerStatus::Paused:   return "Paused";
        case WorkerStatus::Stopping: return "Stopping";
        case WorkerStatus::Failed:   return "Failed";
        case WorkerStatus::Error:    return "Error";
    }
    return "Unknown";
}

WorkerKind parse_worker_kind(const std::string& value) {
    auto v = util::to_lower(value);
    if (v == "deposit") return WorkerKind::Deposit;
    if (v == "withdrawal" || v == "withdraw") return WorkerKind::Withdrawal;
    if (v == "swap") return WorkerKind::Swap;
    throw std::invalid_argument("Unknown worker kind: " + value);
}

TokenSide parse_token_side(const std::string& value) {
    auto v = util::to_lower(value);
    if (v == "a") return TokenSide::A;
    if (v == "b") return TokenSide::B;
    throw std::invalid_argument("Unknown token side: " + value);
}

SwapDirection parse_swap_direction(const std::string& value) {
    auto v = util::to_lower(value);
    if (v == "atob" || v == "a_to_b") return SwapDirection::AToB;
    if (v == "btoa" || v == "b_to_a") return SwapDirection::BToA;
    throw std::invalid_argument("Unknown swap direction: " + value);
}

WorkerStatus parse_worker_status(const std::string& value) {
    auto v = util::to_lower(value);
    if (v == "created") return WorkerStatus::Created;
    if (v == "running") return WorkerStatus::Running;
    if (v == "stopped") return WorkerStatus::Stopped;
    if (v == "paused") return WorkerStatus::Paused;
    if (v == "stopping") return WorkerStatus::Stopping;
    if (v == "failed") return WorkerStatus::Failed;
    if (v == "error") return WorkerStatus::Error;
    throw std::invalid_argument("Unknown worker status: " + value);
}

json WorkerConfig::to_json(bool include_secret) const {
    json j = {
        {"worker_id", worker_id},
        {"kind", ::to_string(kind)},
        {"pool_id", pool_id},
        {"token_side", ::to_string(token_side)},
        {"swap_direction", swap_direction ? json(::to_string(*swap_direction)) : json(nullptr)},
        {"public_key", wallet.public_key},
        {"initial_amount", initial_amount},
        {"auto_refill", auto_refill},
        {"share_output", share_output},
        {"status", ::to_string(status)},
        {"created_at", util::format_timestamp(created_at)},
        {"last_operation_at", optional_time(last_operation_at)}
    };
    if (include_secret) {
        j["secret_key"] = wallet.secret_key;
    }
    return j;
}

WorkerConfig WorkerConfig::from_json(const json& j) {
    WorkerConfig config;
    config.worker_id = j.at("worker_id").get<std::string>();
    config.kind = parse_worker_kind(j.at("kind").get<std::string>());
    config.pool_id = j.value("pool_id", "");
    config.token_side = parse_token_side(j.value("token_side", "A"));
    if (j.contains("swap_direction") && !j.at("swap_direction").is_null()) {
        config.swap_direction = parse_swap_direction(j.at("swap_direction").get<std::string>());
    }
    config.wallet.public_key = j.value("public_key", "");
    config.wallet.secret_key = j.value("secret_key", "");
    config.initial_amount = j.value("initial_amount", uint64_t{0});
    config.auto_refill = j.value("auto_refill", false);
    config.share_output = j.value("share_output", false);
    config.status = parse_worker_status(j.value("status", "Created"));
    config.created_at = j.contains("created_at")
        ? util::parse_iso8601(j.at("created_at").get<std::string>())
        : std::chrono::system_clock::now();
    config.last_operation_at = optional_time_from(j, "last_operation_at");
    return config;
}

json WorkerError::to_json() const {
    return {
        {"timestamp", util::format_timestamp(timestamp)},
        {"message", message},
        {"operation_type", operation_type}
    };
}

WorkerError WorkerError::from_json(const json& j) {
    WorkerError error;
    error.timestamp = util::parse_iso8601(j.at("timestamp").get<std::string>());
    error.message = j.value("message", "");
    error.operation_type = j.value("operation_type", "");
    return error;
}

void WorkerStatistics::add_error(const WorkerError& error) {
    recent_errors.push_back(error);
    if (recent_errors.size() > kMaxRecentErrors) {
        recent_errors.erase(recent_errors.begin(),
                            recent_errors.begin() + (recent_errors.size() - kMaxRecentErrors));
    }
    last_error = error.message;
}

json WorkerStatistics::to_json() const {
    json errors = json::array();
    for (const auto& e : recent_errors) {
        errors.push_back(e.to_json());
    }
    return {
        {"successful_operations", successful_operations},
        {"failed_operations", failed_operations},
        {"total_volume_processed", total_volume_processed},
        {"total_fees_paid", total_fees_paid},
        {"last_operation_at", optional_time(last_operation_at)},
        {"last_error", last_error},
        {"recent_errors", errors}
    };
}

WorkerStatistics WorkerStatistics::from_json(const json& j) {
    WorkerStatistics stats;
    stats.successful_operations = j.value("successful_operations", uint64_t{0});
    stats.failed_operations = j.value("failed_operations", uint64_t{0});
    stats.total_volume_processed = j.value("total_volume_processed", uint64_t{0});
    stats.total_fees_paid = j.value("total_fees_paid", uint64_t{0});
    stats.last_operation_at = optional_time_from(j, "last_operation_at");
    stats.last_error = j.value("last_error", "");
    if (j.contains("recent_errors")) {
        for (const auto& e : j.at("recent_errors")) {
            stats.recent_errors.push_back(WorkerError::from_json(e));
        }
    }
    return stats;
}

double PoolRatioConfig::exchange_rate() const {
    if (ratio_a_numerator == 0) {
        return 0.0;
    }
    return static_cast<double>(ratio_b_denominator) / static_cast<double>(ratio_a_numerator);
}

bool PoolRatioConfig::operator==(const PoolRatioConfig& other) const {
    return token_a_mint == other.token_a_mint &&
           token_b_mint == other.token_b_mint &&
           ratio_a_numerator == other.ratio_a_numerator &&
           ratio_b_denominator == other.ratio_b_denominator &&
           pool_id == other.pool_id;
}

json PoolRatioConfig::to_json() const {
    return {
        {"token_a_mint", token_a_mint},
        {"token_b_mint", token_b_mint},
        {"ratio_a_numerator", ratio_a_numerator},
        {"ratio_b_denominator", ratio_b_denominator},
        {"pool_id", pool_id},
        {"was_swapped", was_swapped}
    };
}

PoolRatioConfig PoolRatioConfig::from_json(const json& j) {
    PoolRatioConfig config;
    config.token_a_mint = j.at("token_a_mint").get<std::string>();
    config.token_b_mint = j.at("token_b_mint").get<std::string>();
    config.ratio_a_numerator = j.at("ratio_a_numerator").get<uint64_t>();
    config.ratio_b_denominator = j.at("ratio_b_denominator").get<uint64_t>();
    config.pool_id = j.value("pool_id", "");
    config.was_swapped = j.value("was_swapped", false);
    return config;
}

uint64_t PoolState::swap_output(SwapDirection direction, uint64_t input_amount) const {
    if (ratio_a_numerator == 0 || ratio_b_denominator == 0) {
        return 0;
    }
    // 128-bit intermediate keeps large inputs from overflowing
    unsigned __int128 wide = input_amount;
    if (direction == SwapDirection::AToB) {
        return static_cast<uint64_t>(wide * ratio_b_denominator / ratio_a_numerator);
    }
    return static_cast<uint64_t>(wide * ratio_a_numerator / ratio_b_denominator);
}

json PoolState::to_json() const {
    return {
        {"pool_id", pool_id},
        {"token_a_mint", token_a_mint},
        {"token_b_mint", token_b_mint},
        {"token_a_decimals", token_a_decimals},
        {"token_b_decimals", token_b_decimals},
        {"ratio_a_numerator", ratio_a_numerator},
        {"ratio_b_denominator", ratio_b_denominator},
        {"lp_mint_a", lp_mint_a},
        {"lp_mint_b", lp_mint_b},
        {"pool_paused", pool_paused},
        {"swaps_paused", swaps_paused},
        {"created_at", util::format_timestamp(created_at)}
    };
}

PoolState PoolState::from_json(const json& j) {
    PoolState pool;
    pool.pool_id = j.at("pool_id").get<std::string>();
    pool.token_a_mint = j.at("token_a_mint").get<std::string>();
    pool.token_b_mint = j.at("token_b_mint").get<std::string>();
    pool.token_a_decimals = j.value("token_a_decimals", 9);
    pool.token_b_decimals = j.value("token_b_decimals", 9);
    pool.ratio_a_numerator = j.at("ratio_a_numerator").get<uint64_t>();
    pool.ratio_b_denominator = j.at("ratio_b_denominator").get<uint64_t>();
    pool.lp_mint_a = j.value("lp_mint_a", "");
    pool.lp_mint_b = j.value("lp_mint_b", "");
    pool.pool_paused = j.value("pool_paused", false);
    pool.swaps_paused = j.value("swaps_paused", false);
    pool.created_at = j.contains("created_at")
        ? util::parse_iso8601(j.at("created_at").get<std::string>())
        : std::chrono::system_clock::now();
    return pool;
}

json PoolRegistryEntry::to_json() const {
    return {
        {"pool_id", pool_id},
        {"ratio", ratio.to_json()},
        {"token_a_decimals", token_a_decimals},
        {"token_b_decimals", token_b_decimals},
        {"created_at", util::format_timestamp(created_at)}
    };
}

PoolRegistryEntry PoolRegistryEntry::from_json(const json& j) {
    PoolRegistryEntry entry;
    entry.pool_id = j.at("pool_id").get<std::string>();
    entry.ratio = PoolRatioConfig::from_json(j.at("ratio"));
    entry.token_a_decimals = j.value("token_a_decimals", 9);
    entry.token_b_decimals = j.value("token_b_decimals", 9);
    entry.created_at = j.contains("created_at")
        ? util::parse_iso8601(j.at("created_at").get<std::string>())
        : std::chrono::system_clock::now();
    return entry;
}

json CoreWallet::to_json() const {
    return {
        {"public_key", credential.public_key},
        {"secret_key", credential.secret_key},
        {"created_at", util::format_timestamp(created_at)}
    };
}

CoreWallet CoreWallet::from_json(const json& j) {
    CoreWallet wallet;
    wallet.credential.public_key = j.at("public_key").get<std::string>();
    wallet.credential.secret_key = j.at("secret_key").get<std::string>();
    wallet.created_at = j.contains("created_at")
        ? util::parse_iso8601(j.at("created_at").get<std::string>())
        : std::chrono::system_clock::now();
    return wallet;
}

json HealthStatus::to_json() const {
    return {
        {"healthy", healthy},
        {"status", status},
        {"metrics", metrics},
        {"timestamp", timestamp}
    };
}
