#pragma once

#include <pqxx/pqxx>
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

struct AuditEvent {
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::string worker_id;
    std::string event_type;   // "worker_error", "drain", "pool_created", ...
    std::string outcome;
    nlohmann::json details = nlohmann::json::object();
};

// Append-only audit trail in PostgreSQL. Write failures are logged, never thrown.
class AuditLogger {
public:
    explicit AuditLogger(const std::string& dsn);
    ~AuditLogger();

    void log_event(const AuditEvent& event);
    bool check_health();

private:
    bool connect();
    bool ensure_connected();
    void create_table();

    std::string dsn_;
    std::unique_ptr<pqxx::connection> conn_;
    std::mutex conn_mutex_;
};
