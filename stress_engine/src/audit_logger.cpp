#include "audit_logger.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

AuditLogger::AuditLogger(const std::string& dsn) : dsn_(dsn) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (connect()) {
        create_table();
    }
}

AuditLogger::~AuditLogger() = default;

bool AuditLogger::connect() {
    try {
        conn_ = std::make_unique<pqxx::connection>(dsn_);
        spdlog::info("Audit trail connected to {}", conn_->dbname());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Audit trail connection failed: {}", e.what());
        conn_.reset();
        return false;
    }
}

bool AuditLogger::ensure_connected() {
    if (conn_ && conn_->is_open()) {
        return true;
    }
    if (!connect()) {
        return false;
    }
    create_table();
    return true;
}

void AuditLogger::create_table() {
    try {
        pqxx::work w(*conn_);
        w.exec(
            "CREATE TABLE IF NOT EXISTS stress_audit_log ("
            "id BIGSERIAL PRIMARY KEY, "
            "timestamp TIMESTAMPTZ NOT NULL, "
            "worker_id TEXT, "
            "event_type TEXT NOT NULL, "
            "outcome TEXT, "
            "details JSONB)");
        w.exec("CREATE INDEX IF NOT EXISTS stress_audit_log_worker_idx "
               "ON stress_audit_log (worker_id, timestamp)");
        w.commit();
    } catch (const std::exception& e) {
        spdlog::error("Could not prepare stress_audit_log: {}", e.what());
    }
}

bool AuditLogger::check_health() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!ensure_connected()) {
        return false;
    }
    try {
        pqxx::nontransaction n(*conn_);
        n.exec("SELECT 1");
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Audit trail unreachable: {}", e.what());
        return false;
    }
}

void AuditLogger::log_event(const AuditEvent& event) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!ensure_connected()) {
        spdlog::warn("Dropping {} audit event for {}: no database connection",
                     event.event_type, event.worker_id);
        return;
    }

    try {
        pqxx::work w(*conn_);
        w.exec_params(
            "INSERT INTO stress_audit_log (timestamp, worker_id, event_type, outcome, details) "
            "VALUES ($1, $2, $3, $4, $5::jsonb)",
            util::format_timestamp(event.timestamp),
            event.worker_id,
            event.event_type,
            event.outcome,
            event.details.dump()
        );
        w.commit();
    } catch (const std::exception& e) {
        spdlog::error("Failed to record {} audit event for {}: {}",
                      event.event_type, event.worker_id, e.what());
    }
}
