#include "sqlite_state_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <mutex>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// Finalizes the prepared statement when it leaves scope
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bind(int index, int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    bool step_row() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
        }
        return false;
    }

    void execute() {
        int rc = sqlite3_step(stmt_);
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("SQLite write failed: ") + sqlite3_errmsg(db_));
        }
    }

    std::string column_text(int column) const {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
        return text ? std::string(text) : std::string();
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

} // namespace

class SqliteStateStore::Impl {
public:
    explicit Impl(const std::string& db_path) : db_path_(db_path), db_(nullptr) {
        if (!initialize()) {
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw std::runtime_error("Failed to initialize state database at " + db_path_);
        }
    }

    ~Impl() {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    bool initialize() {
        std::filesystem::path path(db_path_);
        if (db_path_ != ":memory:" && path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                spdlog::error("Cannot create directory for state database: {}", ec.message());
                return false;
            }
        }

        int rc = sqlite3_open(db_path_.c_str(), &db_);
        if (rc != SQLITE_OK) {
            spdlog::error("Cannot open state database: {}", sqlite3_errmsg(db_));
            return false;
        }

        if (!create_tables()) {
            return false;
        }

        spdlog::info("State database initialized at: {}", db_path_);
        return true;
    }

    std::vector<WorkerConfig> load_workers() {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<WorkerConfig> workers;

        Statement stmt(db_, "SELECT config_json FROM workers ORDER BY created_at");
        while (stmt.step_row()) {
            try {
                workers.push_back(WorkerConfig::from_json(json::parse(stmt.column_text(0))));
            } catch (const std::exception& e) {
                spdlog::error("Skipping unreadable worker record: {}", e.what());
            }
        }
        return workers;
    }

    std::optional<WorkerConfig> load_worker(const std::string& worker_id) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        Statement stmt(db_, "SELECT config_json FROM workers WHERE worker_id = ?");
        stmt.bind(1, worker_id);
        if (!stmt.step_row()) {
            return std::nullopt;
        }
        return WorkerConfig::from_json(json::parse(stmt.column_text(0)));
    }

    void save_worker(const WorkerConfig& config) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        Statement stmt(db_,
            "INSERT INTO workers (worker_id, kind, pool_id, status, config_json, created_at, updated_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(worker_id) DO UPDATE SET status = excluded.status, "
            "config_json = excluded.config_json, updated_at = excluded.updated_at");
        stmt.bind(1, config.worker_id);
        stmt.bind(2, to_string(config.kind));
        stmt.bind(3, config.pool_id);
        stmt.bind(4, to_string(config.status));
        stmt.bind(5, config.to_json(true).dump());
        stmt.bind(6, util::format_timestamp(config.created_at));
        stmt.bind(7, util::current_iso8601());
        stmt.execute();
    }

    void delete_worker(const std::string& worker_id) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        exec("BEGIN");
        try {
            for (const char* sql : {"DELETE FROM worker_errors WHERE worker_id = ?",
                                    "DELETE FROM worker_statistics WHERE worker_id = ?",
                                    "DELETE FROM workers WHERE worker_id = ?"}) {
                Statement stmt(db_, sql);
                stmt.bind(1, worker_id);
                stmt.execute();
            }
            exec("COMMIT");
        } catch (const std::exception&) {
            exec_noexcept("ROLLBACK");
            throw;
        }
        spdlog::info("Deleted persisted records for worker {}", worker_id);
    }

    std::optional<WorkerStatistics> load_statistics(const std::string& worker_id) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        Statement stmt(db_, "SELECT stats_json FROM worker_statistics WHERE worker_id = ?");
        stmt.bind(1, worker_id);
        if (!stmt.step_row()) {
            return std::nullopt;
        }
        return WorkerStatistics::from_json(json::parse(stmt.column_text(0)));
    }

    void save_statistics(const std::string& worker_id, const WorkerStatistics& stats) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        Statement stmt(db_,
            "INSERT INTO worker_statistics (worker_id, stats_json, updated_at) VALUES (?, ?, ?) "
            "ON CONFLICT(worker_id) DO UPDATE SET stats_json = excluded.stats_json, "
            "updated_at = excluded.updated_at");
        stmt.bind(1, worker_id);
        stmt.bind(2, stats.to_json().dump());
        stmt.bind(3, util::current_iso8601());
        stmt.execute();
    }

    void append_error(const std::string& worker_id, const WorkerError& error) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        Statement stmt(db_,
            "INSERT INTO worker_errors (worker_id, timestamp, operation_type, message) VALUES (?, ?, ?, ?)");
        stmt.bind(1, worker_id);
        stmt.bind(2, util::format_timestamp(error.timestamp));
        stmt.bind(3, error.operation_type);
        stmt.bind(4, error.message);
        stmt.execute();
    }

    std::vector<WorkerError> load_errors(const std::string& worker_id, size_t limit) {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<WorkerError> errors;

        Statement stmt(db_,
            "SELECT timestamp, operation_type, message FROM worker_errors "
            "WHERE worker_id = ? ORDER BY id DESC LIMIT ?");
        stmt.bind(1, worker_id);
        stmt.bind(2, static_cast<int64_t>(limit));
        while (stmt.step_row()) {
            WorkerError error;
            error.timestamp = util::parse_iso8601(stmt.column_text(0));
            error.operation_type = stmt.column_text(1);
            error.message = stmt.column_text(2);
            errors.push_back(error);
        }
        return errors;
    }

    std::vector<PoolRegistryEntry> load_pools() {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<PoolRegistryEntry> pools;

        Statement stmt(db_, "SELECT entry_json FROM pools ORDER BY created_at");
        while (stmt.step_row()) {
            try {
                pools.push_back(PoolRegistryEntry::from_json(json::parse(stmt.column_text(0))));
            } catch (const std::exception& e) {
                spdlog::error("Skipping unreadable pool record: {}", e.what());
            }
        }
        return pools;
    }

    void save_pool(const PoolRegistryEntry& entry) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        Statement stmt(db_,
            "INSERT OR REPLACE INTO pools (pool_id, entry_json, created_at) VALUES (?, ?, ?)");
        stmt.bind(1, entry.pool_id);
        stmt.bind(2, entry.to_json().dump());
        stmt.bind(3, util::format_timestamp(entry.created_at));
        stmt.execute();
    }

    void delete_pool(const std::string& pool_id) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        Statement stmt(db_, "DELETE FROM pools WHERE pool_id = ?");
        stmt.bind(1, pool_id);
        stmt.execute();
    }

    std::optional<CoreWallet> load_core_wallet() {
        std::lock_guard<std::mutex> lock(db_mutex_);

        Statement stmt(db_, "SELECT wallet_json FROM core_wallet WHERE id = 1");
        if (!stmt.step_row()) {
            return std::nullopt;
        }
        return CoreWallet::from_json(json::parse(stmt.column_text(0)));
    }

    void save_core_wallet(const CoreWallet& wallet) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        Statement stmt(db_, "INSERT OR REPLACE INTO core_wallet (id, wallet_json) VALUES (1, ?)");
        stmt.bind(1, wallet.to_json().dump());
        stmt.execute();
    }

    bool is_healthy() const {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (!db_) {
            return false;
        }

        const char* sql = "SELECT name FROM sqlite_master WHERE type='table' LIMIT 1";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        return rc == SQLITE_ROW || rc == SQLITE_DONE;
    }

private:
    bool create_tables() {
        const char* sql = R"(
            CREATE TABLE IF NOT EXISTS workers (
                worker_id TEXT PRIMARY KEY,
                kind TEXT NOT NULL,
                pool_id TEXT NOT NULL,
                status TEXT NOT NULL,
                config_json TEXT NOT NULL,
                created_at TEXT NOT NULL,
                updated_at TEXT NOT NULL
            );

            CREATE TABLE IF NOT EXISTS worker_statistics (
                worker_id TEXT PRIMARY KEY,
                stats_json TEXT NOT NULL,
                updated_at TEXT NOT NULL
            );

            CREATE TABLE IF NOT EXISTS worker_errors (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                worker_id TEXT NOT NULL,
                timestamp TEXT NOT NULL,
                operation_type TEXT,
                message TEXT NOT NULL
            );

            CREATE INDEX IF NOT EXISTS idx_worker_errors_worker ON worker_errors(worker_id);

            CREATE TABLE IF NOT EXISTS pools (
                pool_id TEXT PRIMARY KEY,
                entry_json TEXT NOT NULL,
                created_at TEXT NOT NULL
            );

            CREATE TABLE IF NOT EXISTS core_wallet (
                id INTEGER PRIMARY KEY CHECK (id = 1),
                wallet_json TEXT NOT NULL
            );
        )";

        char* error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK) {
            spdlog::error("Failed to create tables: {}", error_msg ? error_msg : "unknown error");
            sqlite3_free(error_msg);
            return false;
        }

        exec_noexcept("PRAGMA journal_mode=WAL");
        return true;
    }

    void exec(const char* sql) {
        char* error_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg) != SQLITE_OK) {
            std::string msg = error_msg ? error_msg : "unknown error";
            sqlite3_free(error_msg);
            throw std::runtime_error("SQLite exec failed (" + std::string(sql) + "): " + msg);
        }
    }

    void exec_noexcept(const char* sql) {
        char* error_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg) != SQLITE_OK) {
            spdlog::warn("SQLite exec failed ({}): {}", sql, error_msg ? error_msg : "unknown error");
            sqlite3_free(error_msg);
        }
    }

    std::string db_path_;
    sqlite3* db_;
    mutable std::mutex db_mutex_;
};

SqliteStateStore::SqliteStateStore(const std::string& db_path)
    : pImpl_(std::make_unique<Impl>(db_path)) {}

SqliteStateStore::~SqliteStateStore() = default;

std::vector<WorkerConfig> SqliteStateStore::load_workers() { return pImpl_->load_workers(); }

std::optional<WorkerConfig> SqliteStateStore::load_worker(const std::string& worker_id) {
    return pImpl_->load_worker(worker_id);
}

void SqliteStateStore::save_worker(const WorkerConfig& config) { pImpl_->save_worker(config); }

void SqliteStateStore::delete_worker(const std::string& worker_id) { pImpl_->delete_worker(worker_id); }

std::optional<WorkerStatistics> SqliteStateStore::load_statistics(const std::string& worker_id) {
    return pImpl_->load_statistics(worker_id);
}

void SqliteStateStore::save_statistics(const std::string& worker_id, const WorkerStatistics& stats) {
    pImpl_->save_statistics(worker_id, stats);
}

void SqliteStateStore::append_error(const std::string& worker_id, const WorkerError& error) {
    pImpl_->append_error(worker_id, error);
}

std::vector<WorkerError> SqliteStateStore::load_errors(const std::string& worker_id, size_t limit) {
    return pImpl_->load_errors(worker_id, limit);
}

std::vector<PoolRegistryEntry> SqliteStateStore::load_pools() { return pImpl_->load_pools(); }

void SqliteStateStore::save_pool(const PoolRegistryEntry& entry) { pImpl_->save_pool(entry); }

void SqliteStateStore::delete_pool(const std::string& pool_id) { pImpl_->delete_pool(pool_id); }

std::optional<CoreWallet> SqliteStateStore::load_core_wallet() { return pImpl_->load_core_wallet(); }

void SqliteStateStore::save_core_wallet(const CoreWallet& wallet) { pImpl_->save_core_wallet(wallet); }

bool SqliteStateStore::is_healthy() const { return pImpl_->is_healthy(); }
