#include "storage/Database.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <sqlite3.h>

namespace storage {

    using core::types::StorageException;

    namespace {
        const char *SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS printers (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL,
    protocol TEXT NOT NULL,
    host TEXT NOT NULL,
    port INTEGER NOT NULL DEFAULT 0,
    api_key TEXT,
    username TEXT,
    password TEXT,
    serial TEXT,
    enabled INTEGER NOT NULL DEFAULT 1,
    last_error_code TEXT,
    last_error_message TEXT,
    last_error_at REAL,
    last_seen REAL,
    total_print_hours REAL NOT NULL DEFAULT 0,
    total_print_count INTEGER NOT NULL DEFAULT 0,
    hours_since_maintenance REAL NOT NULL DEFAULT 0,
    prints_since_maintenance INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS scheduled_jobs (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    printer_id INTEGER,
    item_name TEXT,
    model_name TEXT,
    filename TEXT,
    layer_count INTEGER,
    status TEXT NOT NULL DEFAULT 'pending',
    scheduled_start REAL,
    actual_start REAL,
    actual_end REAL,
    duration_hours REAL
);

CREATE TABLE IF NOT EXISTS print_jobs (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    printer_id INTEGER NOT NULL,
    job_name TEXT,
    filename TEXT,
    started_at REAL NOT NULL,
    ended_at REAL,
    status TEXT NOT NULL DEFAULT 'running',
    total_layers INTEGER,
    scheduled_job_id INTEGER,
    error_code TEXT,
    duration_seconds INTEGER
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_print_jobs_one_open
    ON print_jobs(printer_id) WHERE ended_at IS NULL;

CREATE TABLE IF NOT EXISTS users (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    email TEXT,
    is_active INTEGER NOT NULL DEFAULT 1
);

CREATE TABLE IF NOT EXISTS alert_preferences (
    user_id INTEGER NOT NULL,
    alert_type TEXT NOT NULL,
    in_app INTEGER NOT NULL DEFAULT 1,
    browser_push INTEGER NOT NULL DEFAULT 0,
    email INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (user_id, alert_type)
);

CREATE TABLE IF NOT EXISTS push_subscriptions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id INTEGER NOT NULL,
    endpoint TEXT NOT NULL,
    p256dh TEXT NOT NULL,
    auth TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS alerts (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id INTEGER NOT NULL,
    alert_type TEXT NOT NULL,
    severity TEXT NOT NULL,
    title TEXT NOT NULL,
    message TEXT,
    printer_id INTEGER,
    job_id INTEGER,
    created_at REAL NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_alerts_dedup
    ON alerts(alert_type, printer_id, title, created_at);

CREATE TABLE IF NOT EXISTS webhooks (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT,
    url TEXT NOT NULL,
    webhook_type TEXT NOT NULL DEFAULT 'generic',
    alert_types TEXT,
    enabled INTEGER NOT NULL DEFAULT 1
);

CREATE TABLE IF NOT EXISTS print_archives (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    print_job_id INTEGER NOT NULL UNIQUE,
    printer_id INTEGER NOT NULL,
    job_name TEXT,
    status TEXT NOT NULL,
    success INTEGER NOT NULL DEFAULT 0,
    started_at REAL,
    ended_at REAL,
    duration_seconds INTEGER,
    error_code TEXT
);

CREATE TABLE IF NOT EXISTS ws_events (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    event_type TEXT NOT NULL,
    data TEXT NOT NULL,
    created_at REAL NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_ws_events_created ON ws_events(created_at);
)SQL";
    }

    // ---- Statement ----

    Statement::Statement(sqlite3 *db, const std::string &sql)
            : db_(db), stmt_(nullptr), sql_(sql) {
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            std::string error = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt_);
            throw StorageException("prepare failed (" + error + "): " + sql);
        }
    }

    Statement::~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement::Statement(Statement &&other) noexcept
            : db_(other.db_), stmt_(other.stmt_), sql_(std::move(other.sql_)) {
        other.stmt_ = nullptr;
    }

    void Statement::check(int rc, const char *what) const {
        if (rc != SQLITE_OK) {
            throw StorageException(std::string(what) + " failed (" + sqlite3_errmsg(db_) + "): " + sql_);
        }
    }

    Statement &Statement::bind(int index, int value) {
        check(sqlite3_bind_int(stmt_, index, value), "bind");
        return *this;
    }

    Statement &Statement::bind(int index, int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), "bind");
        return *this;
    }

    Statement &Statement::bind(int index, double value) {
        check(sqlite3_bind_double(stmt_, index, value), "bind");
        return *this;
    }

    Statement &Statement::bind(int index, const std::string &value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
              "bind");
        return *this;
    }

    Statement &Statement::bind(int index, const char *value) {
        return bind(index, std::string(value ? value : ""));
    }

    Statement &Statement::bindNull(int index) {
        check(sqlite3_bind_null(stmt_, index), "bind");
        return *this;
    }

    bool Statement::step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageException(std::string("step failed (") + sqlite3_errmsg(db_) + "): " + sql_);
    }

    void Statement::run() {
        while (step()) {}
    }

    void Statement::reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    bool Statement::isNull(int column) const {
        return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
    }

    int Statement::columnInt(int column) const {
        return sqlite3_column_int(stmt_, column);
    }

    int64_t Statement::columnInt64(int column) const {
        return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
    }

    double Statement::columnDouble(int column) const {
        return sqlite3_column_double(stmt_, column);
    }

    std::string Statement::columnText(int column) const {
        const unsigned char *text = sqlite3_column_text(stmt_, column);
        return text ? std::string(reinterpret_cast<const char *>(text)) : std::string();
    }

    std::optional<int64_t> Statement::optionalInt64(int column) const {
        if (isNull(column)) return std::nullopt;
        return columnInt64(column);
    }

    std::optional<double> Statement::optionalDouble(int column) const {
        if (isNull(column)) return std::nullopt;
        return columnDouble(column);
    }

    // ---- Database ----

    Database::Database(const std::string &path) : path_(path) {
        int rc = sqlite3_open_v2(path.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
        if (rc != SQLITE_OK) {
            std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            throw StorageException("cannot open " + path + ": " + error);
        }

        sqlite3_busy_timeout(db_, 10000);
        if (path != ":memory:") {
            execute("PRAGMA journal_mode=WAL");
        }
        execute("PRAGMA foreign_keys=ON");
        Logger::logInfo("[Database] Opened " + path);
    }

    Database::~Database() {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    void Database::migrate() {
        std::lock_guard lock(mutex_);
        execute(SCHEMA);
        Logger::logInfo("[Database] Schema ready");
    }

    void Database::execute(const std::string &sql) {
        std::lock_guard lock(mutex_);
        char *error = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
        if (rc != SQLITE_OK) {
            std::string message = error ? error : "unknown error";
            sqlite3_free(error);
            throw StorageException(message);
        }
    }

    Statement Database::prepare(const std::string &sql) {
        return Statement(db_, sql);
    }

    int64_t Database::lastInsertId() const {
        return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
    }

    int Database::changes() const {
        return sqlite3_changes(db_);
    }

    // ---- Transaction ----

    Database::Transaction::Transaction(Database &db)
            : db_(db), lock_(db.mutex_), depth_(db.transactionDepth_) {
        if (depth_ == 0) {
            db_.execute("BEGIN IMMEDIATE");
        } else {
            db_.execute("SAVEPOINT sp_" + std::to_string(depth_));
        }
        db_.transactionDepth_++;
    }

    void Database::Transaction::commit() {
        if (finished_) return;
        if (depth_ == 0) {
            db_.execute("COMMIT");
        } else {
            db_.execute("RELEASE sp_" + std::to_string(depth_));
        }
        finished_ = true;
        db_.transactionDepth_--;
    }

    Database::Transaction::~Transaction() {
        if (finished_) return;
        db_.transactionDepth_--;
        try {
            if (depth_ == 0) {
                db_.execute("ROLLBACK");
            } else {
                db_.execute("ROLLBACK TO sp_" + std::to_string(depth_));
                db_.execute("RELEASE sp_" + std::to_string(depth_));
            }
        } catch (const std::exception &e) {
            Logger::logError(std::string("[Database] Rollback failed: ") + e.what());
        }
    }

} // namespace storage
