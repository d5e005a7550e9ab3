#include "ledger_db.h"
#include "logger.h"

#include <stdexcept>

std::string sqlite_column_string(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return "";
    const unsigned char* p = sqlite3_column_text(st, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

LedgerDb::LedgerDb(const std::string& path) : path_(path) {
    if (sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open ledger DB " + path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
    migrate();
}

LedgerDb::~LedgerDb() { sqlite3_close(db_); }

int LedgerDb::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        log_error(std::string("SQL: ") + (err ? err : sqlite3_errstr(rc)));
        sqlite3_free(err);
    }
    return rc;
}

void LedgerDb::migrate() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (path_ != ":memory:") exec("PRAGMA journal_mode=WAL;");

    const char* schema[] = {
        "CREATE TABLE IF NOT EXISTS users("
        " id TEXT PRIMARY KEY,"
        " branch_id TEXT NOT NULL,"
        " name TEXT,"
        " user_type TEXT NOT NULL,"
        " class_id TEXT,"
        " enroll_number TEXT,"
        " admission_number TEXT,"
        " active INTEGER NOT NULL DEFAULT 1);",
        "CREATE INDEX IF NOT EXISTS idx_users_enroll ON users(branch_id, enroll_number);",
        "CREATE INDEX IF NOT EXISTS idx_users_admission ON users(branch_id, admission_number);",

        "CREATE TABLE IF NOT EXISTS attendance("
        " id INTEGER PRIMARY KEY,"
        " user_id TEXT NOT NULL,"
        " user_type TEXT NOT NULL,"
        " branch_id TEXT NOT NULL,"
        " class_id TEXT,"
        " date TEXT NOT NULL,"
        " clock_in_utc TEXT,"
        " clock_out_utc TEXT,"
        " status TEXT NOT NULL,"
        " is_late INTEGER NOT NULL DEFAULT 0,"
        " late_minutes INTEGER NOT NULL DEFAULT 0,"
        " is_early_departure INTEGER NOT NULL DEFAULT 0,"
        " early_departure_minutes INTEGER NOT NULL DEFAULT 0,"
        " total_hours REAL NOT NULL DEFAULT 0,"
        " attendance_type TEXT NOT NULL,"
        " device_id TEXT,"
        " sync_batch_id TEXT,"
        " synced_at TEXT,"
        " UNIQUE(user_id, branch_id, date));",

        "CREATE TABLE IF NOT EXISTS punches("
        " id INTEGER PRIMARY KEY,"
        " branch_id TEXT NOT NULL,"
        " enroll_number TEXT NOT NULL,"
        " ts INTEGER NOT NULL,"
        " ts_utc TEXT NOT NULL,"
        " source_device_id TEXT NOT NULL,"
        " user_id TEXT NOT NULL,"
        " date TEXT NOT NULL,"
        " direction TEXT,"
        " verify_mode TEXT,"
        " work_code INTEGER,"
        " raw_hex TEXT,"
        " sync_batch_id TEXT,"
        " UNIQUE(branch_id, enroll_number, ts, source_device_id));",
        "CREATE INDEX IF NOT EXISTS idx_punches_day ON punches(user_id, branch_id, date);",

        "CREATE TABLE IF NOT EXISTS sync_cursors("
        " branch_id TEXT PRIMARY KEY,"
        " last_sync_time INTEGER NOT NULL,"
        " last_sync_utc TEXT NOT NULL,"
        " last_sync_batch_id TEXT,"
        " updated_at TEXT);",
    };
    for (const char* sql : schema) {
        if (exec(sql) != SQLITE_OK)
            throw std::runtime_error(std::string("schema migration failed: ") + sqlite3_errmsg(db_));
    }
}
