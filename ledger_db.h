#pragma once
#include <sqlite3.h>

#include <mutex>
#include <string>

// Owns the ledger database connection. Every DAO shares one LedgerDb and
// takes its mutex for the duration of a statement or transaction.
class LedgerDb {
public:
    // ":memory:" works for tests. Throws std::runtime_error if the file
    // cannot be opened or the schema cannot be created.
    explicit LedgerDb(const std::string& path);
    ~LedgerDb();

    LedgerDb(const LedgerDb&) = delete;
    LedgerDb& operator=(const LedgerDb&) = delete;

    sqlite3* handle() const { return db_; }
    std::mutex& mutex() { return mutex_; }
    const std::string& path() const { return path_; }

    // Runs a statement without results; returns the sqlite rc, logs failures.
    int exec(const char* sql);

private:
    void migrate();

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

// Finalizes on scope exit.
struct StmtGuard {
    sqlite3_stmt* st = nullptr;
    StmtGuard() = default;
    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;
    ~StmtGuard() { sqlite3_finalize(st); }
};

std::string sqlite_column_string(sqlite3_stmt* st, int col);
