#include "cursor_dao.h"
#include "sync_errors.h"
#include "time_util.h"

std::optional<SyncCursor> SqliteSyncCursorStore::get_cursor(const std::string& branch_id) {
    std::lock_guard<std::mutex> lk(db_.mutex());
    StmtGuard s;
    if (sqlite3_prepare_v2(db_.handle(),
        "SELECT branch_id,last_sync_time,last_sync_batch_id FROM sync_cursors WHERE branch_id=?;",
        -1, &s.st, nullptr) != SQLITE_OK)
        throw CommitError(std::string("cursor lookup failed: ") + sqlite3_errmsg(db_.handle()));
    sqlite3_bind_text(s.st, 1, branch_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(s.st) != SQLITE_ROW) return std::nullopt;

    SyncCursor c;
    c.branch_id = sqlite_column_string(s.st, 0);
    c.last_sync_time = static_cast<time_t>(sqlite3_column_int64(s.st, 1));
    c.last_sync_batch_id = sqlite_column_string(s.st, 2);
    return c;
}

bool SqliteSyncCursorStore::set_last_sync_time(const std::string& branch_id, time_t ts, const std::string& batch_id) {
    std::lock_guard<std::mutex> lk(db_.mutex());
    StmtGuard s;
    const char* SQL =
        "INSERT INTO sync_cursors(branch_id,last_sync_time,last_sync_utc,last_sync_batch_id,updated_at) "
        "VALUES(?,?,?,?,?) "
        "ON CONFLICT(branch_id) DO UPDATE SET"
        " last_sync_time=excluded.last_sync_time, last_sync_utc=excluded.last_sync_utc,"
        " last_sync_batch_id=excluded.last_sync_batch_id, updated_at=excluded.updated_at"
        " WHERE excluded.last_sync_time > sync_cursors.last_sync_time;";
    if (sqlite3_prepare_v2(db_.handle(), SQL, -1, &s.st, nullptr) != SQLITE_OK)
        throw CommitError(std::string("cursor update failed: ") + sqlite3_errmsg(db_.handle()));

    const std::string ts_utc = iso_from_time_t_utc(ts);
    const std::string now_utc = iso_from_time_t_utc(std::time(nullptr));
    sqlite3_bind_text(s.st, 1, branch_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(s.st, 2, static_cast<sqlite3_int64>(ts));
    sqlite3_bind_text(s.st, 3, ts_utc.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.st, 4, batch_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.st, 5, now_utc.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(s.st) != SQLITE_DONE)
        throw CommitError(std::string("cursor update failed: ") + sqlite3_errmsg(db_.handle()));
    return sqlite3_changes(db_.handle()) > 0;
}
