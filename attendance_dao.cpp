#include "attendance_dao.h"
#include "logger.h"
#include "protocol_codec.h"
#include "sync_errors.h"
#include "time_util.h"

#include <stdexcept>

namespace {

// Raised inside a savepoint; the caller rolls back and records the failure.
struct RecordError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void prepare_or_throw(sqlite3* db, const char* sql, StmtGuard& s) {
    if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
        throw RecordError(std::string("prepare failed: ") + sqlite3_errmsg(db));
}

void step_done_or_throw(sqlite3* db, StmtGuard& s) {
    if (sqlite3_step(s.st) != SQLITE_DONE)
        throw RecordError(std::string("write failed: ") + sqlite3_errmsg(db));
}

void bind_text_or_null(sqlite3_stmt* st, int idx, const std::string& v) {
    if (v.empty()) sqlite3_bind_null(st, idx);
    else sqlite3_bind_text(st, idx, v.c_str(), -1, SQLITE_TRANSIENT);
}

StoredAttendance stored_from_row(sqlite3_stmt* s) {
    StoredAttendance a;
    a.user_id = sqlite_column_string(s, 0);
    a.branch_id = sqlite_column_string(s, 1);
    a.date = sqlite_column_string(s, 2);
    a.status = sqlite_column_string(s, 3);
    a.clock_in_utc = sqlite_column_string(s, 4);
    a.clock_out_utc = sqlite_column_string(s, 5);
    a.is_late = sqlite3_column_int(s, 6) != 0;
    a.late_minutes = sqlite3_column_int(s, 7);
    a.is_early_departure = sqlite3_column_int(s, 8) != 0;
    a.early_departure_minutes = sqlite3_column_int(s, 9);
    a.total_hours = sqlite3_column_double(s, 10);
    a.sync_batch_id = sqlite_column_string(s, 11);
    return a;
}

const char* ATTENDANCE_COLS =
    "SELECT user_id,branch_id,date,status,clock_in_utc,clock_out_utc,is_late,late_minutes,"
    "is_early_departure,early_departure_minutes,total_hours,sync_batch_id FROM attendance ";

}  // namespace

std::optional<StoredAttendance> load_attendance(LedgerDb& db, const std::string& branch_id,
    const std::string& user_id, const std::string& date) {
    std::lock_guard<std::mutex> lk(db.mutex());
    StmtGuard s;
    const std::string sql = std::string(ATTENDANCE_COLS) + "WHERE branch_id=? AND user_id=? AND date=?;";
    if (sqlite3_prepare_v2(db.handle(), sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK) return std::nullopt;
    sqlite3_bind_text(s.st, 1, branch_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.st, 2, user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.st, 3, date.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(s.st) != SQLITE_ROW) return std::nullopt;
    return stored_from_row(s.st);
}

std::vector<StoredAttendance> load_attendance_for_date(LedgerDb& db, const std::string& branch_id, const std::string& date) {
    std::lock_guard<std::mutex> lk(db.mutex());
    std::vector<StoredAttendance> rows; StmtGuard s;
    const std::string sql = std::string(ATTENDANCE_COLS) + "WHERE branch_id=? AND date=? ORDER BY user_id ASC;";
    if (sqlite3_prepare_v2(db.handle(), sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK) return rows;
    sqlite3_bind_text(s.st, 1, branch_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.st, 2, date.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(s.st) == SQLITE_ROW) rows.push_back(stored_from_row(s.st));
    return rows;
}

int count_punches(LedgerDb& db, const std::string& branch_id) {
    std::lock_guard<std::mutex> lk(db.mutex());
    StmtGuard s;
    if (sqlite3_prepare_v2(db.handle(), "SELECT COUNT(*) FROM punches WHERE branch_id=?;", -1, &s.st, nullptr) != SQLITE_OK) return -1;
    sqlite3_bind_text(s.st, 1, branch_id.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(s.st) == SQLITE_ROW ? sqlite3_column_int(s.st, 0) : -1;
}

SqliteAttendanceSink::SqliteAttendanceSink(LedgerDb& db, const ReconciliationEngine& engine, Clock clock)
    : db_(db), engine_(engine), clock_(clock ? std::move(clock) : Clock([] { return std::time(nullptr); })) {}

IngestResult SqliteAttendanceSink::ingest(const std::string& branch_id, const std::vector<AttendanceRecord>& records) {
    IngestResult result;
    if (records.empty()) return result;

    std::lock_guard<std::mutex> lk(db_.mutex());
    sqlite3* db = db_.handle();
    if (sqlite3_exec(db, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK)
        throw CommitError(std::string("cannot start ledger transaction: ") + sqlite3_errmsg(db));

    const time_t now = clock_();
    for (size_t i = 0; i < records.size(); ++i) {
        if (sqlite3_exec(db, "SAVEPOINT rec;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            result.failed.push_back(RecordFailure{ i, std::string("savepoint failed: ") + sqlite3_errmsg(db) });
            continue;
        }
        try {
            if (records[i].branch_id != branch_id)
                throw RecordError("record belongs to branch '" + records[i].branch_id + "'");
            commit_record_locked(branch_id, records[i], now);
            if (sqlite3_exec(db, "RELEASE rec;", nullptr, nullptr, nullptr) != SQLITE_OK)
                throw RecordError(std::string("release failed: ") + sqlite3_errmsg(db));
            result.committed.push_back(i);
        }
        catch (const RecordError& e) {
            sqlite3_exec(db, "ROLLBACK TO rec; RELEASE rec;", nullptr, nullptr, nullptr);
            result.failed.push_back(RecordFailure{ i, e.what() });
        }
        catch (const ReconciliationError& e) {
            sqlite3_exec(db, "ROLLBACK TO rec; RELEASE rec;", nullptr, nullptr, nullptr);
            result.failed.push_back(RecordFailure{ i, e.what() });
        }
    }

    if (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw CommitError("ledger commit failed: " + msg);
    }
    return result;
}

void SqliteAttendanceSink::commit_record_locked(const std::string& branch_id, const AttendanceRecord& in, time_t now) {
    sqlite3* db = db_.handle();

    {
        StmtGuard s;
        prepare_or_throw(db,
            "INSERT OR IGNORE INTO punches(branch_id,enroll_number,ts,ts_utc,source_device_id,user_id,date,"
            "direction,verify_mode,work_code,raw_hex,sync_batch_id) VALUES(?,?,?,?,?,?,?,?,?,?,?,?);", s);
        for (const auto& p : in.punches) {
            sqlite3_reset(s.st);
            sqlite3_clear_bindings(s.st);
            const std::string ts_utc = iso_from_time_t_utc(p.timestamp);
            const std::string raw_hex = hex_encode(p.raw_payload);
            sqlite3_bind_text(s.st, 1, branch_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(s.st, 2, p.enroll_number.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(s.st, 3, static_cast<sqlite3_int64>(p.timestamp));
            sqlite3_bind_text(s.st, 4, ts_utc.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(s.st, 5, p.source_device_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(s.st, 6, in.user_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(s.st, 7, in.date.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(s.st, 8, to_string(p.direction), -1, SQLITE_STATIC);
            sqlite3_bind_text(s.st, 9, to_string(p.verify_mode), -1, SQLITE_STATIC);
            sqlite3_bind_int(s.st, 10, p.work_code);
            bind_text_or_null(s.st, 11, raw_hex);
            bind_text_or_null(s.st, 12, in.provenance.sync_batch_id);
            step_done_or_throw(db, s);
        }
    }

    AttendanceRecord merged = in;
    merged.clock_in_time.reset();
    merged.clock_out_time.reset();
    {
        StmtGuard s;
        prepare_or_throw(db, "SELECT MIN(ts), MAX(ts), COUNT(*) FROM punches WHERE user_id=? AND branch_id=? AND date=?;", s);
        sqlite3_bind_text(s.st, 1, in.user_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s.st, 2, branch_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s.st, 3, in.date.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(s.st) != SQLITE_ROW) throw RecordError(std::string("punch lookup failed: ") + sqlite3_errmsg(db));
        const int count = sqlite3_column_int(s.st, 2);
        if (count > 0) {
            merged.clock_in_time = static_cast<time_t>(sqlite3_column_int64(s.st, 0));
            if (count >= 2) merged.clock_out_time = static_cast<time_t>(sqlite3_column_int64(s.st, 1));
        }
    }
    // same instant the cycle derived against, so stored status matches its output
    engine_.derive(merged, in.provenance.derived_as_of ? in.provenance.derived_as_of : now);

    const std::string in_utc = merged.clock_in_time ? iso_from_time_t_utc(*merged.clock_in_time) : "";
    const std::string out_utc = merged.clock_out_time ? iso_from_time_t_utc(*merged.clock_out_time) : "";
    const std::string synced_at = iso_from_time_t_utc(now);

    // An absence never overwrites an observed day.
    const char* SQL_ABSENT =
        "INSERT OR IGNORE INTO attendance(user_id,user_type,branch_id,class_id,date,clock_in_utc,clock_out_utc,status,"
        "is_late,late_minutes,is_early_departure,early_departure_minutes,total_hours,attendance_type,device_id,"
        "sync_batch_id,synced_at) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
    const char* SQL_UPSERT =
        "INSERT INTO attendance(user_id,user_type,branch_id,class_id,date,clock_in_utc,clock_out_utc,status,"
        "is_late,late_minutes,is_early_departure,early_departure_minutes,total_hours,attendance_type,device_id,"
        "sync_batch_id,synced_at) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
        "ON CONFLICT(user_id,branch_id,date) DO UPDATE SET "
        " clock_in_utc=excluded.clock_in_utc, clock_out_utc=excluded.clock_out_utc, status=excluded.status,"
        " is_late=excluded.is_late, late_minutes=excluded.late_minutes,"
        " is_early_departure=excluded.is_early_departure, early_departure_minutes=excluded.early_departure_minutes,"
        " total_hours=excluded.total_hours, device_id=COALESCE(attendance.device_id, excluded.device_id),"
        " sync_batch_id=excluded.sync_batch_id, synced_at=excluded.synced_at;";

    StmtGuard s;
    prepare_or_throw(db, merged.clock_in_time ? SQL_UPSERT : SQL_ABSENT, s);
    sqlite3_bind_text(s.st, 1, merged.user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.st, 2, to_string(merged.user_type), -1, SQLITE_STATIC);
    sqlite3_bind_text(s.st, 3, branch_id.c_str(), -1, SQLITE_TRANSIENT);
    bind_text_or_null(s.st, 4, merged.class_id.value_or(""));
    sqlite3_bind_text(s.st, 5, merged.date.c_str(), -1, SQLITE_TRANSIENT);
    bind_text_or_null(s.st, 6, in_utc);
    bind_text_or_null(s.st, 7, out_utc);
    sqlite3_bind_text(s.st, 8, to_string(merged.status), -1, SQLITE_STATIC);
    sqlite3_bind_int(s.st, 9, merged.is_late ? 1 : 0);
    sqlite3_bind_int(s.st, 10, merged.late_minutes);
    sqlite3_bind_int(s.st, 11, merged.is_early_departure ? 1 : 0);
    sqlite3_bind_int(s.st, 12, merged.early_departure_minutes);
    sqlite3_bind_double(s.st, 13, merged.total_hours);
    sqlite3_bind_text(s.st, 14, to_string(merged.provenance.attendance_type), -1, SQLITE_STATIC);
    bind_text_or_null(s.st, 15, merged.provenance.device_id);
    bind_text_or_null(s.st, 16, merged.provenance.sync_batch_id);
    sqlite3_bind_text(s.st, 17, synced_at.c_str(), -1, SQLITE_TRANSIENT);
    step_done_or_throw(db, s);

    if (!in.punches.empty()) reactivate_user_locked(branch_id, merged.user_id);
}

// A punch from an inactive user means they are back. Failure here never
// fails the record.
void SqliteAttendanceSink::reactivate_user_locked(const std::string& branch_id, const std::string& user_id) {
    sqlite3* db = db_.handle();
    StmtGuard s;
    if (sqlite3_prepare_v2(db, "UPDATE users SET active=1 WHERE id=? AND branch_id=? AND active=0;", -1, &s.st, nullptr) != SQLITE_OK) {
        log_warn("[" + branch_id + "] reactivation check for " + user_id + " failed: " + sqlite3_errmsg(db));
        return;
    }
    sqlite3_bind_text(s.st, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.st, 2, branch_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(s.st) != SQLITE_DONE) {
        log_warn("[" + branch_id + "] reactivation of " + user_id + " failed: " + sqlite3_errmsg(db));
        return;
    }
    if (sqlite3_changes(db) > 0) log_info("[" + branch_id + "] reactivated " + user_id + " on attendance");
}
