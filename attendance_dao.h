#pragma once
#include "ledger_db.h"
#include "reconciliation.h"
#include "sync_interfaces.h"

#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Row of the attendance table as stored.
struct StoredAttendance {
    std::string user_id;
    std::string branch_id;
    std::string date;
    std::string status;
    std::string clock_in_utc;   // empty when absent
    std::string clock_out_utc;  // empty when absent
    bool is_late = false;
    int late_minutes = 0;
    bool is_early_departure = false;
    int early_departure_minutes = 0;
    double total_hours = 0.0;
    std::string sync_batch_id;
};

std::optional<StoredAttendance> load_attendance(LedgerDb& db, const std::string& branch_id,
    const std::string& user_id, const std::string& date);
std::vector<StoredAttendance> load_attendance_for_date(LedgerDb& db, const std::string& branch_id, const std::string& date);
int count_punches(LedgerDb& db, const std::string& branch_id);

// Ledger writer. Each record commits in its own savepoint: the punches are
// inserted with the dedup key as a UNIQUE constraint, then the day's record is
// rebuilt from every stored punch for that (user, branch, date), so replays and
// partial re-deliveries converge on one row. An inactive user with a
// committed punch is made active again.
class SqliteAttendanceSink : public AttendanceSink {
public:
    using Clock = std::function<time_t()>;

    SqliteAttendanceSink(LedgerDb& db, const ReconciliationEngine& engine, Clock clock = {});

    IngestResult ingest(const std::string& branch_id, const std::vector<AttendanceRecord>& records) override;

private:
    void commit_record_locked(const std::string& branch_id, const AttendanceRecord& record, time_t now);
    void reactivate_user_locked(const std::string& branch_id, const std::string& user_id);

    LedgerDb& db_;
    const ReconciliationEngine& engine_;
    Clock clock_;
};
