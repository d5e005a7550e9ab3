#pragma once
#include "punch_types.h"
#include "sync_interfaces.h"

#include <ctime>
#include <set>
#include <string>
#include <vector>

// Expected day for one user type, minutes since branch-local midnight.
struct WorkingHours {
    int start_minute = 8 * 60;
    int end_minute = 17 * 60;
    int grace_minutes = 10;
};

struct ReconciliationConfig {
    int utc_offset_minutes = 0;
    WorkingHours student;
    WorkingHours teacher;
    WorkingHours staff;

    const WorkingHours& for_type(UserType t) const;
};

struct ReconciliationOutput {
    std::vector<AttendanceRecord> records;       // ordered by (user_id, date)
    std::vector<UnresolvedIdentity> unresolved;  // ordered by timestamp
};

// Status precedence: absent (no clock-in) > late > early_departure >
// half_day > present. early_departure needs a clock-out, half_day needs its
// absence.
AttendanceStatus derive_status(bool has_clock_in, bool has_clock_out, int late_minutes,
    int early_departure_minutes, bool day_end_passed);

double round_hours(time_t seconds);

// Folds punches into one record per (user, branch-local day). Pure: the same
// input and as_of always give the same output.
class ReconciliationEngine {
public:
    explicit ReconciliationEngine(ReconciliationConfig cfg);

    // All punches must belong to one branch; mixing branches is a bug and
    // throws ReconciliationError.
    ReconciliationOutput reconcile(const std::vector<ResolvedPunch>& punches, time_t as_of,
        const std::string& sync_batch_id) const;

    // Absent records for roster members with no record on a touched date
    // whose expected end has passed at as_of.
    std::vector<AttendanceRecord> synthesize_absences(const std::string& branch_id,
        const std::vector<RosterEntry>& roster, const std::set<std::string>& dates,
        const std::vector<AttendanceRecord>& observed, time_t as_of, const std::string& sync_batch_id) const;

    // Recomputes lateness, early departure, hours and status from the times.
    void derive(AttendanceRecord& record, time_t as_of) const;

    const ReconciliationConfig& config() const { return cfg_; }

private:
    ReconciliationConfig cfg_;
};
