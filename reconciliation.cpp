#include "reconciliation.h"
#include "sync_errors.h"
#include "time_util.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_set>

const WorkingHours& ReconciliationConfig::for_type(UserType t) const {
    switch (t) {
    case UserType::Student: return student;
    case UserType::Teacher: return teacher;
    case UserType::Staff: return staff;
    }
    return staff;
}

AttendanceStatus derive_status(bool has_clock_in, bool has_clock_out, int late_minutes,
    int early_departure_minutes, bool day_end_passed) {
    if (!has_clock_in) return AttendanceStatus::Absent;
    if (late_minutes > 0) return AttendanceStatus::Late;
    if (has_clock_out && early_departure_minutes > 0) return AttendanceStatus::EarlyDeparture;
    if (!has_clock_out && day_end_passed) return AttendanceStatus::HalfDay;
    return AttendanceStatus::Present;
}

double round_hours(time_t seconds) {
    // hundredths of an hour are 36 s
    return std::round(static_cast<double>(seconds) / 36.0) / 100.0;
}

static int direction_rank(PunchDirection d) {
    switch (d) {
    case PunchDirection::In: return 0;
    case PunchDirection::Unknown: return 1;
    case PunchDirection::Out: return 2;
    }
    return 1;
}

// Chronological; direction only breaks ties within the same second.
static bool punch_before(const RawPunchEvent& a, const RawPunchEvent& b) {
    if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
    if (direction_rank(a.direction) != direction_rank(b.direction))
        return direction_rank(a.direction) < direction_rank(b.direction);
    if (a.source_device_id != b.source_device_id) return a.source_device_id < b.source_device_id;
    return a.enroll_number < b.enroll_number;
}

ReconciliationEngine::ReconciliationEngine(ReconciliationConfig cfg) : cfg_(std::move(cfg)) {}

void ReconciliationEngine::derive(AttendanceRecord& r, time_t as_of) const {
    r.is_late = false; r.late_minutes = 0;
    r.is_early_departure = false; r.early_departure_minutes = 0;
    r.total_hours = 0.0;

    auto midnight = local_midnight_utc(r.date, cfg_.utc_offset_minutes);
    if (!midnight) throw ReconciliationError("record for user " + r.user_id + " has malformed date '" + r.date + "'");
    const WorkingHours& wh = cfg_.for_type(r.user_type);
    const time_t expected_in = *midnight + static_cast<time_t>(wh.start_minute + wh.grace_minutes) * 60;
    const time_t expected_out = *midnight + static_cast<time_t>(wh.end_minute) * 60;

    if (r.clock_in_time && *r.clock_in_time > expected_in) {
        r.late_minutes = static_cast<int>((*r.clock_in_time - expected_in) / 60);
        r.is_late = r.late_minutes > 0;
    }
    if (r.clock_out_time) {
        if (!r.clock_in_time || *r.clock_out_time < *r.clock_in_time)
            throw ReconciliationError("record for user " + r.user_id + " on " + r.date + " has clock-out before clock-in");
        if (*r.clock_out_time < expected_out) {
            r.early_departure_minutes = static_cast<int>((expected_out - *r.clock_out_time) / 60);
            r.is_early_departure = r.early_departure_minutes > 0;
        }
        r.total_hours = round_hours(*r.clock_out_time - *r.clock_in_time);
    }
    r.status = derive_status(r.clock_in_time.has_value(), r.clock_out_time.has_value(),
        r.late_minutes, r.early_departure_minutes, as_of > expected_out);
}

ReconciliationOutput ReconciliationEngine::reconcile(const std::vector<ResolvedPunch>& punches, time_t as_of,
    const std::string& sync_batch_id) const {
    ReconciliationOutput out;
    if (punches.empty()) return out;

    const std::string& branch_id = punches.front().event.branch_id;
    using GroupKey = std::pair<std::string, std::string>;  // user_id, date
    struct Group {
        ResolvedIdentity identity;
        std::vector<RawPunchEvent> events;
    };
    std::map<GroupKey, Group> groups;
    std::vector<RawPunchEvent> unresolved;

    for (const auto& p : punches) {
        if (p.event.branch_id != branch_id)
            throw ReconciliationError("reconcile() got punches for branches '" + branch_id + "' and '" +
                p.event.branch_id + "' in one batch");
        if (!p.identity) {
            unresolved.push_back(p.event);
            continue;
        }
        GroupKey key{ p.identity->user_id, local_date_key(p.event.timestamp, cfg_.utc_offset_minutes) };
        auto& g = groups[key];
        if (g.events.empty()) g.identity = *p.identity;
        g.events.push_back(p.event);
    }

    for (auto& [key, g] : groups) {
        std::stable_sort(g.events.begin(), g.events.end(), punch_before);
        std::unordered_set<std::string> seen;
        g.events.erase(std::remove_if(g.events.begin(), g.events.end(),
            [&seen](const RawPunchEvent& e) { return !seen.insert(punch_key(e)).second; }), g.events.end());

        AttendanceRecord r;
        r.user_id = key.first;
        r.user_type = g.identity.user_type;
        r.branch_id = branch_id;
        r.class_id = g.identity.class_id;
        r.date = key.second;
        r.clock_in_time = g.events.front().timestamp;
        if (g.events.size() >= 2) r.clock_out_time = g.events.back().timestamp;
        r.provenance.attendance_type = AttendanceType::Biometric;
        r.provenance.device_id = g.events.front().source_device_id;
        r.provenance.sync_batch_id = sync_batch_id;
        r.provenance.derived_as_of = as_of;
        r.latest_event_time = g.events.back().timestamp;
        r.punches = std::move(g.events);
        derive(r, as_of);
        out.records.push_back(std::move(r));
    }

    std::stable_sort(unresolved.begin(), unresolved.end(), punch_before);
    std::unordered_set<std::string> seen;
    for (const auto& e : unresolved) {
        if (!seen.insert(punch_key(e)).second) continue;
        out.unresolved.push_back(UnresolvedIdentity{ e.enroll_number, e.admission_number, e.timestamp, e.source_device_id });
    }
    return out;
}

std::vector<AttendanceRecord> ReconciliationEngine::synthesize_absences(const std::string& branch_id,
    const std::vector<RosterEntry>& roster, const std::set<std::string>& dates,
    const std::vector<AttendanceRecord>& observed, time_t as_of, const std::string& sync_batch_id) const {
    std::set<std::pair<std::string, std::string>> present;
    for (const auto& r : observed) present.insert({ r.user_id, r.date });

    std::vector<AttendanceRecord> out;
    for (const auto& date : dates) {
        auto midnight = local_midnight_utc(date, cfg_.utc_offset_minutes);
        if (!midnight) continue;
        for (const auto& entry : roster) {
            const WorkingHours& wh = cfg_.for_type(entry.identity.user_type);
            if (as_of <= *midnight + static_cast<time_t>(wh.end_minute) * 60) continue;
            if (present.count({ entry.identity.user_id, date })) continue;

            AttendanceRecord r;
            r.user_id = entry.identity.user_id;
            r.user_type = entry.identity.user_type;
            r.branch_id = branch_id;
            r.class_id = entry.identity.class_id;
            r.date = date;
            r.provenance.attendance_type = AttendanceType::Biometric;
            r.provenance.sync_batch_id = sync_batch_id;
            r.provenance.derived_as_of = as_of;
            derive(r, as_of);
            out.push_back(std::move(r));
        }
    }
    return out;
}
