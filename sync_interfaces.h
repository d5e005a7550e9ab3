#pragma once
#include "punch_types.h"

#include <ctime>
#include <optional>
#include <string>
#include <vector>

// Collaborators of the sync pipeline. Implementations must tolerate calls from
// several branch workers at once; the cursor for one branch is only written by
// that branch's worker.

class AttendanceSink {
public:
    virtual ~AttendanceSink() = default;
    // Commits records and reports the outcome per record. Throws CommitError
    // only when nothing could be attempted (store unreachable).
    virtual IngestResult ingest(const std::string& branch_id, const std::vector<AttendanceRecord>& records) = 0;
};

struct RosterEntry {
    ResolvedIdentity identity;
};

class UserDirectory {
public:
    virtual ~UserDirectory() = default;
    // Admission number wins when present; otherwise the device enroll number.
    virtual std::optional<ResolvedIdentity> resolve_identity(const std::string& branch_id,
        const std::string& enroll_number, const std::optional<std::string>& admission_number) = 0;
    // People expected on site at the branch; empty when no roster is kept.
    virtual std::vector<RosterEntry> expected_roster(const std::string& branch_id) { (void)branch_id; return {}; }
};

struct SyncCursor {
    std::string branch_id;
    time_t last_sync_time = 0;
    std::string last_sync_batch_id;
};

class SyncCursorStore {
public:
    virtual ~SyncCursorStore() = default;
    virtual std::optional<SyncCursor> get_cursor(const std::string& branch_id) = 0;
    // Stores only if ts is newer than the stored watermark; returns whether it moved.
    virtual bool set_last_sync_time(const std::string& branch_id, time_t ts, const std::string& batch_id) = 0;

    std::optional<time_t> get_last_sync_time(const std::string& branch_id) {
        auto c = get_cursor(branch_id);
        if (!c) return std::nullopt;
        return c->last_sync_time;
    }
};

// Pulls punches strictly newer than the watermark, ascending by timestamp.
// Throws ExtractionError on connectivity or query failure.
class LogExtractor {
public:
    virtual ~LogExtractor() = default;
    virtual std::vector<RawPunchEvent> extract_since(const std::string& branch_id, time_t last_sync_time) = 0;
    // Probe used by --test; throws ExtractionError with the reason.
    virtual void test_connection() = 0;
    virtual std::string describe() const = 0;
};
