#pragma once
#include "sync_errors.h"
#include "sync_interfaces.h"
#include "time_util.h"

#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// In-memory collaborators for pipeline tests.

inline RawPunchEvent make_event(const std::string& enroll, const std::string& local_time,
    const std::string& device = "dev-1", const std::string& branch = "b1", int utc_offset_minutes = 0) {
    RawPunchEvent e;
    e.enroll_number = enroll;
    e.branch_id = branch;
    e.timestamp = *parse_iso_timestamp(local_time, utc_offset_minutes);
    e.source_device_id = device;
    return e;
}

class FakeExtractor : public LogExtractor {
public:
    std::vector<RawPunchEvent> events;
    int fail_first = 0;        // throw ExtractionError on this many calls
    bool always_fail = false;
    bool throw_unexpected = false;  // a non-ExtractionError, as a library bug would
    std::atomic<int> calls{ 0 };
    std::vector<time_t> since_seen;

    std::vector<RawPunchEvent> extract_since(const std::string&, time_t last_sync_time) override {
        std::lock_guard<std::mutex> lk(m_);
        ++calls;
        since_seen.push_back(last_sync_time);
        if (throw_unexpected) throw std::runtime_error("vendor driver exploded");
        if (always_fail || fail_first > 0) {
            if (fail_first > 0) --fail_first;
            throw ExtractionError("source unreachable");
        }
        std::vector<RawPunchEvent> out;
        for (const auto& e : events)
            if (e.timestamp > last_sync_time) out.push_back(e);
        std::stable_sort(out.begin(), out.end(),
            [](const RawPunchEvent& a, const RawPunchEvent& b) { return a.timestamp < b.timestamp; });
        return out;
    }
    void test_connection() override {}
    std::string describe() const override { return "fake"; }

private:
    std::mutex m_;
};

class FakeDirectory : public UserDirectory {
public:
    std::map<std::string, ResolvedIdentity> by_enroll;
    std::map<std::string, ResolvedIdentity> by_admission;
    std::vector<RosterEntry> roster;
    int lookups = 0;

    void add(const std::string& enroll, const std::string& user_id, UserType type = UserType::Student) {
        by_enroll[enroll] = ResolvedIdentity{ user_id, type, std::nullopt };
        roster.push_back(RosterEntry{ by_enroll[enroll] });
    }

    std::optional<ResolvedIdentity> resolve_identity(const std::string&, const std::string& enroll_number,
        const std::optional<std::string>& admission_number) override {
        ++lookups;
        if (admission_number) {
            auto it = by_admission.find(*admission_number);
            if (it != by_admission.end()) return it->second;
        }
        auto it = by_enroll.find(enroll_number);
        if (it == by_enroll.end()) return std::nullopt;
        return it->second;
    }
    std::vector<RosterEntry> expected_roster(const std::string&) override { return roster; }
};

class FakeCursorStore : public SyncCursorStore {
public:
    std::map<std::string, SyncCursor> cursors;
    int writes = 0;

    std::optional<SyncCursor> get_cursor(const std::string& branch_id) override {
        auto it = cursors.find(branch_id);
        if (it == cursors.end()) return std::nullopt;
        return it->second;
    }
    bool set_last_sync_time(const std::string& branch_id, time_t ts, const std::string& batch_id) override {
        ++writes;
        auto it = cursors.find(branch_id);
        if (it != cursors.end() && it->second.last_sync_time >= ts) return false;
        cursors[branch_id] = SyncCursor{ branch_id, ts, batch_id };
        return true;
    }
};

class FakeSink : public AttendanceSink {
public:
    std::set<std::string> failing_users;  // per-record failure for these
    int throw_first = 0;                  // wholesale CommitError on this many calls
    int calls = 0;
    std::vector<AttendanceRecord> committed;
    std::function<void(int call)> after_ingest;

    IngestResult ingest(const std::string&, const std::vector<AttendanceRecord>& records) override {
        std::lock_guard<std::mutex> lk(m_);
        ++calls;
        if (throw_first > 0) {
            --throw_first;
            throw CommitError("ledger unavailable");
        }
        IngestResult r;
        for (size_t i = 0; i < records.size(); ++i) {
            if (failing_users.count(records[i].user_id)) {
                r.failed.push_back(RecordFailure{ i, "rejected " + records[i].user_id });
                continue;
            }
            committed.push_back(records[i]);
            r.committed.push_back(i);
        }
        if (after_ingest) after_ingest(calls);
        return r;
    }

private:
    std::mutex m_;
};
