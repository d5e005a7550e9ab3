#include "attendance_dao.h"
#include "cursor_dao.h"
#include "fakes.h"
#include "reconciliation.h"
#include "user_dao.h"

#include <gtest/gtest.h>

namespace {

time_t at(const std::string& local) { return *parse_iso_timestamp(local, 0); }

class LedgerTest : public ::testing::Test {
protected:
    LedgerTest() : db_(":memory:"), engine_(ReconciliationConfig{}), sink_(db_, engine_, [this] { return now_; }) {}

    std::vector<AttendanceRecord> reconcile(const std::vector<RawPunchEvent>& events, const std::string& user_id) {
        std::vector<ResolvedPunch> punches;
        for (const auto& e : events)
            punches.push_back(ResolvedPunch{ e, ResolvedIdentity{ user_id, UserType::Student, std::nullopt } });
        return engine_.reconcile(punches, now_, "batch-test").records;
    }

    LedgerDb db_;
    ReconciliationEngine engine_;
    time_t now_ = at("2024-03-04 18:00:00");
    SqliteAttendanceSink sink_;
};

}  // namespace

TEST_F(LedgerTest, ReplayedBatchLeavesOneRow) {
    auto records = reconcile({ make_event("1", "2024-03-04 08:05:00"), make_event("1", "2024-03-04 17:05:00") }, "u1");
    auto first = sink_.ingest("b1", records);
    EXPECT_EQ(first.committed.size(), 1u);
    EXPECT_TRUE(first.failed.empty());
    EXPECT_EQ(count_punches(db_, "b1"), 2);

    auto second = sink_.ingest("b1", records);
    EXPECT_EQ(second.committed.size(), 1u);
    EXPECT_EQ(count_punches(db_, "b1"), 2);

    auto rows = load_attendance_for_date(db_, "b1", "2024-03-04");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].status, "present");
    EXPECT_EQ(rows[0].clock_in_utc, "2024-03-04T08:05:00Z");
    EXPECT_EQ(rows[0].clock_out_utc, "2024-03-04T17:05:00Z");
    EXPECT_DOUBLE_EQ(rows[0].total_hours, 9.0);
    EXPECT_EQ(rows[0].sync_batch_id, "batch-test");
}

TEST_F(LedgerTest, LaterPunchExtendsTheStoredDay) {
    now_ = at("2024-03-04 12:00:00");
    sink_.ingest("b1", reconcile({ make_event("1", "2024-03-04 08:20:00") }, "u1"));
    auto morning = load_attendance(db_, "b1", "u1", "2024-03-04");
    ASSERT_TRUE(morning.has_value());
    EXPECT_EQ(morning->status, "late");
    EXPECT_EQ(morning->late_minutes, 10);
    EXPECT_TRUE(morning->clock_out_utc.empty());

    now_ = at("2024-03-04 18:00:00");
    auto r = sink_.ingest("b1", reconcile({ make_event("1", "2024-03-04 16:00:00") }, "u1"));
    ASSERT_EQ(r.committed.size(), 1u);

    auto evening = load_attendance(db_, "b1", "u1", "2024-03-04");
    ASSERT_TRUE(evening.has_value());
    EXPECT_EQ(evening->clock_in_utc, "2024-03-04T08:20:00Z");
    EXPECT_EQ(evening->clock_out_utc, "2024-03-04T16:00:00Z");
    EXPECT_TRUE(evening->is_late);
    EXPECT_TRUE(evening->is_early_departure);
    EXPECT_EQ(evening->early_departure_minutes, 60);
    EXPECT_DOUBLE_EQ(evening->total_hours, 7.67);
    EXPECT_EQ(count_punches(db_, "b1"), 2);
}

TEST_F(LedgerTest, AbsenceNeverReplacesObservedDay) {
    sink_.ingest("b1", reconcile({ make_event("1", "2024-03-04 08:00:00") }, "u1"));

    std::vector<RosterEntry> roster{
        RosterEntry{ ResolvedIdentity{ "u1", UserType::Student, std::nullopt } },
        RosterEntry{ ResolvedIdentity{ "u2", UserType::Student, std::nullopt } },
    };
    // both users marked absent, as a stale roster pass would
    auto absences = engine_.synthesize_absences("b1", roster, { "2024-03-04" }, {}, now_, "batch-absent");
    ASSERT_EQ(absences.size(), 2u);
    auto r = sink_.ingest("b1", absences);
    EXPECT_EQ(r.committed.size(), 2u);

    auto u1 = load_attendance(db_, "b1", "u1", "2024-03-04");
    ASSERT_TRUE(u1.has_value());
    EXPECT_EQ(u1->clock_in_utc, "2024-03-04T08:00:00Z");
    EXPECT_NE(u1->status, "absent");

    auto u2 = load_attendance(db_, "b1", "u2", "2024-03-04");
    ASSERT_TRUE(u2.has_value());
    EXPECT_EQ(u2->status, "absent");
    EXPECT_TRUE(u2->clock_in_utc.empty());
}

TEST_F(LedgerTest, ForeignBranchRecordFailsAlone) {
    auto good = reconcile({ make_event("1", "2024-03-04 08:00:00") }, "u1");
    auto foreign = reconcile({ make_event("2", "2024-03-04 08:00:00", "dev-1", "b2") }, "u2");
    std::vector<AttendanceRecord> batch{ foreign[0], good[0] };

    auto r = sink_.ingest("b1", batch);
    ASSERT_EQ(r.failed.size(), 1u);
    EXPECT_EQ(r.failed[0].index, 0u);
    ASSERT_EQ(r.committed.size(), 1u);
    EXPECT_EQ(r.committed[0], 1u);
    EXPECT_FALSE(load_attendance(db_, "b2", "u2", "2024-03-04").has_value());
    EXPECT_EQ(count_punches(db_, "b2"), 0);
    EXPECT_EQ(count_punches(db_, "b1"), 1);
}

TEST_F(LedgerTest, EmptyBatchIsANoOp) {
    auto r = sink_.ingest("b1", {});
    EXPECT_TRUE(r.committed.empty());
    EXPECT_TRUE(r.failed.empty());
}

TEST_F(LedgerTest, CursorOnlyMovesForward) {
    SqliteSyncCursorStore cursors(db_);
    EXPECT_FALSE(cursors.get_cursor("b1").has_value());
    EXPECT_FALSE(cursors.get_last_sync_time("b1").has_value());

    EXPECT_TRUE(cursors.set_last_sync_time("b1", 1000, "batch-a"));
    EXPECT_FALSE(cursors.set_last_sync_time("b1", 900, "batch-b"));
    EXPECT_FALSE(cursors.set_last_sync_time("b1", 1000, "batch-c"));
    auto c = cursors.get_cursor("b1");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->last_sync_time, 1000);
    EXPECT_EQ(c->last_sync_batch_id, "batch-a");

    EXPECT_TRUE(cursors.set_last_sync_time("b1", 2000, "batch-d"));
    EXPECT_EQ(*cursors.get_last_sync_time("b1"), 2000);
    EXPECT_FALSE(cursors.get_cursor("b2").has_value());
}

TEST_F(LedgerTest, StoredStatusUsesTheCycleInstant) {
    // derived just before the 17:00 end, committed after it
    now_ = at("2024-03-04 16:59:00");
    auto records = reconcile({ make_event("1", "2024-03-04 08:00:00") }, "u1");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].status, AttendanceStatus::Present);

    now_ = at("2024-03-04 17:30:00");
    ASSERT_EQ(sink_.ingest("b1", records).committed.size(), 1u);
    auto row = load_attendance(db_, "b1", "u1", "2024-03-04");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->status, "present");

    // a later cycle derives against its own instant
    auto later = reconcile({ make_event("1", "2024-03-04 08:00:00") }, "u1");
    ASSERT_EQ(sink_.ingest("b1", later).committed.size(), 1u);
    EXPECT_EQ(load_attendance(db_, "b1", "u1", "2024-03-04")->status, "half_day");
}

TEST_F(LedgerTest, PunchReactivatesInactiveUser) {
    User u;
    u.id = "stu-1"; u.branch_id = "b1"; u.enroll_number = "1"; u.active = false;
    ASSERT_TRUE(upsert_user(db_, u));

    SqliteUserDirectory dir(db_);
    EXPECT_TRUE(dir.expected_roster("b1").empty());
    auto id = dir.resolve_identity("b1", "1", std::nullopt);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->user_id, "stu-1");

    auto r = sink_.ingest("b1", reconcile({ make_event("1", "2024-03-04 08:00:00") }, id->user_id));
    ASSERT_EQ(r.committed.size(), 1u);
    auto users = load_users(db_, "b1");
    ASSERT_EQ(users.size(), 1u);
    EXPECT_TRUE(users[0].active);
    ASSERT_EQ(dir.expected_roster("b1").size(), 1u);
}

TEST_F(LedgerTest, AbsenceDoesNotReactivate) {
    User u;
    u.id = "stu-1"; u.branch_id = "b1"; u.enroll_number = "1"; u.active = false;
    ASSERT_TRUE(upsert_user(db_, u));
    std::vector<RosterEntry> roster{ RosterEntry{ ResolvedIdentity{ "stu-1", UserType::Student, std::nullopt } } };
    auto absences = engine_.synthesize_absences("b1", roster, { "2024-03-04" }, {}, now_, "batch-absent");
    ASSERT_EQ(sink_.ingest("b1", absences).committed.size(), 1u);
    EXPECT_FALSE(load_users(db_, "b1")[0].active);
}

TEST_F(LedgerTest, DirectoryPrefersAdmissionNumber) {
    User a;
    a.id = "stu-1"; a.branch_id = "b1"; a.name = "Amina"; a.enroll_number = "7"; a.class_id = "4B";
    User b;
    b.id = "stu-2"; b.branch_id = "b1"; b.name = "Brian"; b.enroll_number = "8"; b.admission_number = "ADM-2";
    User gone;
    gone.id = "stu-3"; gone.branch_id = "b1"; gone.enroll_number = "9"; gone.active = false;
    User elsewhere;
    elsewhere.id = "tch-1"; elsewhere.branch_id = "b2"; elsewhere.enroll_number = "7"; elsewhere.type = UserType::Teacher;
    for (const auto* u : { &a, &b, &gone, &elsewhere }) {
        std::string err;
        ASSERT_TRUE(upsert_user(db_, *u, &err)) << err;
    }

    SqliteUserDirectory dir(db_);
    auto by_enroll = dir.resolve_identity("b1", "7", std::nullopt);
    ASSERT_TRUE(by_enroll.has_value());
    EXPECT_EQ(by_enroll->user_id, "stu-1");
    EXPECT_EQ(by_enroll->class_id, std::optional<std::string>("4B"));

    auto by_admission = dir.resolve_identity("b1", "7", std::string("ADM-2"));
    ASSERT_TRUE(by_admission.has_value());
    EXPECT_EQ(by_admission->user_id, "stu-2");

    auto fallback = dir.resolve_identity("b1", "8", std::string("ADM-unknown"));
    ASSERT_TRUE(fallback.has_value());
    EXPECT_EQ(fallback->user_id, "stu-2");

    auto inactive = dir.resolve_identity("b1", "9", std::nullopt);
    ASSERT_TRUE(inactive.has_value());
    EXPECT_EQ(inactive->user_id, "stu-3");
    EXPECT_FALSE(dir.resolve_identity("b1", "404", std::nullopt).has_value());

    auto other = dir.resolve_identity("b2", "7", std::nullopt);
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(other->user_type, UserType::Teacher);

    auto roster = dir.expected_roster("b1");
    ASSERT_EQ(roster.size(), 2u);
    EXPECT_EQ(roster[0].identity.user_id, "stu-1");
    EXPECT_EQ(roster[1].identity.user_id, "stu-2");
    EXPECT_EQ(load_users(db_, "b1").size(), 3u);
}
