#include "fakes.h"
#include "reconciliation.h"
#include "sync_errors.h"
#include "time_util.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <random>

namespace {

ResolvedPunch resolved(RawPunchEvent e, const std::string& user_id, UserType type = UserType::Student) {
    return ResolvedPunch{ std::move(e), ResolvedIdentity{ user_id, type, std::string("class-7") } };
}

ResolvedPunch unresolved(RawPunchEvent e) {
    return ResolvedPunch{ std::move(e), std::nullopt };
}

time_t at(const std::string& local) { return *parse_iso_timestamp(local, 0); }

ReconciliationEngine default_engine(int offset = 0) {
    ReconciliationConfig cfg;
    cfg.utc_offset_minutes = offset;
    return ReconciliationEngine(cfg);
}

}  // namespace

TEST(Reconciliation, FirstAndLastPunchBoundTheDay) {
    auto engine = default_engine();
    std::vector<ResolvedPunch> punches{
        resolved(make_event("42", "2024-03-04 09:05:00"), "u42"),
        resolved(make_event("42", "2024-03-04 12:00:00"), "u42"),
        resolved(make_event("42", "2024-03-04 13:00:00"), "u42"),
        resolved(make_event("42", "2024-03-04 17:10:00"), "u42"),
    };
    auto out = engine.reconcile(punches, at("2024-03-04 18:00:00"), "batch-1");
    ASSERT_EQ(out.records.size(), 1u);
    const auto& r = out.records[0];
    EXPECT_EQ(r.user_id, "u42");
    EXPECT_EQ(r.branch_id, "b1");
    EXPECT_EQ(r.date, "2024-03-04");
    EXPECT_EQ(*r.clock_in_time, at("2024-03-04 09:05:00"));
    EXPECT_EQ(*r.clock_out_time, at("2024-03-04 17:10:00"));
    EXPECT_TRUE(r.is_late);
    EXPECT_EQ(r.late_minutes, 55);
    EXPECT_FALSE(r.is_early_departure);
    EXPECT_DOUBLE_EQ(r.total_hours, 8.08);
    EXPECT_EQ(r.status, AttendanceStatus::Late);
    EXPECT_EQ(r.punches.size(), 4u);
    EXPECT_EQ(r.latest_event_time, at("2024-03-04 17:10:00"));
    EXPECT_EQ(r.provenance.sync_batch_id, "batch-1");
    EXPECT_EQ(r.provenance.attendance_type, AttendanceType::Biometric);
    EXPECT_EQ(r.class_id, std::optional<std::string>("class-7"));
    EXPECT_TRUE(out.unresolved.empty());
}

TEST(Reconciliation, SinglePunchIsClockInOnly) {
    auto engine = default_engine();
    std::vector<ResolvedPunch> punches{ resolved(make_event("1", "2024-03-04 08:05:00"), "u1") };

    auto morning = engine.reconcile(punches, at("2024-03-04 12:00:00"), "b");
    ASSERT_EQ(morning.records.size(), 1u);
    EXPECT_FALSE(morning.records[0].clock_out_time.has_value());
    EXPECT_EQ(morning.records[0].status, AttendanceStatus::Present);
    EXPECT_DOUBLE_EQ(morning.records[0].total_hours, 0.0);

    auto evening = engine.reconcile(punches, at("2024-03-04 17:30:00"), "b");
    EXPECT_EQ(evening.records[0].status, AttendanceStatus::HalfDay);
}

TEST(Reconciliation, LatenessCountsFromEndOfGrace) {
    auto engine = default_engine();
    auto late = engine.reconcile({ resolved(make_event("1", "2024-03-04 08:15:00"), "u1") },
        at("2024-03-04 12:00:00"), "b");
    EXPECT_TRUE(late.records[0].is_late);
    EXPECT_EQ(late.records[0].late_minutes, 5);

    auto in_grace = engine.reconcile({ resolved(make_event("1", "2024-03-04 08:09:59"), "u1") },
        at("2024-03-04 12:00:00"), "b");
    EXPECT_FALSE(in_grace.records[0].is_late);
    EXPECT_EQ(in_grace.records[0].late_minutes, 0);
    EXPECT_EQ(in_grace.records[0].status, AttendanceStatus::Present);
}

TEST(Reconciliation, TeacherHoursApplyToTeachers) {
    ReconciliationConfig cfg;
    cfg.teacher.start_minute = 7 * 60 + 30;
    cfg.teacher.grace_minutes = 0;
    ReconciliationEngine engine(cfg);
    auto out = engine.reconcile({ resolved(make_event("9", "2024-03-04 07:45:00"), "t9", UserType::Teacher) },
        at("2024-03-04 12:00:00"), "b");
    EXPECT_EQ(out.records[0].user_type, UserType::Teacher);
    EXPECT_EQ(out.records[0].late_minutes, 15);
}

TEST(Reconciliation, EarlyDepartureNeedsClockOut) {
    auto engine = default_engine();
    auto out = engine.reconcile({
        resolved(make_event("1", "2024-03-04 08:00:00"), "u1"),
        resolved(make_event("1", "2024-03-04 16:30:00"), "u1"),
    }, at("2024-03-04 18:00:00"), "b");
    const auto& r = out.records[0];
    EXPECT_TRUE(r.is_early_departure);
    EXPECT_EQ(r.early_departure_minutes, 30);
    EXPECT_EQ(r.status, AttendanceStatus::EarlyDeparture);
    EXPECT_DOUBLE_EQ(r.total_hours, 8.5);
}

TEST(Reconciliation, LateOutranksEarlyDeparture) {
    auto engine = default_engine();
    auto out = engine.reconcile({
        resolved(make_event("1", "2024-03-04 09:00:00"), "u1"),
        resolved(make_event("1", "2024-03-04 16:00:00"), "u1"),
    }, at("2024-03-04 18:00:00"), "b");
    const auto& r = out.records[0];
    EXPECT_TRUE(r.is_late);
    EXPECT_TRUE(r.is_early_departure);
    EXPECT_EQ(r.early_departure_minutes, 60);
    EXPECT_EQ(r.status, AttendanceStatus::Late);
}

TEST(Reconciliation, InputOrderAndDuplicatesDoNotMatter) {
    auto engine = default_engine();
    std::vector<ResolvedPunch> punches{
        resolved(make_event("1", "2024-03-04 08:02:00"), "u1"),
        resolved(make_event("1", "2024-03-04 12:30:00"), "u1"),
        resolved(make_event("1", "2024-03-04 17:05:00"), "u1"),
        resolved(make_event("2", "2024-03-04 08:20:00"), "u2"),
        resolved(make_event("2", "2024-03-05 08:01:00"), "u2"),
    };
    const time_t as_of = at("2024-03-06 00:00:00");
    auto expected = engine.reconcile(punches, as_of, "b");
    ASSERT_EQ(expected.records.size(), 3u);
    EXPECT_EQ(expected.records[0].user_id, "u1");
    EXPECT_EQ(expected.records[1].date, "2024-03-04");
    EXPECT_EQ(expected.records[2].date, "2024-03-05");

    std::mt19937 rng(7);
    for (int round = 0; round < 5; ++round) {
        auto shuffled = punches;
        shuffled.push_back(punches[round % punches.size()]);
        std::shuffle(shuffled.begin(), shuffled.end(), rng);
        auto again = engine.reconcile(shuffled, as_of, "b");
        ASSERT_EQ(again.records.size(), expected.records.size());
        for (size_t i = 0; i < expected.records.size(); ++i)
            EXPECT_EQ(again.records[i], expected.records[i]) << "round " << round << " record " << i;
    }
}

TEST(Reconciliation, SameSecondPunchesOrderInBeforeOut) {
    auto engine = default_engine();
    auto out_punch = make_event("1", "2024-03-04 08:00:00", "dev-a");
    out_punch.direction = PunchDirection::Out;
    auto in_punch = make_event("1", "2024-03-04 08:00:00", "dev-b");
    in_punch.direction = PunchDirection::In;

    auto out = engine.reconcile({ resolved(out_punch, "u1"), resolved(in_punch, "u1") },
        at("2024-03-04 12:00:00"), "b");
    const auto& r = out.records[0];
    ASSERT_EQ(r.punches.size(), 2u);
    EXPECT_EQ(r.punches[0].direction, PunchDirection::In);
    EXPECT_EQ(r.provenance.device_id, "dev-b");
    EXPECT_DOUBLE_EQ(r.total_hours, 0.0);
}

TEST(Reconciliation, UnknownUsersAreReportedNotRecorded) {
    auto engine = default_engine();
    auto stranger = make_event("999", "2024-03-04 08:30:00");
    stranger.admission_number = "ADM-9";
    auto out = engine.reconcile({
        resolved(make_event("1", "2024-03-04 08:00:00"), "u1"),
        unresolved(stranger),
        unresolved(stranger),
    }, at("2024-03-04 12:00:00"), "b");
    EXPECT_EQ(out.records.size(), 1u);
    ASSERT_EQ(out.unresolved.size(), 1u);
    EXPECT_EQ(out.unresolved[0].enroll_number, "999");
    EXPECT_EQ(out.unresolved[0].admission_number, std::optional<std::string>("ADM-9"));
    EXPECT_EQ(out.unresolved[0].timestamp, stranger.timestamp);
}

TEST(Reconciliation, MixedBranchesAreABug) {
    auto engine = default_engine();
    EXPECT_THROW(engine.reconcile({
        resolved(make_event("1", "2024-03-04 08:00:00", "d", "b1"), "u1"),
        resolved(make_event("2", "2024-03-04 08:00:00", "d", "b2"), "u2"),
    }, at("2024-03-04 12:00:00"), "b"), ReconciliationError);
}

TEST(Reconciliation, DateFollowsBranchOffset) {
    auto engine = default_engine(180);
    RawPunchEvent e = make_event("1", "2024-03-04T22:30:00Z");
    auto out = engine.reconcile({ resolved(e, "u1") }, e.timestamp + 3600, "b");
    ASSERT_EQ(out.records.size(), 1u);
    EXPECT_EQ(out.records[0].date, "2024-03-05");
    // 01:30 local is well before the start of the day
    EXPECT_FALSE(out.records[0].is_late);
}

TEST(Reconciliation, EmptyInputGivesEmptyOutput) {
    auto out = default_engine().reconcile({}, 0, "b");
    EXPECT_TRUE(out.records.empty());
    EXPECT_TRUE(out.unresolved.empty());
}

TEST(Reconciliation, DeriveRejectsClockOutBeforeClockIn) {
    auto engine = default_engine();
    AttendanceRecord r;
    r.user_id = "u1";
    r.date = "2024-03-04";
    r.clock_in_time = at("2024-03-04 10:00:00");
    r.clock_out_time = at("2024-03-04 09:00:00");
    EXPECT_THROW(engine.derive(r, r.clock_in_time.value()), ReconciliationError);
    r.date = "04/03/2024";
    r.clock_out_time.reset();
    EXPECT_THROW(engine.derive(r, 0), ReconciliationError);
}

TEST(DeriveStatus, Precedence) {
    EXPECT_EQ(derive_status(false, false, 0, 0, true), AttendanceStatus::Absent);
    EXPECT_EQ(derive_status(false, false, 0, 0, false), AttendanceStatus::Absent);
    EXPECT_EQ(derive_status(true, true, 5, 30, true), AttendanceStatus::Late);
    EXPECT_EQ(derive_status(true, false, 5, 0, true), AttendanceStatus::Late);
    EXPECT_EQ(derive_status(true, true, 0, 30, true), AttendanceStatus::EarlyDeparture);
    EXPECT_EQ(derive_status(true, false, 0, 0, true), AttendanceStatus::HalfDay);
    EXPECT_EQ(derive_status(true, false, 0, 0, false), AttendanceStatus::Present);
    EXPECT_EQ(derive_status(true, true, 0, 0, true), AttendanceStatus::Present);
}

TEST(DeriveStatus, HoursRoundToHundredths) {
    EXPECT_DOUBLE_EQ(round_hours(0), 0.0);
    EXPECT_DOUBLE_EQ(round_hours(3600), 1.0);
    EXPECT_DOUBLE_EQ(round_hours(8 * 3600 + 5 * 60), 8.08);
    EXPECT_DOUBLE_EQ(round_hours(90), 0.03);
}

TEST(Reconciliation, AbsencesOnlyAfterTheDayEnds) {
    auto engine = default_engine();
    std::vector<RosterEntry> roster{
        RosterEntry{ ResolvedIdentity{ "u1", UserType::Student, std::nullopt } },
        RosterEntry{ ResolvedIdentity{ "u2", UserType::Student, std::nullopt } },
    };
    auto observed = engine.reconcile({ resolved(make_event("1", "2024-03-04 08:00:00"), "u1") },
        at("2024-03-04 18:00:00"), "b").records;

    auto before = engine.synthesize_absences("b1", roster, { "2024-03-04" }, observed,
        at("2024-03-04 16:00:00"), "b");
    EXPECT_TRUE(before.empty());

    auto after = engine.synthesize_absences("b1", roster, { "2024-03-04" }, observed,
        at("2024-03-04 18:00:00"), "b");
    ASSERT_EQ(after.size(), 1u);
    EXPECT_EQ(after[0].user_id, "u2");
    EXPECT_EQ(after[0].branch_id, "b1");
    EXPECT_EQ(after[0].status, AttendanceStatus::Absent);
    EXPECT_FALSE(after[0].clock_in_time.has_value());
    EXPECT_TRUE(after[0].punches.empty());
}
