#include "time_util.h"

#include <gtest/gtest.h>

TEST(TimeUtil, FieldsToEpoch) {
    EXPECT_EQ(utc_from_fields(1970, 1, 1, 0, 0, 0), 0);
    EXPECT_EQ(utc_from_fields(2024, 3, 4, 8, 0, 0), 1709539200);
    EXPECT_EQ(utc_from_fields(2024, 2, 29, 0, 0, 0), 1709164800);
    EXPECT_EQ(utc_from_fields(1969, 12, 31, 23, 59, 59), -1);
}

TEST(TimeUtil, BranchLocalRoundTrip) {
    LocalDateTime lt;
    lt.year = 2024; lt.month = 3; lt.day = 4; lt.hour = 8; lt.minute = 5; lt.second = 30;
    const time_t t = utc_from_local(lt, 180);
    EXPECT_EQ(t, utc_from_fields(2024, 3, 4, 5, 5, 30));
    LocalDateTime back = local_from_utc(t, 180);
    EXPECT_EQ(back.hour, 8);
    EXPECT_EQ(back.minute, 5);
    EXPECT_EQ(back.second, 30);
    EXPECT_EQ(local_minute_of_day(t, 180), 8 * 60 + 5);
}

TEST(TimeUtil, DateKeyFollowsOffset) {
    const time_t late_evening = utc_from_fields(2024, 3, 4, 22, 30, 0);
    EXPECT_EQ(local_date_key(late_evening, 0), "2024-03-04");
    EXPECT_EQ(local_date_key(late_evening, 180), "2024-03-05");
    EXPECT_EQ(local_date_key(utc_from_fields(2024, 3, 5, 2, 0, 0), -300), "2024-03-04");
}

TEST(TimeUtil, LocalMidnight) {
    EXPECT_EQ(*local_midnight_utc("2024-03-05", 180), utc_from_fields(2024, 3, 4, 21, 0, 0));
    EXPECT_EQ(*local_midnight_utc("2024-03-05", 0), utc_from_fields(2024, 3, 5, 0, 0, 0));
    EXPECT_FALSE(local_midnight_utc("2023-02-29", 0).has_value());
    EXPECT_FALSE(local_midnight_utc("2024-13-01", 0).has_value());
    EXPECT_FALSE(local_midnight_utc("05/03/2024", 0).has_value());
}

TEST(TimeUtil, FormatIso) {
    const time_t t = utc_from_fields(2024, 3, 4, 5, 7, 9);
    EXPECT_EQ(iso_from_time_t_utc(t), "2024-03-04T05:07:09Z");
    EXPECT_EQ(iso_from_time_t_with_offset(t, 180), "2024-03-04T08:07:09+03:00");
    EXPECT_EQ(iso_from_time_t_with_offset(t, -330), "2024-03-03T23:37:09-05:30");
}

TEST(TimeUtil, ParseAcceptedForms) {
    const time_t t = utc_from_fields(2024, 3, 4, 5, 0, 0);
    EXPECT_EQ(*parse_iso_timestamp("2024-03-04T05:00:00Z", 180), t);
    EXPECT_EQ(*parse_iso_timestamp("2024-03-04T08:00:00+03:00", 0), t);
    EXPECT_EQ(*parse_iso_timestamp("2024-03-04T08:00:00+0300", 0), t);
    EXPECT_EQ(*parse_iso_timestamp("2024-03-04 08:00:00", 180), t);
    EXPECT_EQ(*parse_iso_timestamp("2024-03-04T08:00", 180), t);
    EXPECT_EQ(*parse_iso_timestamp("2024-03-04T05:00:00.123Z", 0), t);
    EXPECT_EQ(*parse_iso_timestamp("2024-03-04T00:00:00-05:00", 0), t);
    EXPECT_EQ(*parse_iso_timestamp("2024-03-04", 0), utc_from_fields(2024, 3, 4, 0, 0, 0));
}

TEST(TimeUtil, ParseRejectsGarbage) {
    for (const char* bad : { "", "yesterday", "2024-3-4 08:00:00", "2024-02-30T08:00:00",
                             "2024-03-04T25:00:00", "2024-03-04T08:61:00", "2024-03-04X08:00:00",
                             "2024-03-04T08:00:00Q", "2024-03-04T08:00:00+3", "2024-03-04T08:00:00Zjunk" })
        EXPECT_FALSE(parse_iso_timestamp(bad, 0).has_value()) << bad;
}

TEST(TimeUtil, ParseHoursMinutes) {
    EXPECT_EQ(*parse_hh_mm("08:10"), 490);
    EXPECT_EQ(*parse_hh_mm("00:00"), 0);
    EXPECT_EQ(*parse_hh_mm("23:59"), 23 * 60 + 59);
    EXPECT_FALSE(parse_hh_mm("24:00").has_value());
    EXPECT_FALSE(parse_hh_mm("8:10").has_value());
    EXPECT_FALSE(parse_hh_mm("08-10").has_value());
}
