#pragma once
#include <ctime>
#include <optional>
#include <string>

// All instants are UTC epoch seconds. Branch-local wall time is derived with
// the branch's fixed offset (minutes east of UTC), never the host timezone.

struct LocalDateTime {
    int year = 1970, month = 1, day = 1;
    int hour = 0, minute = 0, second = 0;
};

// Inverse of timegm for a broken-down UTC time; portable across platforms.
time_t utc_from_fields(int year, int month, int day, int hour, int minute, int second);

// Wall-clock fields read at a branch -> UTC instant.
time_t utc_from_local(const LocalDateTime& lt, int utc_offset_minutes);
LocalDateTime local_from_utc(time_t t, int utc_offset_minutes);

// "YYYY-MM-DD" calendar date at the branch.
std::string local_date_key(time_t t, int utc_offset_minutes);
// Minutes since branch-local midnight.
int local_minute_of_day(time_t t, int utc_offset_minutes);
// UTC instant of branch-local midnight for a "YYYY-MM-DD" key.
std::optional<time_t> local_midnight_utc(const std::string& date_key, int utc_offset_minutes);

std::string iso_from_time_t_utc(time_t t);
std::string iso_from_time_t_with_offset(time_t t, int utc_offset_minutes);

// Accepts "YYYY-MM-DDTHH:MM:SS" or "YYYY-MM-DD HH:MM:SS", optional fractional
// seconds, optional "Z" or "+HH:MM"/"-HH:MM". Without a zone designator the
// value is branch-local wall time.
std::optional<time_t> parse_iso_timestamp(const std::string& s, int utc_offset_minutes);

// "HH:MM" -> minutes since midnight.
std::optional<int> parse_hh_mm(const std::string& s);
