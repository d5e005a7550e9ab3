#include "time_util.h"

#include <cctype>
#include <cstdio>

static inline bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0); }
static inline int days_in_month(int y, int m) {
    static const int dm[] = { 31,28,31,30,31,30,31,31,30,31,30,31 };
    return (m == 2) ? (dm[m - 1] + (is_leap(y) ? 1 : 0)) : dm[m - 1];
}

// days since 1970-01-01 for a proleptic Gregorian date
static long long days_from_civil(int y, int m, int d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

time_t utc_from_fields(int year, int month, int day, int hour, int minute, int second) {
    const long long days = days_from_civil(year, month, day);
    return static_cast<time_t>(days * 86400LL + hour * 3600LL + minute * 60LL + second);
}

time_t utc_from_local(const LocalDateTime& lt, int utc_offset_minutes) {
    return utc_from_fields(lt.year, lt.month, lt.day, lt.hour, lt.minute, lt.second)
        - static_cast<time_t>(utc_offset_minutes) * 60;
}

LocalDateTime local_from_utc(time_t t, int utc_offset_minutes) {
    time_t shifted = t + static_cast<time_t>(utc_offset_minutes) * 60;
    std::tm g{};
#if defined(_WIN32)
    gmtime_s(&g, &shifted);
#else
    gmtime_r(&shifted, &g);
#endif
    LocalDateTime out;
    out.year = g.tm_year + 1900; out.month = g.tm_mon + 1; out.day = g.tm_mday;
    out.hour = g.tm_hour; out.minute = g.tm_min; out.second = g.tm_sec;
    return out;
}

std::string local_date_key(time_t t, int utc_offset_minutes) {
    LocalDateTime lt = local_from_utc(t, utc_offset_minutes);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", lt.year, lt.month, lt.day);
    return buf;
}

int local_minute_of_day(time_t t, int utc_offset_minutes) {
    LocalDateTime lt = local_from_utc(t, utc_offset_minutes);
    return lt.hour * 60 + lt.minute;
}

std::optional<time_t> local_midnight_utc(const std::string& date_key, int utc_offset_minutes) {
    int y = 0, m = 0, d = 0;
    if (std::sscanf(date_key.c_str(), "%4d-%2d-%2d", &y, &m, &d) != 3) return std::nullopt;
    if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) return std::nullopt;
    LocalDateTime lt; lt.year = y; lt.month = m; lt.day = d;
    return utc_from_local(lt, utc_offset_minutes);
}

std::string iso_from_time_t_utc(time_t t) {
    LocalDateTime g = local_from_utc(t, 0);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
        g.year, g.month, g.day, g.hour, g.minute, g.second);
    return buf;
}

std::string iso_from_time_t_with_offset(time_t t, int utc_offset_minutes) {
    LocalDateTime lt = local_from_utc(t, utc_offset_minutes);
    const int off = utc_offset_minutes < 0 ? -utc_offset_minutes : utc_offset_minutes;
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d%c%02d:%02d",
        lt.year, lt.month, lt.day, lt.hour, lt.minute, lt.second,
        utc_offset_minutes < 0 ? '-' : '+', off / 60, off % 60);
    return buf;
}

static bool read_digits(const std::string& s, size_t pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + n; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

std::optional<time_t> parse_iso_timestamp(const std::string& s, int utc_offset_minutes) {
    LocalDateTime lt;
    if (!read_digits(s, 0, 4, lt.year) || s.size() < 10 || s[4] != '-' ||
        !read_digits(s, 5, 2, lt.month) || s[7] != '-' || !read_digits(s, 8, 2, lt.day))
        return std::nullopt;
    if (lt.month < 1 || lt.month > 12 || lt.day < 1 || lt.day > days_in_month(lt.year, lt.month))
        return std::nullopt;

    size_t pos = 10;
    if (pos < s.size()) {
        if (s[pos] != 'T' && s[pos] != ' ') return std::nullopt;
        if (!read_digits(s, pos + 1, 2, lt.hour) || pos + 3 >= s.size() || s[pos + 3] != ':' ||
            !read_digits(s, pos + 4, 2, lt.minute))
            return std::nullopt;
        pos += 6;
        if (pos < s.size() && s[pos] == ':') {
            if (!read_digits(s, pos + 1, 2, lt.second)) return std::nullopt;
            pos += 3;
        }
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
        }
    }
    if (lt.hour > 23 || lt.minute > 59 || lt.second > 60) return std::nullopt;

    int offset = utc_offset_minutes;
    if (pos < s.size()) {
        if (s[pos] == 'Z' && pos + 1 == s.size()) {
            offset = 0;
        }
        else if (s[pos] == '+' || s[pos] == '-') {
            int oh = 0, om = 0;
            if (!read_digits(s, pos + 1, 2, oh)) return std::nullopt;
            size_t mpos = pos + 3;
            if (mpos < s.size() && s[mpos] == ':') ++mpos;
            if (!read_digits(s, mpos, 2, om) || mpos + 2 != s.size()) return std::nullopt;
            offset = (oh * 60 + om) * (s[pos] == '-' ? -1 : 1);
        }
        else {
            return std::nullopt;
        }
    }
    return utc_from_local(lt, offset);
}

std::optional<int> parse_hh_mm(const std::string& s) {
    int h = 0, m = 0;
    if (s.size() != 5 || s[2] != ':' || !read_digits(s, 0, 2, h) || !read_digits(s, 3, 2, m)) return std::nullopt;
    if (h > 23 || m > 59) return std::nullopt;
    return h * 60 + m;
}
