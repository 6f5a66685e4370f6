#include "timesheet/Timestamp.hpp"
#include "timesheet/Errors.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <tuple>

namespace timesheet {

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// reads exactly n digits at pos, advances pos
static bool read_fixed(const std::string& s, size_t& pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < n; ++i) {
        const char c = s[pos + i];
        if (!is_digit(c)) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    pos += n;
    return true;
}

static bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return days[m - 1];
}

static ParseError bad_timestamp(const std::string& s, const std::string& why) {
    return ParseError("invalid timestamp '" + s + "': " + why);
}

Timestamp Timestamp::parse(const std::string& s) {
    Timestamp t;
    size_t pos = 0;

    if (!read_fixed(s, pos, 4, t.year)) throw bad_timestamp(s, "expected YYYY-MM-DD");
    if (pos >= s.size() || s[pos] != '-') throw bad_timestamp(s, "expected YYYY-MM-DD");
    ++pos;
    if (!read_fixed(s, pos, 2, t.month)) throw bad_timestamp(s, "expected YYYY-MM-DD");
    if (pos >= s.size() || s[pos] != '-') throw bad_timestamp(s, "expected YYYY-MM-DD");
    ++pos;
    if (!read_fixed(s, pos, 2, t.day)) throw bad_timestamp(s, "expected YYYY-MM-DD");

    if (t.year < 1) throw bad_timestamp(s, "year out of range");
    if (t.month < 1 || t.month > 12) throw bad_timestamp(s, "month out of range");
    if (t.day < 1 || t.day > days_in_month(t.year, t.month)) throw bad_timestamp(s, "day out of range");

    if (pos == s.size()) return t;

    if (s[pos] != 'T' && s[pos] != ' ') throw bad_timestamp(s, "unexpected character after date");
    ++pos;

    if (!read_fixed(s, pos, 2, t.hour)) throw bad_timestamp(s, "expected HH");
    if (pos < s.size() && s[pos] == ':') {
        ++pos;
        if (!read_fixed(s, pos, 2, t.minute)) throw bad_timestamp(s, "expected MM");
        if (pos < s.size() && s[pos] == ':') {
            ++pos;
            if (!read_fixed(s, pos, 2, t.second)) throw bad_timestamp(s, "expected SS");
            if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
                ++pos;
                size_t digits = 0;
                int frac = 0;
                while (pos < s.size() && is_digit(s[pos]) && digits < 6) {
                    frac = frac * 10 + (s[pos] - '0');
                    ++pos;
                    ++digits;
                }
                if (digits == 0) throw bad_timestamp(s, "expected fractional seconds");
                for (size_t i = digits; i < 6; ++i) frac *= 10;
                t.microsecond = frac;
            }
        }
    }

    if (pos != s.size()) throw bad_timestamp(s, "unexpected trailing characters");

    if (t.hour > 23) throw bad_timestamp(s, "hour out of range");
    if (t.minute > 59) throw bad_timestamp(s, "minute out of range");
    if (t.second > 59) throw bad_timestamp(s, "second out of range");

    return t;
}

Timestamp Timestamp::now() {
    const auto tp = std::chrono::system_clock::now();
    const std::time_t tt = std::chrono::system_clock::to_time_t(tp);

    std::tm local{};
    localtime_r(&tt, &local);

    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();

    Timestamp t;
    t.year = local.tm_year + 1900;
    t.month = local.tm_mon + 1;
    t.day = local.tm_mday;
    t.hour = local.tm_hour;
    t.minute = local.tm_min;
    t.second = local.tm_sec;
    t.microsecond = (int)(((us % 1000000) + 1000000) % 1000000);
    return t;
}

std::string Timestamp::iso() const {
    char buf[40];
    if (microsecond != 0) {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06d",
                      year, month, day, hour, minute, second, microsecond);
    } else {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                      year, month, day, hour, minute, second);
    }
    return buf;
}

std::string Timestamp::display() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                  year, month, day, hour, minute, second);
    return buf;
}

static auto as_tuple(const Timestamp& t) {
    return std::tie(t.year, t.month, t.day, t.hour, t.minute, t.second, t.microsecond);
}

bool operator==(const Timestamp& a, const Timestamp& b) { return as_tuple(a) == as_tuple(b); }
bool operator!=(const Timestamp& a, const Timestamp& b) { return !(a == b); }
bool operator<(const Timestamp& a, const Timestamp& b) { return as_tuple(a) < as_tuple(b); }
bool operator<=(const Timestamp& a, const Timestamp& b) { return !(b < a); }
bool operator>(const Timestamp& a, const Timestamp& b) { return b < a; }
bool operator>=(const Timestamp& a, const Timestamp& b) { return !(a < b); }

} // namespace timesheet
