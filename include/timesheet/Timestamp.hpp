#pragma once
#include <string>

namespace timesheet {

// Naive local date-time, microsecond resolution. No timezone.
struct Timestamp {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int microsecond = 0;

    // YYYY-MM-DD[(T| )HH[:MM[:SS[.ffffff]]]], throws ParseError
    static Timestamp parse(const std::string& s);

    // current local time
    static Timestamp now();

    // storage form: YYYY-MM-DDTHH:MM:SS[.ffffff]
    std::string iso() const;

    // display form: YYYY-MM-DD HH:MM:SS
    std::string display() const;
};

bool operator==(const Timestamp& a, const Timestamp& b);
bool operator!=(const Timestamp& a, const Timestamp& b);
bool operator<(const Timestamp& a, const Timestamp& b);
bool operator<=(const Timestamp& a, const Timestamp& b);
bool operator>(const Timestamp& a, const Timestamp& b);
bool operator>=(const Timestamp& a, const Timestamp& b);

} // namespace timesheet
