// File: Calendar.hpp
// Description: Declares the date and time-of-day value types used to key
//              ratio snapshots, with strict ISO parsing and the small amount
//              of calendar arithmetic the compliance rules need.

#pragma once

#include <string>

namespace compliance {

struct Date {
    int year{1970};
    int month{1};
    int day{1};

    // Accepts YYYY-MM-DD only; throws InvalidParameters otherwise.
    static Date parse(const std::string& iso);
    static Date today();
    static bool isValid(int year, int month, int day);

    std::string toString() const;

    // Days since 1970-01-01 (proleptic Gregorian).
    long long toDays() const;
    static Date fromDays(long long days);
    Date addDays(long long days) const;

    // Whole calendar months elapsed from this date until `other`; a month only
    // counts once its day of month has been reached. Negative when `other`
    // precedes this date.
    int monthsUntil(const Date& other) const;

    friend bool operator==(const Date& a, const Date& b) {
        return a.year == b.year && a.month == b.month && a.day == b.day;
    }
    friend bool operator!=(const Date& a, const Date& b) { return !(a == b); }
    friend bool operator<(const Date& a, const Date& b) { return a.toDays() < b.toDays(); }
    friend bool operator<=(const Date& a, const Date& b) { return !(b < a); }
    friend bool operator>(const Date& a, const Date& b) { return b < a; }
    friend bool operator>=(const Date& a, const Date& b) { return !(a < b); }
};

struct TimeOfDay {
    int hour{0};
    int minute{0};
    int second{0};

    // Accepts HH:MM or HH:MM:SS; throws InvalidParameters otherwise.
    static TimeOfDay parse(const std::string& text);
    static TimeOfDay now();

    std::string toString() const;  // HH:MM:SS
    int secondsSinceMidnight() const { return hour * 3600 + minute * 60 + second; }

    friend bool operator==(const TimeOfDay& a, const TimeOfDay& b) {
        return a.secondsSinceMidnight() == b.secondsSinceMidnight();
    }
    friend bool operator!=(const TimeOfDay& a, const TimeOfDay& b) { return !(a == b); }
    friend bool operator<(const TimeOfDay& a, const TimeOfDay& b) {
        return a.secondsSinceMidnight() < b.secondsSinceMidnight();
    }
    friend bool operator<=(const TimeOfDay& a, const TimeOfDay& b) { return !(b < a); }
    friend bool operator>(const TimeOfDay& a, const TimeOfDay& b) { return b < a; }
    friend bool operator>=(const TimeOfDay& a, const TimeOfDay& b) { return !(a < b); }
};

// Local wall-clock timestamp, "YYYY-MM-DD HH:MM:SS".
std::string currentTimestamp();

}  // namespace compliance
