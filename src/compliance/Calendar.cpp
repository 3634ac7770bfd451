// File: Calendar.cpp
// Description: Implements ISO date/time parsing and civil-calendar arithmetic.

#include "compliance/Calendar.hpp"

#include "compliance/Errors.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace compliance {

namespace {

std::tm localNow() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm {};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

bool allDigits(const std::string& text, std::size_t pos, std::size_t count) {
    if (pos + count > text.size()) {
        return false;
    }
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

int toInt(const std::string& text, std::size_t pos, std::size_t count) {
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

int daysInMonth(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) {
        return 29;
    }
    return kDays[month - 1];
}

}  // namespace

Date Date::parse(const std::string& iso) {
    if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-' || !allDigits(iso, 0, 4) ||
        !allDigits(iso, 5, 2) || !allDigits(iso, 8, 2)) {
        throw InvalidParameters("Invalid date '" + iso + "' (expected YYYY-MM-DD).");
    }
    Date date{toInt(iso, 0, 4), toInt(iso, 5, 2), toInt(iso, 8, 2)};
    if (!isValid(date.year, date.month, date.day)) {
        throw InvalidParameters("Date out of range: '" + iso + "'.");
    }
    return date;
}

Date Date::today() {
    const std::tm tm = localNow();
    return Date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

bool Date::isValid(int year, int month, int day) {
    if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1) {
        return false;
    }
    return day <= daysInMonth(year, month);
}

std::string Date::toString() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return std::string(buffer);
}

long long Date::toDays() const {
    // Howard Hinnant's days_from_civil.
    const long long y = month <= 2 ? year - 1 : year;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long mp = month > 2 ? month - 3 : month + 9;
    const long long doy = (153 * mp + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::fromDays(long long days) {
    const long long z = days + 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    const long long d = doy - (153 * mp + 2) / 5 + 1;
    const long long m = mp < 10 ? mp + 3 : mp - 9;
    const long long y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return Date{static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
}

Date Date::addDays(long long days) const {
    return fromDays(toDays() + days);
}

int Date::monthsUntil(const Date& other) const {
    if (other < *this) {
        return -other.monthsUntil(*this);
    }
    int months = (other.year - year) * 12 + (other.month - month);
    if (other.day < day) {
        --months;
    }
    return months;
}

TimeOfDay TimeOfDay::parse(const std::string& text) {
    const bool shortForm = text.size() == 5;
    const bool longForm = text.size() == 8;
    if ((!shortForm && !longForm) || text[2] != ':' || !allDigits(text, 0, 2) ||
        !allDigits(text, 3, 2) || (longForm && (text[5] != ':' || !allDigits(text, 6, 2)))) {
        throw InvalidParameters("Invalid time '" + text + "' (expected HH:MM or HH:MM:SS).");
    }
    TimeOfDay time{toInt(text, 0, 2), toInt(text, 3, 2), longForm ? toInt(text, 6, 2) : 0};
    if (time.hour > 23 || time.minute > 59 || time.second > 59) {
        throw InvalidParameters("Time out of range: '" + text + "'.");
    }
    return time;
}

TimeOfDay TimeOfDay::now() {
    const std::tm tm = localNow();
    return TimeOfDay{tm.tm_hour, tm.tm_min, tm.tm_sec};
}

std::string TimeOfDay::toString() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d", hour, minute, second);
    return std::string(buffer);
}

std::string currentTimestamp() {
    const std::tm tm = localNow();
    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm) != 0) {
        return std::string(buffer);
    }
    return "1970-01-01 00:00:00";
}

}  // namespace compliance
