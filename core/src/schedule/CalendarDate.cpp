#include "courtsched/core/schedule/CalendarDate.h"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace courtsched::core::schedule {

namespace {

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool ParseDigits(const std::string& text, size_t pos, size_t count, int& value) {
    if (pos + count > text.size()) {
        return false;
    }
    value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        const unsigned char ch = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(ch)) {
            return false;
        }
        value = value * 10 + (ch - '0');
    }
    return true;
}

}  // namespace

bool CalendarDate::IsValid() const {
    if (year < 1 || year > 9999 || month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= DaysInMonth(year, month);
}

// Days since 1970-01-01 (H. Hinnant's days_from_civil).
long long CalendarDate::ToDayNumber() const {
    const long long y = month <= 2 ? year - 1 : year;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long mp = (month + 9) % 12;
    const long long doy = (153 * mp + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate CalendarDate::FromDayNumber(long long days) {
    days += 719468;
    const long long era = (days >= 0 ? days : days - 146096) / 146097;
    const long long doe = days - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    CalendarDate date;
    date.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    date.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    date.year = static_cast<int>(yoe + era * 400 + (date.month <= 2 ? 1 : 0));
    return date;
}

int CalendarDate::Weekday() const {
    const long long days = ToDayNumber();
    // 1970-01-01 was a Thursday.
    return static_cast<int>(days >= -4 ? (days + 4) % 7 : (days + 5) % 7 + 6);
}

CalendarDate CalendarDate::AddDays(int days) const {
    return FromDayNumber(ToDayNumber() + days);
}

std::string CalendarDate::ToIsoString() const {
    std::ostringstream out;
    out << std::setfill('0') << std::setw(4) << year << '-'
        << std::setw(2) << month << '-'
        << std::setw(2) << day;
    return out.str();
}

bool CalendarDate::ParseIso(const std::string& text, CalendarDate& date) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    CalendarDate parsed;
    if (!ParseDigits(text, 0, 4, parsed.year) ||
        !ParseDigits(text, 5, 2, parsed.month) ||
        !ParseDigits(text, 8, 2, parsed.day)) {
        return false;
    }
    if (!parsed.IsValid()) {
        return false;
    }
    date = parsed;
    return true;
}

bool operator==(const CalendarDate& a, const CalendarDate& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const CalendarDate& a, const CalendarDate& b) {
    return !(a == b);
}

}  // namespace courtsched::core::schedule
