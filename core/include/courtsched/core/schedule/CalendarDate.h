#pragma once

#include <string>

namespace courtsched::core::schedule {

// Civil date in the proleptic Gregorian calendar. Weekdays are 0 = Sunday .. 6 = Saturday.
struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    bool IsValid() const;
    long long ToDayNumber() const;
    int Weekday() const;
    CalendarDate AddDays(int days) const;
    std::string ToIsoString() const;

    static CalendarDate FromDayNumber(long long days);
    static bool ParseIso(const std::string& text, CalendarDate& date);
};

bool operator==(const CalendarDate& a, const CalendarDate& b);
bool operator!=(const CalendarDate& a, const CalendarDate& b);

}  // namespace courtsched::core::schedule
