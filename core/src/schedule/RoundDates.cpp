#include "courtsched/core/schedule/RoundDates.h"

namespace courtsched::core::schedule {

bool RoundDates::Calculate(const CalendarDate& start_date,
                           int target_weekday,
                           int number_of_rounds,
                           std::vector<CalendarDate>& dates,
                           std::string* error) {
    dates.clear();
    if (target_weekday < 0 || target_weekday > 6) {
        if (error) {
            *error = "dayOfWeek must be between 0 (Sunday) and 6 (Saturday), got " +
                     std::to_string(target_weekday);
        }
        return false;
    }
    if (number_of_rounds < 0) {
        if (error) {
            *error = "numberOfRounds must not be negative";
        }
        return false;
    }
    if (!start_date.IsValid()) {
        if (error) {
            *error = "Invalid start date";
        }
        return false;
    }

    const int days_until_target = (target_weekday - start_date.Weekday() + 7) % 7;
    long long day = start_date.ToDayNumber() + days_until_target;

    dates.reserve(static_cast<size_t>(number_of_rounds));
    for (int i = 0; i < number_of_rounds; ++i) {
        dates.push_back(CalendarDate::FromDayNumber(day));
        day += 7;
    }
    return true;
}

}  // namespace courtsched::core::schedule
