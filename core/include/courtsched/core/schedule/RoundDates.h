#pragma once

#include "courtsched/core/schedule/CalendarDate.h"

#include <string>
#include <vector>

namespace courtsched::core::schedule {

class RoundDates {
public:
    // One date per round, weekly, starting at the first target_weekday on or
    // after start_date. target_weekday: 0 = Sunday .. 6 = Saturday.
    static bool Calculate(const CalendarDate& start_date,
                          int target_weekday,
                          int number_of_rounds,
                          std::vector<CalendarDate>& dates,
                          std::string* error);
};

}  // namespace courtsched::core::schedule
