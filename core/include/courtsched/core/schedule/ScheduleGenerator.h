#pragma once

#include "courtsched/core/schedule/RoundRobinPairing.h"
#include "courtsched/core/schedule/SlotAssigner.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace courtsched::core::schedule {

struct ScheduleRequest {
    std::vector<TeamId> teams;
    int number_of_weeks = 0;
    CalendarDate start_date;
    int target_weekday = 0;
    std::vector<CourtId> courts;
    SlotPolicy slot_policy = SlotPolicy::Reference();
    // Not the reference cadence after the first cycle; see HomeAwayCadence.
    HomeAwayCadence cadence = HomeAwayCadence::kCycleSwap;
};

struct GeneratedSchedule {
    std::vector<ScheduledMatch> matches;
    // Team sitting out each week, indexed by round; empty for even team counts.
    std::vector<std::optional<TeamId>> byes;
    SlotDebtLedger final_debt;
};

class ScheduleGenerator {
public:
    explicit ScheduleGenerator(std::function<void(const std::string&)> log_fn = {});

    // Pairings, then dates, then slots. Leaves `schedule` empty on failure.
    bool Generate(const ScheduleRequest& request, GeneratedSchedule& schedule, std::string* error) const;

    static bool GenerateMatches(const ScheduleRequest& request,
                                std::vector<ScheduledMatch>& matches,
                                std::string* error);

private:
    void Log(const std::string& line) const;

    std::function<void(const std::string&)> log_fn_{};
};

}  // namespace courtsched::core::schedule
