#include "courtsched/core/schedule/ScheduleGenerator.h"

#include "courtsched/core/schedule/RoundDates.h"

#include <sstream>
#include <utility>

namespace courtsched::core::schedule {

ScheduleGenerator::ScheduleGenerator(std::function<void(const std::string&)> log_fn)
    : log_fn_(std::move(log_fn)) {}

void ScheduleGenerator::Log(const std::string& line) const {
    if (log_fn_) {
        log_fn_(line);
    }
}

bool ScheduleGenerator::Generate(const ScheduleRequest& request,
                                 GeneratedSchedule& schedule,
                                 std::string* error) const {
    schedule = GeneratedSchedule{};

    std::vector<Round> rounds;
    if (!RoundRobinPairing::BuildRounds(request.teams,
                                        request.number_of_weeks,
                                        request.cadence,
                                        rounds,
                                        error)) {
        return false;
    }
    {
        std::ostringstream line;
        line << "[schedule] " << rounds.size() << " rounds for " << request.teams.size()
             << " teams (" << HomeAwayCadenceName(request.cadence) << ")";
        Log(line.str());
    }

    std::vector<CalendarDate> dates;
    if (!RoundDates::Calculate(request.start_date,
                               request.target_weekday,
                               request.number_of_weeks,
                               dates,
                               error)) {
        return false;
    }
    if (!dates.empty()) {
        Log("[schedule] Weeks run " + dates.front().ToIsoString() + " to " + dates.back().ToIsoString());
    }

    GeneratedSchedule result;
    if (!SlotAssigner::Assign(rounds,
                              dates,
                              request.courts,
                              request.slot_policy,
                              result.matches,
                              error,
                              &result.final_debt)) {
        return false;
    }

    result.byes.reserve(rounds.size());
    for (const auto& round : rounds) {
        result.byes.push_back(round.bye_team_id);
    }

    {
        std::ostringstream line;
        line << "[schedule] Assigned " << result.matches.size() << " matches on "
             << request.courts.size() << " court(s)";
        Log(line.str());
    }

    schedule = std::move(result);
    return true;
}

bool ScheduleGenerator::GenerateMatches(const ScheduleRequest& request,
                                        std::vector<ScheduledMatch>& matches,
                                        std::string* error) {
    matches.clear();
    GeneratedSchedule schedule;
    if (!ScheduleGenerator().Generate(request, schedule, error)) {
        return false;
    }
    matches = std::move(schedule.matches);
    return true;
}

}  // namespace courtsched::core::schedule
