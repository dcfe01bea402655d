#pragma once

#include "courtsched/core/schedule/CalendarDate.h"

#include <optional>
#include <string>
#include <vector>

namespace courtsched::core::schedule {

using TeamId = std::string;
using CourtId = int;

struct Matchup {
    TeamId home_team_id;
    TeamId away_team_id;
};

struct Round {
    int round_index = 0;
    std::vector<Matchup> matchups;
    std::optional<TeamId> bye_team_id;
};

struct ScheduledMatch {
    int round_number = 0;
    CalendarDate date;
    int start_hour = 0;
    CourtId court_id = 0;
    TeamId home_team_id;
    TeamId away_team_id;
};

inline bool operator==(const Matchup& a, const Matchup& b) {
    return a.home_team_id == b.home_team_id && a.away_team_id == b.away_team_id;
}

inline bool operator==(const ScheduledMatch& a, const ScheduledMatch& b) {
    return a.round_number == b.round_number && a.date == b.date &&
           a.start_hour == b.start_hour && a.court_id == b.court_id &&
           a.home_team_id == b.home_team_id && a.away_team_id == b.away_team_id;
}

}  // namespace courtsched::core::schedule
