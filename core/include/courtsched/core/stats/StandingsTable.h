#pragma once

#include "courtsched/core/persist/ScheduleStore.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace courtsched::core::stats {

struct TeamStanding {
    std::string team_id;
    std::string name;
    int games = 0;
    int wins = 0;
    int losses = 0;
    int points_for = 0;
    int points_against = 0;

    int point_differential() const { return points_for - points_against; }
    double win_percent() const {
        if (games == 0) {
            return 0.0;
        }
        return (static_cast<double>(wins) / static_cast<double>(games)) * 100.0;
    }
};

class StandingsTable {
public:
    explicit StandingsTable(const std::vector<persist::TeamRecord>& teams);

    // Unknown team ids are ignored. Equal scores add points but no game.
    void RecordScore(const std::string& home_team_id,
                     const std::string& away_team_id,
                     int home_score,
                     int away_score);
    // Adds every match of the schedule that has both scores recorded.
    void RecordSchedule(const persist::StoredSchedule& schedule);

    const std::vector<TeamStanding>& standings() const { return standings_; }
    // Wins, then point differential; equal rows keep team order.
    std::vector<TeamStanding> Sorted() const;
    int matches_recorded() const { return matches_recorded_; }

private:
    TeamStanding* Find(const std::string& team_id);

    std::vector<TeamStanding> standings_;
    std::unordered_map<std::string, size_t> index_;
    int matches_recorded_ = 0;
};

}  // namespace courtsched::core::stats
