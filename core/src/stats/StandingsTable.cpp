#include "courtsched/core/stats/StandingsTable.h"

#include <algorithm>

namespace courtsched::core::stats {

StandingsTable::StandingsTable(const std::vector<persist::TeamRecord>& teams) {
    standings_.reserve(teams.size());
    for (const auto& team : teams) {
        if (index_.count(team.id) != 0) {
            continue;
        }
        TeamStanding standing;
        standing.team_id = team.id;
        standing.name = team.name.empty() ? team.id : team.name;
        index_.emplace(team.id, standings_.size());
        standings_.push_back(std::move(standing));
    }
}

TeamStanding* StandingsTable::Find(const std::string& team_id) {
    const auto it = index_.find(team_id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &standings_[it->second];
}

void StandingsTable::RecordScore(const std::string& home_team_id,
                                 const std::string& away_team_id,
                                 int home_score,
                                 int away_score) {
    auto* home = Find(home_team_id);
    auto* away = Find(away_team_id);
    if (!home || !away || home == away) {
        return;
    }

    home->points_for += home_score;
    home->points_against += away_score;
    away->points_for += away_score;
    away->points_against += home_score;
    matches_recorded_ += 1;

    // Volleyball has no draws; a level score only moves points.
    if (home_score == away_score) {
        return;
    }
    auto* winner = home_score > away_score ? home : away;
    auto* loser = winner == home ? away : home;
    winner->games += 1;
    winner->wins += 1;
    loser->games += 1;
    loser->losses += 1;
}

void StandingsTable::RecordSchedule(const persist::StoredSchedule& schedule) {
    for (const auto& record : schedule.matches) {
        if (!record.has_score()) {
            continue;
        }
        RecordScore(record.match.home_team_id,
                    record.match.away_team_id,
                    *record.home_score,
                    *record.away_score);
    }
}

std::vector<TeamStanding> StandingsTable::Sorted() const {
    auto sorted = standings_;
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        if (a.wins != b.wins) {
            return a.wins > b.wins;
        }
        return a.point_differential() > b.point_differential();
    });
    return sorted;
}

}  // namespace courtsched::core::stats
