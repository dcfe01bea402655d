#pragma once

#include "courtsched/core/schedule/ScheduleTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace courtsched::core::persist {

struct MatchRecord {
    int match_no = 0;
    schedule::ScheduledMatch match;
    std::optional<int> home_score;
    std::optional<int> away_score;

    bool has_score() const { return home_score.has_value() && away_score.has_value(); }
};

struct TeamRecord {
    std::string id;
    std::string name;
};

struct StoredSchedule {
    int version = 1;
    std::string competition;
    std::vector<TeamRecord> teams;
    std::vector<MatchRecord> matches;

    const MatchRecord* FindMatch(int match_no) const;
    std::string TeamName(const std::string& team_id) const;
};

// Match numbers follow the generated order, starting at 1.
StoredSchedule BuildStoredSchedule(const std::string& competition,
                                   const std::vector<TeamRecord>& teams,
                                   const std::vector<schedule::ScheduledMatch>& matches);

bool SaveSchedule(const std::string& path, const StoredSchedule& schedule, std::string* error);
bool LoadSchedule(const std::string& path, StoredSchedule& schedule, std::string* error);

bool RecordScore(StoredSchedule& schedule, int match_no, int home_score, int away_score, std::string* error);

}  // namespace courtsched::core::persist
