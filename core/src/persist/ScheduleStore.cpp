#include "courtsched/core/persist/ScheduleStore.h"

#include "courtsched/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <fstream>

namespace courtsched::core::persist {

namespace {

void SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

nlohmann::json WriteMatch(const MatchRecord& record) {
    nlohmann::json node = {
        {"match_no", record.match_no},
        {"round", record.match.round_number},
        {"date", record.match.date.ToIsoString()},
        {"start_hour", record.match.start_hour},
        {"court_id", record.match.court_id},
        {"home_team_id", record.match.home_team_id},
        {"away_team_id", record.match.away_team_id},
    };
    node["home_score"] = record.home_score ? nlohmann::json(*record.home_score) : nlohmann::json(nullptr);
    node["away_score"] = record.away_score ? nlohmann::json(*record.away_score) : nlohmann::json(nullptr);
    return node;
}

std::optional<int> ReadScore(const nlohmann::json& node, const char* key) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return std::nullopt;
    }
    return node.at(key).get<int>();
}

bool ReadMatch(const nlohmann::json& node, MatchRecord& record, std::string* error) {
    record.match_no = node.value("match_no", 0);
    record.match.round_number = node.value("round", 0);
    const auto date = node.value("date", std::string());
    if (!schedule::CalendarDate::ParseIso(date, record.match.date)) {
        SetError(error, "Invalid match date: " + date);
        return false;
    }
    record.match.start_hour = node.value("start_hour", 0);
    record.match.court_id = node.value("court_id", 0);
    record.match.home_team_id = node.value("home_team_id", "");
    record.match.away_team_id = node.value("away_team_id", "");
    record.home_score = ReadScore(node, "home_score");
    record.away_score = ReadScore(node, "away_score");
    return true;
}

}  // namespace

const MatchRecord* StoredSchedule::FindMatch(int match_no) const {
    for (const auto& record : matches) {
        if (record.match_no == match_no) {
            return &record;
        }
    }
    return nullptr;
}

std::string StoredSchedule::TeamName(const std::string& team_id) const {
    for (const auto& team : teams) {
        if (team.id == team_id) {
            return team.name.empty() ? team.id : team.name;
        }
    }
    return team_id;
}

StoredSchedule BuildStoredSchedule(const std::string& competition,
                                   const std::vector<TeamRecord>& teams,
                                   const std::vector<schedule::ScheduledMatch>& matches) {
    StoredSchedule stored;
    stored.competition = competition;
    stored.teams = teams;
    stored.matches.reserve(matches.size());
    int match_no = 1;
    for (const auto& match : matches) {
        MatchRecord record;
        record.match_no = match_no++;
        record.match = match;
        stored.matches.push_back(std::move(record));
    }
    return stored;
}

bool SaveSchedule(const std::string& path, const StoredSchedule& schedule, std::string* error) {
    nlohmann::json root;
    root["version"] = schedule.version;
    root["competition"] = schedule.competition;
    root["teams"] = nlohmann::json::array();
    for (const auto& team : schedule.teams) {
        root["teams"].push_back({{"id", team.id}, {"name", team.name}});
    }
    root["matches"] = nlohmann::json::array();
    for (const auto& record : schedule.matches) {
        root["matches"].push_back(WriteMatch(record));
    }

    if (!util::AtomicFileWriter::Write(path, root.dump(2))) {
        SetError(error, "Failed to write schedule: " + path);
        return false;
    }
    return true;
}

bool LoadSchedule(const std::string& path, StoredSchedule& schedule, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        SetError(error, "Failed to open schedule: " + path);
        return false;
    }

    StoredSchedule loaded;
    try {
        nlohmann::json root;
        input >> root;
        loaded.version = root.value("version", loaded.version);
        loaded.competition = root.value("competition", loaded.competition);
        if (root.contains("teams")) {
            for (const auto& node : root.at("teams")) {
                TeamRecord team;
                team.id = node.value("id", "");
                team.name = node.value("name", team.id);
                loaded.teams.push_back(std::move(team));
            }
        }
        if (root.contains("matches")) {
            for (const auto& node : root.at("matches")) {
                MatchRecord record;
                if (!ReadMatch(node, record, error)) {
                    return false;
                }
                loaded.matches.push_back(std::move(record));
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        SetError(error, std::string("Failed to parse schedule: ") + ex.what());
        return false;
    }

    schedule = std::move(loaded);
    return true;
}

bool RecordScore(StoredSchedule& schedule, int match_no, int home_score, int away_score, std::string* error) {
    if (home_score < 0 || away_score < 0) {
        SetError(error, "Scores must not be negative");
        return false;
    }
    if (home_score == away_score) {
        SetError(error, "Matches cannot end level");
        return false;
    }
    for (auto& record : schedule.matches) {
        if (record.match_no == match_no) {
            record.home_score = home_score;
            record.away_score = away_score;
            return true;
        }
    }
    SetError(error, "Match not found: " + std::to_string(match_no));
    return false;
}

}  // namespace courtsched::core::persist
