#include "courtsched/core/api/CompetitionConfig.h"

#include "courtsched/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace courtsched::core::api {

namespace {

void SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

// Integral JSON numbers that fit in an int. Fractions and out-of-range values fail.
bool ReadInt(const nlohmann::json& node, int& out) {
    if (!node.is_number_integer()) {
        return false;
    }
    if (node.is_number_unsigned()) {
        const auto value = node.get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(value);
        return true;
    }
    const auto value = node.get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool ReadIntField(const nlohmann::json& object, const char* key, int& out, std::string* error) {
    if (!object.contains(key)) {
        return true;
    }
    if (!ReadInt(object.at(key), out)) {
        SetError(error, std::string(key) + " must be an integer: " + object.at(key).dump());
        return false;
    }
    return true;
}

bool ParseTeam(const nlohmann::json& node, TeamEntry& out) {
    if (node.is_string()) {
        out.id = node.get<std::string>();
        out.name = out.id;
        return !out.id.empty();
    }
    if (!node.is_object() || !node.contains("id")) {
        return false;
    }
    out.id = node.at("id").get<std::string>();
    out.name = node.value("name", out.id);
    return !out.id.empty();
}

bool ParseFromJson(const nlohmann::json& root, CompetitionConfig& config, std::string* error) {
    config = CompetitionConfig{};

    if (root.contains("competition")) {
        config.name = root.at("competition").value("name", config.name);
    }

    if (root.contains("teams")) {
        for (const auto& node : root.at("teams")) {
            TeamEntry team;
            if (!ParseTeam(node, team)) {
                SetError(error, "Failed to parse team entry: " + node.dump());
                return false;
            }
            config.teams.push_back(std::move(team));
        }
    }

    if (root.contains("season")) {
        const auto& season = root.at("season");
        if (season.contains("start_date")) {
            const auto text = season.at("start_date").get<std::string>();
            if (!schedule::CalendarDate::ParseIso(text, config.season.start_date)) {
                SetError(error, "Invalid start_date (expected YYYY-MM-DD): " + text);
                return false;
            }
        }
        if (!ReadIntField(season, "day_of_week", config.season.day_of_week, error) ||
            !ReadIntField(season, "weeks", config.season.weeks, error)) {
            return false;
        }
        if (season.contains("home_away")) {
            const auto text = season.at("home_away").get<std::string>();
            if (!schedule::ParseHomeAwayCadence(text, config.season.home_away)) {
                SetError(error, "Unknown home_away cadence: " + text);
                return false;
            }
        }
    }

    if (root.contains("courts")) {
        for (const auto& node : root.at("courts")) {
            schedule::CourtId court = 0;
            if (!ReadInt(node, court)) {
                SetError(error, "Court identifiers must be integers: " + node.dump());
                return false;
            }
            config.courts.push_back(court);
        }
    }

    if (root.contains("time_slots")) {
        config.time_slots.clear();
        for (const auto& node : root.at("time_slots")) {
            schedule::TimeSlot slot;
            if (!ReadInt(node.at("hour"), slot.hour)) {
                SetError(error, "Slot hour must be an integer: " + node.at("hour").dump());
                return false;
            }
            slot.weight = node.at("weight").get<double>();
            config.time_slots.push_back(slot);
        }
    }

    if (root.contains("output")) {
        const auto& output = root.at("output");
        config.output.schedule_json = output.value("schedule_json", config.output.schedule_json);
        config.output.schedule_csv = output.value("schedule_csv", config.output.schedule_csv);
        config.output.summary_json = output.value("summary_json", config.output.summary_json);
        config.output.progress_log = output.value("progress_log", config.output.progress_log);
    }

    return true;
}

nlohmann::json ToJson(const CompetitionConfig& config) {
    nlohmann::json root;
    root["competition"] = {{"name", config.name}};

    root["teams"] = nlohmann::json::array();
    for (const auto& team : config.teams) {
        root["teams"].push_back({{"id", team.id}, {"name", team.name}});
    }

    root["season"] = {
        {"start_date", config.season.start_date.ToIsoString()},
        {"day_of_week", config.season.day_of_week},
        {"weeks", config.season.weeks},
        {"home_away", schedule::HomeAwayCadenceName(config.season.home_away)},
    };

    root["courts"] = config.courts;

    root["time_slots"] = nlohmann::json::array();
    for (const auto& slot : config.time_slots) {
        root["time_slots"].push_back({{"hour", slot.hour}, {"weight", slot.weight}});
    }

    root["output"] = {
        {"schedule_json", config.output.schedule_json},
        {"schedule_csv", config.output.schedule_csv},
        {"summary_json", config.output.summary_json},
        {"progress_log", config.output.progress_log},
    };
    return root;
}

}  // namespace

schedule::ScheduleRequest CompetitionConfig::ToRequest() const {
    schedule::ScheduleRequest request;
    request.teams.reserve(teams.size());
    for (const auto& team : teams) {
        request.teams.push_back(team.id);
    }
    request.number_of_weeks = season.weeks;
    request.start_date = season.start_date;
    request.target_weekday = season.day_of_week;
    request.courts = courts;
    request.slot_policy.slots = time_slots;
    request.cadence = season.home_away;
    return request;
}

std::string CompetitionConfig::TeamName(const std::string& team_id) const {
    for (const auto& team : teams) {
        if (team.id == team_id) {
            return team.name.empty() ? team.id : team.name;
        }
    }
    return team_id;
}

bool CompetitionConfig::LoadFromString(const std::string& text, CompetitionConfig& config, std::string* error) {
    try {
        const auto root = nlohmann::json::parse(text);
        return ParseFromJson(root, config, error);
    } catch (const nlohmann::json::exception& ex) {
        SetError(error, std::string("Failed to parse JSON: ") + ex.what());
        return false;
    }
}

bool CompetitionConfig::LoadFromFile(const std::string& path, CompetitionConfig& config, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        SetError(error, "Failed to open config: " + path);
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return LoadFromString(buffer.str(), config, error);
}

bool CompetitionConfig::SaveToFile(const std::string& path, const CompetitionConfig& config, std::string* error) {
    if (!util::AtomicFileWriter::Write(path, ToJson(config).dump(2))) {
        SetError(error, "Failed to write config: " + path);
        return false;
    }
    return true;
}

std::string CompetitionConfig::ToJsonString(const CompetitionConfig& config) {
    return ToJson(config).dump();
}

}  // namespace courtsched::core::api
