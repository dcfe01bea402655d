#pragma once

#include "courtsched/core/schedule/ScheduleGenerator.h"

#include <string>
#include <vector>

namespace courtsched::core::api {

struct TeamEntry {
    std::string id;
    std::string name;
};

struct SeasonConfig {
    schedule::CalendarDate start_date;
    int day_of_week = 1;
    int weeks = 1;
    schedule::HomeAwayCadence home_away = schedule::HomeAwayCadence::kCycleSwap;
};

struct OutputConfig {
    std::string schedule_json = "out/schedule.json";
    std::string schedule_csv = "out/schedule.csv";
    std::string summary_json = "out/summary.json";
    std::string progress_log;
};

struct CompetitionConfig {
    std::string name = "League";
    std::vector<TeamEntry> teams;
    SeasonConfig season;
    std::vector<schedule::CourtId> courts;
    std::vector<schedule::TimeSlot> time_slots = schedule::SlotPolicy::Reference().slots;
    OutputConfig output;

    schedule::ScheduleRequest ToRequest() const;
    std::string TeamName(const std::string& team_id) const;

    static bool LoadFromFile(const std::string& path, CompetitionConfig& config, std::string* error);
    static bool LoadFromString(const std::string& text, CompetitionConfig& config, std::string* error);
    static bool SaveToFile(const std::string& path, const CompetitionConfig& config, std::string* error);
    static std::string ToJsonString(const CompetitionConfig& config);
};

}  // namespace courtsched::core::api
