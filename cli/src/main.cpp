#include "courtsched/core/api/CompetitionConfig.h"
#include "courtsched/core/export/ExportWriter.h"
#include "courtsched/core/persist/ScheduleStore.h"
#include "courtsched/core/schedule/ScheduleGenerator.h"
#include "courtsched/core/stats/StandingsTable.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using courtsched::core::api::CompetitionConfig;
namespace persist = courtsched::core::persist;

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  courtschedcli generate <config.json>\n"
              << "  courtschedcli score <schedule.json> <match_no> <home_score> <away_score>\n"
              << "  courtschedcli standings <schedule.json> <out_dir>\n";
}

std::string FormatUtcTimestamp(std::time_t timestamp) {
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &timestamp);
#else
    gmtime_r(&timestamp, &utc);
#endif
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

bool AppendLogLine(const std::string& path, const std::string& line) {
    if (path.empty()) {
        return true;
    }
    const std::filesystem::path fs_path(path);
    if (!fs_path.parent_path().empty()) {
        std::error_code ec;
        std::filesystem::create_directories(fs_path.parent_path(), ec);
    }
    std::ofstream output(path, std::ios::binary | std::ios::app);
    if (!output) {
        std::cerr << "[courtschedcli] Failed to open log: " << path << '\n';
        return false;
    }
    output << FormatUtcTimestamp(std::time(nullptr)) << ' ' << line << "\n";
    return static_cast<bool>(output);
}

bool ParseInt(const std::string& text, int& value) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const long parsed = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX) {
        return false;
    }
    value = static_cast<int>(parsed);
    return true;
}

std::vector<persist::TeamRecord> TeamRecords(const CompetitionConfig& config) {
    std::vector<persist::TeamRecord> teams;
    teams.reserve(config.teams.size());
    for (const auto& team : config.teams) {
        teams.push_back({team.id, team.name});
    }
    return teams;
}

int RunGenerate(const std::string& config_path) {
    std::cout << "[courtschedcli] Competition config: " << config_path << '\n';

    CompetitionConfig config;
    std::string error;
    if (!CompetitionConfig::LoadFromFile(config_path, config, &error)) {
        std::cerr << "[courtschedcli] " << error << '\n';
        return 1;
    }

    const std::string log_path = config.output.progress_log;
    auto log = [&log_path](const std::string& line) {
        std::cout << line << '\n';
        AppendLogLine(log_path, line);
    };

    courtsched::core::schedule::ScheduleGenerator generator(log);
    courtsched::core::schedule::GeneratedSchedule generated;
    if (!generator.Generate(config.ToRequest(), generated, &error)) {
        std::cerr << "[courtschedcli] Schedule generation failed: " << error << '\n';
        AppendLogLine(log_path, "[courtschedcli] Schedule generation failed: " + error);
        return 1;
    }

    const auto teams = TeamRecords(config);
    const auto stored = persist::BuildStoredSchedule(config.name, teams, generated.matches);
    if (!persist::SaveSchedule(config.output.schedule_json, stored, &error)) {
        std::cerr << "[courtschedcli] " << error << '\n';
        return 1;
    }
    log("[courtschedcli] Schedule written to " + config.output.schedule_json);

    if (!config.output.schedule_csv.empty()) {
        if (!courtsched::core::exporter::WriteScheduleCsv(config.output.schedule_csv, stored)) {
            std::cerr << "[courtschedcli] Failed to write schedule CSV: " << config.output.schedule_csv << '\n';
            return 1;
        }
    }
    if (!config.output.summary_json.empty()) {
        if (!courtsched::core::exporter::WriteSummaryJson(config.output.summary_json, config.name, teams, generated)) {
            std::cerr << "[courtschedcli] Failed to write summary: " << config.output.summary_json << '\n';
            return 1;
        }
    }

    for (const auto& record : stored.matches) {
        const auto& match = record.match;
        std::cout << std::setw(3) << record.match_no << "  R" << match.round_number << "  "
                  << match.date.ToIsoString() << ' ' << std::setfill('0') << std::setw(2)
                  << match.start_hour << ":00" << std::setfill(' ') << "  court " << match.court_id
                  << "  " << stored.TeamName(match.home_team_id) << " vs "
                  << stored.TeamName(match.away_team_id) << '\n';
    }
    return 0;
}

int RunScore(const std::string& schedule_path,
             const std::string& match_arg,
             const std::string& home_arg,
             const std::string& away_arg) {
    int match_no = 0;
    int home_score = 0;
    int away_score = 0;
    if (!ParseInt(match_arg, match_no) || !ParseInt(home_arg, home_score) || !ParseInt(away_arg, away_score)) {
        std::cerr << "[courtschedcli] match_no, home_score and away_score must be integers." << '\n';
        return 1;
    }

    persist::StoredSchedule stored;
    std::string error;
    if (!persist::LoadSchedule(schedule_path, stored, &error) ||
        !persist::RecordScore(stored, match_no, home_score, away_score, &error) ||
        !persist::SaveSchedule(schedule_path, stored, &error)) {
        std::cerr << "[courtschedcli] " << error << '\n';
        return 1;
    }

    const auto* record = stored.FindMatch(match_no);
    std::cout << "[courtschedcli] Match " << match_no << ": "
              << stored.TeamName(record->match.home_team_id) << ' ' << home_score << " - "
              << away_score << ' ' << stored.TeamName(record->match.away_team_id) << '\n';
    return 0;
}

int RunStandings(const std::string& schedule_path, const std::string& out_dir) {
    persist::StoredSchedule stored;
    std::string error;
    if (!persist::LoadSchedule(schedule_path, stored, &error)) {
        std::cerr << "[courtschedcli] " << error << '\n';
        return 1;
    }

    courtsched::core::stats::StandingsTable table(stored.teams);
    table.RecordSchedule(stored);
    const auto sorted = table.Sorted();

    const std::filesystem::path dir(out_dir);
    const std::string csv_path = (dir / "standings.csv").string();
    const std::string html_path = (dir / "standings.html").string();
    if (!courtsched::core::exporter::WriteStandingsCsv(csv_path, sorted) ||
        !courtsched::core::exporter::WriteStandingsHtml(html_path, stored.competition, sorted)) {
        std::cerr << "[courtschedcli] Failed to write standings to " << out_dir << '\n';
        return 1;
    }

    std::cout << "[courtschedcli] " << table.matches_recorded() << " scored matches" << '\n';
    int rank = 1;
    for (const auto& row : sorted) {
        std::cout << std::setw(3) << rank++ << "  " << row.name << "  " << row.wins << '-'
                  << row.losses << "  " << std::showpos << row.point_differential()
                  << std::noshowpos << '\n';
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }

    const std::string command = argv[1];
    if (command == "generate" && argc == 3) {
        return RunGenerate(argv[2]);
    }
    if (command == "score" && argc == 6) {
        return RunScore(argv[2], argv[3], argv[4], argv[5]);
    }
    if (command == "standings" && argc == 4) {
        return RunStandings(argv[2], argv[3]);
    }

    PrintUsage();
    return 1;
}
