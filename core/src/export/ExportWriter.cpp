#include "courtsched/core/export/ExportWriter.h"

#include "courtsched/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <map>
#include <optional>
#include <sstream>

namespace courtsched::core::exporter {

namespace {

std::string HtmlEscape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (const char ch : value) {
        switch (ch) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            default:
                out += ch;
        }
    }
    return out;
}

std::string ScoreField(const std::optional<int>& score) {
    return score ? std::to_string(*score) : std::string();
}

}  // namespace

std::string CsvField(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (const char ch : value) {
        if (ch == '"') {
            quoted += '"';
        }
        quoted += ch;
    }
    quoted += '"';
    return quoted;
}

bool WriteScheduleCsv(const std::string& path, const persist::StoredSchedule& schedule) {
    std::ostringstream csv;
    csv << "match_no,round,date,start_hour,court,home,away,home_score,away_score\n";
    for (const auto& record : schedule.matches) {
        const auto& match = record.match;
        csv << record.match_no << ','
            << match.round_number << ','
            << match.date.ToIsoString() << ','
            << match.start_hour << ','
            << match.court_id << ','
            << CsvField(schedule.TeamName(match.home_team_id)) << ','
            << CsvField(schedule.TeamName(match.away_team_id)) << ','
            << ScoreField(record.home_score) << ','
            << ScoreField(record.away_score)
            << "\n";
    }
    return util::AtomicFileWriter::Write(path, csv.str());
}

bool WriteStandingsCsv(const std::string& path, const std::vector<stats::TeamStanding>& standings) {
    std::ostringstream csv;
    csv << "rank,team,g,w,l,pf,pa,diff\n";
    int rank = 1;
    for (const auto& row : standings) {
        csv << rank++ << ','
            << CsvField(row.name) << ','
            << row.games << ','
            << row.wins << ','
            << row.losses << ','
            << row.points_for << ','
            << row.points_against << ','
            << row.point_differential()
            << "\n";
    }
    return util::AtomicFileWriter::Write(path, csv.str());
}

bool WriteStandingsHtml(const std::string& path,
                        const std::string& competition,
                        const std::vector<stats::TeamStanding>& standings) {
    std::ostringstream html;
    html << "<!doctype html>\n<html><head><meta charset=\"utf-8\">"
         << "<title>Standings</title>"
         << "<style>table{border-collapse:collapse;font-family:Arial,sans-serif}"
         << "th,td{border:1px solid #ccc;padding:4px 8px;text-align:left}</style>"
         << "</head><body>\n";
    html << "<h2>" << HtmlEscape(competition) << "</h2>\n";
    html << "<table>\n<thead><tr>"
         << "<th>#</th><th>Team</th><th>G</th><th>W</th><th>L</th><th>PF</th><th>PA</th><th>+/-</th>"
         << "</tr></thead>\n<tbody>\n";
    int rank = 1;
    for (const auto& row : standings) {
        html << "<tr><td>" << rank++ << "</td><td>" << HtmlEscape(row.name) << "</td><td>"
             << row.games << "</td><td>" << row.wins << "</td><td>"
             << row.losses << "</td><td>"
             << row.points_for << "</td><td>" << row.points_against << "</td><td>"
             << row.point_differential() << "</td></tr>\n";
    }
    html << "</tbody></table>\n</body></html>\n";
    return util::AtomicFileWriter::Write(path, html.str());
}

bool WriteSummaryJson(const std::string& path,
                      const std::string& competition,
                      const std::vector<persist::TeamRecord>& teams,
                      const schedule::GeneratedSchedule& generated) {
    std::map<std::string, std::map<int, int>> hours_by_team;
    std::map<std::string, int> games_by_team;
    int rounds = 0;
    for (const auto& match : generated.matches) {
        hours_by_team[match.home_team_id][match.start_hour] += 1;
        hours_by_team[match.away_team_id][match.start_hour] += 1;
        games_by_team[match.home_team_id] += 1;
        games_by_team[match.away_team_id] += 1;
        rounds = std::max(rounds, match.round_number);
    }

    std::map<std::string, int> byes_by_team;
    for (const auto& bye : generated.byes) {
        if (bye) {
            byes_by_team[*bye] += 1;
        }
    }

    nlohmann::json summary;
    summary["competition"] = competition;
    summary["weeks"] = static_cast<int>(generated.byes.size());
    summary["rounds_with_matches"] = rounds;
    summary["matches"] = static_cast<int>(generated.matches.size());
    summary["teams"] = nlohmann::json::array();
    for (const auto& team : teams) {
        nlohmann::json hours = nlohmann::json::object();
        const auto it = hours_by_team.find(team.id);
        if (it != hours_by_team.end()) {
            for (const auto& entry : it->second) {
                hours[std::to_string(entry.first)] = entry.second;
            }
        }
        summary["teams"].push_back({
            {"id", team.id},
            {"name", team.name},
            {"games", games_by_team[team.id]},
            {"byes", byes_by_team[team.id]},
            {"slot_hours", hours},
            {"slot_debt", generated.final_debt.debt(team.id)},
        });
    }
    return util::AtomicFileWriter::Write(path, summary.dump(2));
}

}  // namespace courtsched::core::exporter
