#pragma once

#include "courtsched/core/persist/ScheduleStore.h"
#include "courtsched/core/schedule/ScheduleGenerator.h"
#include "courtsched/core/stats/StandingsTable.h"

#include <string>
#include <vector>

namespace courtsched::core::exporter {

bool WriteScheduleCsv(const std::string& path, const persist::StoredSchedule& schedule);
bool WriteStandingsCsv(const std::string& path, const std::vector<stats::TeamStanding>& standings);
bool WriteStandingsHtml(const std::string& path,
                        const std::string& competition,
                        const std::vector<stats::TeamStanding>& standings);
// Per-team slot-hour counts, byes and final slot debt of a generated schedule.
bool WriteSummaryJson(const std::string& path,
                      const std::string& competition,
                      const std::vector<persist::TeamRecord>& teams,
                      const schedule::GeneratedSchedule& generated);

std::string CsvField(const std::string& value);

}  // namespace courtsched::core::exporter
