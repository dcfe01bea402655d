#pragma once

#include "courtsched/core/schedule/ScheduleTypes.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace courtsched::core::schedule {

struct TimeSlot {
    int hour = 0;
    double weight = 0.0;
};

// Time slots from most to least desirable.
struct SlotPolicy {
    std::vector<TimeSlot> slots;

    double average_weight() const;
    bool Validate(std::string* error) const;

    // 18:00, 19:00, 20:00, 21:00 weighted 4, 3, 2, 1.
    static SlotPolicy Reference();
};

// Accumulated slot debt per team. Positive debt means the team has had worse
// than average slots so far.
class SlotDebtLedger {
public:
    void Track(const TeamId& team);
    void Charge(const TeamId& team, double delta);
    void Set(const TeamId& team, double value);
    double debt(const TeamId& team) const;
    double total() const;
    const std::unordered_map<TeamId, double>& entries() const { return debt_; }

private:
    std::unordered_map<TeamId, double> debt_;
};

// Matchups ordered by the larger of the two teams' debts, highest first.
// Equal priorities keep their input order.
std::vector<Matchup> OrderByDebt(const std::vector<Matchup>& matchups, const SlotDebtLedger& ledger);

class SlotAssigner {
public:
    // Fills every court at the best hour before moving to the next hour and
    // charges both teams (average weight - slot weight) for each match.
    static bool Assign(const std::vector<Round>& rounds,
                       const std::vector<CalendarDate>& dates,
                       const std::vector<CourtId>& courts,
                       const SlotPolicy& policy,
                       std::vector<ScheduledMatch>& matches,
                       std::string* error,
                       SlotDebtLedger* final_debt = nullptr);
};

}  // namespace courtsched::core::schedule
