#include "courtsched/core/schedule/SlotAssigner.h"

#include <algorithm>
#include <unordered_set>

namespace courtsched::core::schedule {

namespace {

void SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

double MaxDebt(const Matchup& matchup, const SlotDebtLedger& ledger) {
    return std::max(ledger.debt(matchup.home_team_id), ledger.debt(matchup.away_team_id));
}

}  // namespace

double SlotPolicy::average_weight() const {
    if (slots.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& slot : slots) {
        sum += slot.weight;
    }
    return sum / static_cast<double>(slots.size());
}

bool SlotPolicy::Validate(std::string* error) const {
    if (slots.empty()) {
        SetError(error, "At least one time slot is required");
        return false;
    }
    std::unordered_set<int> hours;
    for (size_t i = 0; i < slots.size(); ++i) {
        const auto& slot = slots[i];
        if (slot.hour < 0 || slot.hour > 23) {
            SetError(error, "Time slot hour out of range: " + std::to_string(slot.hour));
            return false;
        }
        if (!hours.insert(slot.hour).second) {
            SetError(error, "Duplicate time slot hour: " + std::to_string(slot.hour));
            return false;
        }
        if (i > 0 && !(slot.weight < slots[i - 1].weight)) {
            SetError(error, "Time slot weights must be strictly decreasing");
            return false;
        }
    }
    return true;
}

SlotPolicy SlotPolicy::Reference() {
    SlotPolicy policy;
    policy.slots = {{18, 4.0}, {19, 3.0}, {20, 2.0}, {21, 1.0}};
    return policy;
}

void SlotDebtLedger::Track(const TeamId& team) {
    debt_.emplace(team, 0.0);
}

void SlotDebtLedger::Charge(const TeamId& team, double delta) {
    debt_[team] += delta;
}

void SlotDebtLedger::Set(const TeamId& team, double value) {
    debt_[team] = value;
}

double SlotDebtLedger::debt(const TeamId& team) const {
    const auto it = debt_.find(team);
    return it == debt_.end() ? 0.0 : it->second;
}

double SlotDebtLedger::total() const {
    double sum = 0.0;
    for (const auto& entry : debt_) {
        sum += entry.second;
    }
    return sum;
}

std::vector<Matchup> OrderByDebt(const std::vector<Matchup>& matchups, const SlotDebtLedger& ledger) {
    auto sorted = matchups;
    std::stable_sort(sorted.begin(), sorted.end(), [&ledger](const Matchup& a, const Matchup& b) {
        return MaxDebt(a, ledger) > MaxDebt(b, ledger);
    });
    return sorted;
}

bool SlotAssigner::Assign(const std::vector<Round>& rounds,
                          const std::vector<CalendarDate>& dates,
                          const std::vector<CourtId>& courts,
                          const SlotPolicy& policy,
                          std::vector<ScheduledMatch>& matches,
                          std::string* error,
                          SlotDebtLedger* final_debt) {
    matches.clear();
    if (courts.empty()) {
        SetError(error, "At least one court is required");
        return false;
    }
    if (rounds.size() != dates.size()) {
        SetError(error, "Round count (" + std::to_string(rounds.size()) +
                            ") does not match date count (" + std::to_string(dates.size()) + ")");
        return false;
    }
    std::unordered_set<CourtId> court_set(courts.begin(), courts.end());
    if (court_set.size() != courts.size()) {
        SetError(error, "Duplicate court identifier");
        return false;
    }
    if (!policy.Validate(error)) {
        return false;
    }

    const size_t court_count = courts.size();
    const size_t slot_count = policy.slots.size();
    const size_t capacity = court_count * slot_count;
    for (const auto& round : rounds) {
        if (round.matchups.size() > capacity) {
            SetError(error, "Round " + std::to_string(round.round_index + 1) + " has " +
                                std::to_string(round.matchups.size()) + " matches but only " +
                                std::to_string(capacity) + " court slots are available");
            return false;
        }
    }

    SlotDebtLedger ledger;
    size_t total_matchups = 0;
    for (const auto& round : rounds) {
        for (const auto& matchup : round.matchups) {
            ledger.Track(matchup.home_team_id);
            ledger.Track(matchup.away_team_id);
        }
        total_matchups += round.matchups.size();
    }

    const double average_weight = policy.average_weight();
    std::vector<ScheduledMatch> scheduled;
    scheduled.reserve(total_matchups);

    for (size_t round_index = 0; round_index < rounds.size(); ++round_index) {
        const auto sorted = OrderByDebt(rounds[round_index].matchups, ledger);
        for (size_t match_index = 0; match_index < sorted.size(); ++match_index) {
            const auto& matchup = sorted[match_index];
            const auto& slot = policy.slots[(match_index / court_count) % slot_count];

            ScheduledMatch match;
            match.round_number = static_cast<int>(round_index) + 1;
            match.date = dates[round_index];
            match.start_hour = slot.hour;
            match.court_id = courts[match_index % court_count];
            match.home_team_id = matchup.home_team_id;
            match.away_team_id = matchup.away_team_id;
            scheduled.push_back(std::move(match));

            const double delta = average_weight - slot.weight;
            ledger.Charge(matchup.home_team_id, delta);
            ledger.Charge(matchup.away_team_id, delta);
        }
    }

    matches = std::move(scheduled);
    if (final_debt) {
        *final_debt = std::move(ledger);
    }
    return true;
}

}  // namespace courtsched::core::schedule
