#include "courtsched/core/schedule/RoundRobinPairing.h"

#include <unordered_set>

namespace courtsched::core::schedule {

namespace {

void SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

std::vector<int> BuildSeatList(int team_count) {
    std::vector<int> seats;
    seats.reserve(static_cast<size_t>(team_count + 1));
    for (int i = 0; i < team_count; ++i) {
        seats.push_back(i);
    }
    if (team_count % 2 == 1) {
        seats.push_back(kByeSeat);
    }
    return seats;
}

void RotateSeats(std::vector<int>& seats) {
    if (seats.size() <= 2) {
        return;
    }
    const int last = seats.back();
    for (size_t i = seats.size() - 1; i > 1; --i) {
        seats[i] = seats[i - 1];
    }
    seats[1] = last;
}

bool FirstSeatHosts(HomeAwayCadence cadence, int week, int round_in_cycle, int cycle) {
    if (cadence == HomeAwayCadence::kWeekParity) {
        return (week + cycle) % 2 == 0;
    }
    return (round_in_cycle + cycle) % 2 == 0;
}

}  // namespace

bool ParseHomeAwayCadence(const std::string& text, HomeAwayCadence& cadence) {
    if (text == "cycle_swap") {
        cadence = HomeAwayCadence::kCycleSwap;
        return true;
    }
    if (text == "week_parity") {
        cadence = HomeAwayCadence::kWeekParity;
        return true;
    }
    return false;
}

std::string HomeAwayCadenceName(HomeAwayCadence cadence) {
    switch (cadence) {
        case HomeAwayCadence::kCycleSwap:
            return "cycle_swap";
        case HomeAwayCadence::kWeekParity:
            return "week_parity";
    }
    return "cycle_swap";
}

std::vector<int> RoundRobinPairing::RotatedSeats(int team_count, int rotations) {
    auto seats = BuildSeatList(team_count);
    for (int r = 0; r < rotations; ++r) {
        RotateSeats(seats);
    }
    return seats;
}

bool RoundRobinPairing::BuildRounds(const std::vector<TeamId>& teams,
                                    int number_of_weeks,
                                    HomeAwayCadence cadence,
                                    std::vector<Round>& rounds,
                                    std::string* error) {
    rounds.clear();
    if (teams.size() < 2) {
        SetError(error, "Need at least 2 teams to generate schedule");
        return false;
    }
    if (number_of_weeks < 1) {
        SetError(error, "numberOfWeeks must be at least 1");
        return false;
    }

    std::unordered_set<TeamId> seen;
    for (const auto& team : teams) {
        if (team.empty()) {
            SetError(error, "Team identifiers must not be empty");
            return false;
        }
        if (!seen.insert(team).second) {
            SetError(error, "Duplicate team identifier: " + team);
            return false;
        }
    }

    const int team_count = static_cast<int>(teams.size());
    const int seat_count = team_count + (team_count % 2);
    const int rounds_per_cycle = seat_count - 1;

    std::vector<Round> built;
    built.reserve(static_cast<size_t>(number_of_weeks));

    // One pass over a cycle's rotations, reused for every later cycle.
    std::vector<std::vector<int>> cycle_seats;
    cycle_seats.reserve(static_cast<size_t>(rounds_per_cycle));
    auto seats = BuildSeatList(team_count);
    for (int r = 0; r < rounds_per_cycle; ++r) {
        cycle_seats.push_back(seats);
        RotateSeats(seats);
    }

    for (int week = 0; week < number_of_weeks; ++week) {
        const int round_in_cycle = week % rounds_per_cycle;
        const int cycle = week / rounds_per_cycle;
        const auto& rotated = cycle_seats[static_cast<size_t>(round_in_cycle)];
        const bool first_hosts = FirstSeatHosts(cadence, week, round_in_cycle, cycle);

        Round round;
        round.round_index = week;
        round.matchups.reserve(static_cast<size_t>(seat_count / 2));
        for (int i = 0; i < seat_count / 2; ++i) {
            const int s1 = rotated[static_cast<size_t>(i)];
            const int s2 = rotated[static_cast<size_t>(seat_count - 1 - i)];
            if (s1 == kByeSeat || s2 == kByeSeat) {
                const int sitting_out = s1 == kByeSeat ? s2 : s1;
                round.bye_team_id = teams[static_cast<size_t>(sitting_out)];
                continue;
            }

            const auto& t1 = teams[static_cast<size_t>(s1)];
            const auto& t2 = teams[static_cast<size_t>(s2)];
            if (first_hosts) {
                round.matchups.push_back({t1, t2});
            } else {
                round.matchups.push_back({t2, t1});
            }
        }
        built.push_back(std::move(round));
    }

    rounds = std::move(built);
    return true;
}

}  // namespace courtsched::core::schedule
