#pragma once

#include "courtsched/core/schedule/ScheduleTypes.h"

#include <string>
#include <vector>

namespace courtsched::core::schedule {

// Seat index of the bye placeholder added for odd team counts.
constexpr int kByeSeat = -1;

// Which seat of a pairing hosts. Both cadences agree in the first cycle.
// kCycleSwap is the default and departs from the (week + cycle) reference
// formula from the second cycle on. With an even seat count n,
// week + cycle = cycle * n + round_in_cycle, which has the parity of
// round_in_cycle alone, so the reference formula never swaps a recurring
// pairing and never alternates two teams. Select kWeekParity for the
// reference cadence.
enum class HomeAwayCadence {
    // Seat i hosts when (round_in_cycle + cycle) is even: recurring pairings
    // swap home/away every cycle.
    kCycleSwap,
    // Seat i hosts when (week + cycle) is even.
    kWeekParity,
};

bool ParseHomeAwayCadence(const std::string& text, HomeAwayCadence& cadence);
std::string HomeAwayCadenceName(HomeAwayCadence cadence);

class RoundRobinPairing {
public:
    // Circle method over number_of_weeks weeks. Seasons longer than one cycle
    // repeat the cycle; shorter seasons stop part way through it.
    static bool BuildRounds(const std::vector<TeamId>& teams,
                            int number_of_weeks,
                            HomeAwayCadence cadence,
                            std::vector<Round>& rounds,
                            std::string* error);

    // Seat order after `rotations` steps; seat 0 stays fixed.
    static std::vector<int> RotatedSeats(int team_count, int rotations);
};

}  // namespace courtsched::core::schedule
