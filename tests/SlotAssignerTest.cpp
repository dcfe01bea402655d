#include "courtsched/core/schedule/RoundRobinPairing.h"
#include "courtsched/core/schedule/SlotAssigner.h"

#include <gtest/gtest.h>

#include <set>
#include <tuple>

using courtsched::core::schedule::CalendarDate;
using courtsched::core::schedule::CourtId;
using courtsched::core::schedule::HomeAwayCadence;
using courtsched::core::schedule::Matchup;
using courtsched::core::schedule::OrderByDebt;
using courtsched::core::schedule::Round;
using courtsched::core::schedule::RoundRobinPairing;
using courtsched::core::schedule::ScheduledMatch;
using courtsched::core::schedule::SlotAssigner;
using courtsched::core::schedule::SlotDebtLedger;
using courtsched::core::schedule::SlotPolicy;
using courtsched::core::schedule::TeamId;

namespace {

std::vector<TeamId> MakeTeams(int count) {
    std::vector<TeamId> teams;
    for (int i = 0; i < count; ++i) {
        teams.push_back("t" + std::to_string(i));
    }
    return teams;
}

std::vector<CalendarDate> Weekly(size_t count) {
    std::vector<CalendarDate> dates;
    const CalendarDate first{2026, 1, 7};
    for (size_t i = 0; i < count; ++i) {
        dates.push_back(first.AddDays(static_cast<int>(7 * i)));
    }
    return dates;
}

std::vector<Round> Pairings(int team_count, int weeks) {
    std::vector<Round> rounds;
    EXPECT_TRUE(RoundRobinPairing::BuildRounds(MakeTeams(team_count), weeks, HomeAwayCadence::kCycleSwap,
                                               rounds, nullptr));
    return rounds;
}

}  // namespace

TEST(SlotAssignerTest, ReferencePolicy) {
    const auto policy = SlotPolicy::Reference();
    ASSERT_EQ(policy.slots.size(), 4u);
    EXPECT_EQ(policy.slots.front().hour, 18);
    EXPECT_EQ(policy.slots.back().hour, 21);
    EXPECT_DOUBLE_EQ(policy.average_weight(), 2.5);
    EXPECT_TRUE(policy.Validate(nullptr));
}

TEST(SlotAssignerTest, PolicyValidation) {
    SlotPolicy policy;
    EXPECT_FALSE(policy.Validate(nullptr));
    policy.slots = {{18, 3.0}, {19, 3.0}};
    EXPECT_FALSE(policy.Validate(nullptr));
    policy.slots = {{18, 3.0}, {18, 2.0}};
    EXPECT_FALSE(policy.Validate(nullptr));
    policy.slots = {{24, 3.0}};
    EXPECT_FALSE(policy.Validate(nullptr));
    policy.slots = {{9, 5.0}, {12, 1.0}};
    EXPECT_TRUE(policy.Validate(nullptr));
}

// Two moderately behind teams must not outrank one team that is far behind.
TEST(SlotAssignerTest, OrdersByMaxDebtNotSum) {
    SlotDebtLedger ledger;
    ledger.Set("A", 3.0);
    ledger.Set("B", 3.0);
    ledger.Set("C", 5.0);
    ledger.Set("D", 0.0);

    const std::vector<Matchup> matchups{{"A", "B"}, {"C", "D"}};
    const auto ordered = OrderByDebt(matchups, ledger);
    ASSERT_EQ(ordered.size(), 2u);
    EXPECT_EQ(ordered[0], (Matchup{"C", "D"}));
    EXPECT_EQ(ordered[1], (Matchup{"A", "B"}));
}

TEST(SlotAssignerTest, EqualDebtKeepsInputOrder) {
    SlotDebtLedger ledger;
    const std::vector<Matchup> matchups{{"A", "B"}, {"C", "D"}, {"E", "F"}};
    EXPECT_EQ(OrderByDebt(matchups, ledger), matchups);

    ledger.Set("F", 1.0);
    ledger.Set("C", 1.0);
    EXPECT_EQ(OrderByDebt(matchups, ledger), (std::vector<Matchup>{{"C", "D"}, {"E", "F"}, {"A", "B"}}));
}

TEST(SlotAssignerTest, FillsCourtsBeforeNextHour) {
    const auto rounds = Pairings(10, 1);
    std::vector<ScheduledMatch> matches;
    ASSERT_TRUE(SlotAssigner::Assign(rounds, Weekly(1), {4, 5}, SlotPolicy::Reference(), matches, nullptr));
    ASSERT_EQ(matches.size(), 5u);
    const std::vector<std::pair<int, CourtId>> expected{{18, 4}, {18, 5}, {19, 4}, {19, 5}, {20, 4}};
    for (size_t i = 0; i < matches.size(); ++i) {
        EXPECT_EQ(matches[i].start_hour, expected[i].first);
        EXPECT_EQ(matches[i].court_id, expected[i].second);
        EXPECT_EQ(matches[i].round_number, 1);
        EXPECT_EQ(matches[i].date, (CalendarDate{2026, 1, 7}));
    }
}

TEST(SlotAssignerTest, DebtReordersLaterRounds) {
    const std::vector<Round> rounds{
        {0, {{"A", "F"}, {"B", "E"}, {"C", "D"}}, {}},
        {1, {{"E", "A"}, {"D", "F"}, {"C", "B"}}, {}},
    };
    std::vector<ScheduledMatch> matches;
    SlotDebtLedger debt;
    ASSERT_TRUE(SlotAssigner::Assign(rounds, Weekly(2), {1}, SlotPolicy::Reference(), matches, nullptr, &debt));
    ASSERT_EQ(matches.size(), 6u);

    // After week 1: A,F -1.5; B,E -0.5; C,D +0.5.
    EXPECT_EQ(matches[3].home_team_id, "D");
    EXPECT_EQ(matches[3].start_hour, 18);
    EXPECT_EQ(matches[4].home_team_id, "C");
    EXPECT_EQ(matches[4].start_hour, 19);
    EXPECT_EQ(matches[5].home_team_id, "E");
    EXPECT_EQ(matches[5].start_hour, 20);

    EXPECT_DOUBLE_EQ(debt.debt("A"), -1.5 + 0.5);
    EXPECT_DOUBLE_EQ(debt.debt("D"), 0.5 - 1.5);
    EXPECT_DOUBLE_EQ(debt.debt("C"), 0.5 - 0.5);
}

TEST(SlotAssignerTest, FullyPackedRoundsConserveDebt) {
    // 8 teams, one court: four matches fill the four hours exactly.
    const auto rounds = Pairings(8, 7);
    std::vector<ScheduledMatch> matches;
    SlotDebtLedger debt;
    ASSERT_TRUE(SlotAssigner::Assign(rounds, Weekly(7), {1}, SlotPolicy::Reference(), matches, nullptr, &debt));
    EXPECT_EQ(matches.size(), 28u);
    EXPECT_NEAR(debt.total(), 0.0, 1e-9);
    EXPECT_EQ(debt.entries().size(), 8u);

    // 16 teams on two courts.
    const auto wide = Pairings(16, 3);
    ASSERT_TRUE(SlotAssigner::Assign(wide, Weekly(3), {1, 2}, SlotPolicy::Reference(), matches, nullptr, &debt));
    EXPECT_NEAR(debt.total(), 0.0, 1e-9);
}

TEST(SlotAssignerTest, NeverDoubleBooksACourt) {
    for (int team_count = 2; team_count <= 16; ++team_count) {
        for (size_t court_count = 1; court_count <= 3; ++court_count) {
            if (static_cast<size_t>(team_count / 2) > 4 * court_count) {
                continue;
            }
            std::vector<CourtId> courts;
            for (size_t c = 0; c < court_count; ++c) {
                courts.push_back(static_cast<CourtId>(c + 1));
            }
            const auto rounds = Pairings(team_count, 12);
            std::vector<ScheduledMatch> matches;
            ASSERT_TRUE(SlotAssigner::Assign(rounds, Weekly(12), courts, SlotPolicy::Reference(), matches, nullptr));

            std::set<std::tuple<long long, int, CourtId>> booked;
            for (const auto& match : matches) {
                EXPECT_TRUE(booked.emplace(match.date.ToDayNumber(), match.start_hour, match.court_id).second)
                    << team_count << " teams, " << court_count << " courts";
            }
        }
    }
}

TEST(SlotAssignerTest, RejectsInvalidInput) {
    const auto rounds = Pairings(4, 2);
    std::vector<ScheduledMatch> matches;
    std::string error;

    EXPECT_FALSE(SlotAssigner::Assign(rounds, Weekly(2), {}, SlotPolicy::Reference(), matches, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(SlotAssigner::Assign(rounds, Weekly(3), {1}, SlotPolicy::Reference(), matches, nullptr));
    EXPECT_FALSE(SlotAssigner::Assign(rounds, Weekly(2), {1, 1}, SlotPolicy::Reference(), matches, nullptr));
    EXPECT_FALSE(SlotAssigner::Assign(rounds, Weekly(2), {1}, SlotPolicy{}, matches, nullptr));
    EXPECT_TRUE(matches.empty());
}

TEST(SlotAssignerTest, RejectsRoundLargerThanCapacity) {
    // Five matches cannot fit four hours on one court.
    const auto rounds = Pairings(10, 1);
    std::vector<ScheduledMatch> matches;
    std::string error;
    EXPECT_FALSE(SlotAssigner::Assign(rounds, Weekly(1), {1}, SlotPolicy::Reference(), matches, &error));
    EXPECT_NE(error.find("court slots"), std::string::npos);
    EXPECT_TRUE(matches.empty());
}
