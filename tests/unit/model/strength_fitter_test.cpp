/// @file strength_fitter_test.cpp
/// @brief Unit tests for attack/defense strength fitting.

#include <gtest/gtest.h>

#include "sfe/model/match_types.hpp"
#include "sfe/model/strength_fitter.hpp"

using namespace sfe::model;

namespace {

MatchList smallLeague() {
    return {
        makeResult("2023-08-12", "PL", 2023, "A", "B", 2, 0),
        makeResult("2023-08-19", "PL", 2023, "B", "C", 1, 1),
    };
}

} // namespace

// ============================================================================
// Empty and degenerate histories
// ============================================================================

TEST(StrengthFitterTest, EmptyHistoryUsesFallbackAverage) {
    auto strengths = fitStrengths({});
    EXPECT_DOUBLE_EQ(strengths.leagueAverageGoals, kFallbackLeagueAverage);
    EXPECT_DOUBLE_EQ(strengths.leagueAverageGoals, 1.4);
    EXPECT_TRUE(strengths.attack.empty());
    EXPECT_TRUE(strengths.defense.empty());
    EXPECT_EQ(strengths.matchesFitted, 0u);
}

TEST(StrengthFitterTest, CustomFallbackAverage) {
    auto strengths = fitStrengths({}, FitOptions{2.5});
    EXPECT_DOUBLE_EQ(strengths.leagueAverageGoals, 2.5);
}

TEST(StrengthFitterTest, GoallessHistoryFallsBackInsteadOfDividingByZero) {
    MatchList history = {
        makeResult("2023-08-12", "PL", 2023, "A", "B", 0, 0),
        makeResult("2023-08-19", "PL", 2023, "B", "A", 0, 0),
    };
    auto strengths = fitStrengths(history);
    EXPECT_DOUBLE_EQ(strengths.leagueAverageGoals, kFallbackLeagueAverage);
    EXPECT_DOUBLE_EQ(strengths.attackOf("A"), 0.0);
    EXPECT_DOUBLE_EQ(strengths.defenseOf("B"), 0.0);
    EXPECT_EQ(strengths.matchesFitted, 2u);
}

TEST(StrengthFitterTest, PendingOnlyTeamsAreNeutral) {
    MatchList history = smallLeague();
    history.push_back(makeFixture("2023-08-26", "PL", 2023, "D", "E"));

    auto strengths = fitStrengths(history);
    EXPECT_EQ(strengths.attack.size(), 5u);
    EXPECT_DOUBLE_EQ(strengths.attack.at("D"), 1.0);
    EXPECT_DOUBLE_EQ(strengths.defense.at("E"), 1.0);
    EXPECT_EQ(strengths.matchesFitted, 2u);
}

// ============================================================================
// Factors
// ============================================================================

TEST(StrengthFitterTest, FactorsAreRatesOverLeagueAverage) {
    // 4 goals over 4 appearances: league average 1.0.
    auto strengths = fitStrengths(smallLeague());
    EXPECT_DOUBLE_EQ(strengths.leagueAverageGoals, 1.0);

    EXPECT_DOUBLE_EQ(strengths.attackOf("A"), 2.0);
    EXPECT_DOUBLE_EQ(strengths.defenseOf("A"), 0.0);
    EXPECT_DOUBLE_EQ(strengths.attackOf("B"), 0.5);
    EXPECT_DOUBLE_EQ(strengths.defenseOf("B"), 1.5);
    EXPECT_DOUBLE_EQ(strengths.attackOf("C"), 1.0);
    EXPECT_DOUBLE_EQ(strengths.defenseOf("C"), 1.0);
}

TEST(StrengthFitterTest, FactorsAreNonNegative) {
    MatchList history = {
        makeResult("2023-08-12", "PL", 2023, "A", "B", 4, 0),
        makeResult("2023-08-19", "PL", 2023, "C", "D", 0, 3),
        makeResult("2023-08-26", "PL", 2023, "B", "C", 1, 2),
        makeResult("2023-09-02", "PL", 2023, "D", "A", 2, 2),
    };
    auto strengths = fitStrengths(history);
    for (const auto& [team, value] : strengths.attack) {
        EXPECT_GE(value, 0.0) << team;
    }
    for (const auto& [team, value] : strengths.defense) {
        EXPECT_GE(value, 0.0) << team;
    }
}

TEST(StrengthFitterTest, UnknownTeamLookupIsNeutral) {
    auto strengths = fitStrengths(smallLeague());
    EXPECT_DOUBLE_EQ(strengths.attackOf("Unknown"), 1.0);
    EXPECT_DOUBLE_EQ(strengths.defenseOf("Unknown"), 1.0);
    EXPECT_EQ(strengths.attack.count("Unknown"), 0u);
}

TEST(StrengthFitterTest, FittingTwiceIsIdentical) {
    MatchList history = smallLeague();
    history.push_back(makeResult("2023-08-26", "PL", 2023, "C", "A", 3, 2));
    EXPECT_EQ(fitStrengths(history), fitStrengths(history));
}

TEST(StrengthFitterTest, AverageCountsBothSides) {
    // One 3-1 match: 4 goals over 2 appearances.
    MatchList history = {makeResult("2023-08-12", "PL", 2023, "A", "B", 3, 1)};
    auto strengths = fitStrengths(history);
    EXPECT_DOUBLE_EQ(strengths.leagueAverageGoals, 2.0);
    EXPECT_DOUBLE_EQ(strengths.attackOf("A"), 1.5);
    EXPECT_DOUBLE_EQ(strengths.attackOf("B"), 0.5);
}
