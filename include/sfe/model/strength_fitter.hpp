#pragma once

/// @file strength_fitter.hpp
/// @brief Per-team attack/defense multipliers relative to league average.
///
/// A single O(matches) aggregation pass:
///   league_avg = total goals / total team appearances   (two per match)
///   attack(t)  = (scored(t)   / played(t)) / league_avg
///   defense(t) = (conceded(t) / played(t)) / league_avg
///
/// This is deliberately not a regression or an iterative bidirectional
/// fit: a team's factors ignore the quality of the opponents it faced.

#include <cstddef>
#include <string>

#include "sfe/model/match_types.hpp"

namespace sfe::model {

/// League-average goals per team appearance when there is no usable history.
inline constexpr double kFallbackLeagueAverage = 1.4;

/// Fitted strengths for one snapshot of completed matches.
struct TeamStrengths {
    TeamValueMap attack;
    TeamValueMap defense;
    double leagueAverageGoals = kFallbackLeagueAverage;
    std::size_t matchesFitted = 0;

    /// Attack factor, 1.0 for unknown teams.
    [[nodiscard]] double attackOf(const std::string& team) const;

    /// Defense factor, 1.0 for unknown teams.
    [[nodiscard]] double defenseOf(const std::string& team) const;

    bool operator==(const TeamStrengths& other) const = default;
};

struct FitOptions {
    /// Used when there are no completed matches, or when they contain no goals.
    double fallbackLeagueAverage = kFallbackLeagueAverage;
};

/// Fit attack/defense factors from a snapshot of matches.
///
/// Pure function of its input. Pending records do not contribute goals but
/// their teams are listed with neutral factors, as are teams that never
/// played a completed match. Never fails: empty history yields the
/// fallback average and no team entries.
[[nodiscard]] TeamStrengths fitStrengths(const MatchList& matches,
                                         const FitOptions& options = {});

}  // namespace sfe::model
