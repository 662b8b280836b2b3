#pragma once

/// @file match_types.hpp
/// @brief Match records and team-keyed maps shared by the model layer.

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sfe::model {

/// One fixture, played or not.
///
/// `date` is an ISO-8601 calendar date ("2023-08-12") so lexical order is
/// chronological order. `season` is the season start year.
struct MatchRecord {
    std::string date;
    std::string competition;
    int season = 0;
    std::string homeTeam;
    std::string awayTeam;
    std::optional<int> homeGoals;
    std::optional<int> awayGoals;

    /// Both goal counts are known.
    [[nodiscard]] bool isCompleted() const noexcept {
        return homeGoals.has_value() && awayGoals.has_value();
    }

    /// Neither goal count is known.
    [[nodiscard]] bool isPending() const noexcept {
        return !homeGoals.has_value() && !awayGoals.has_value();
    }

    bool operator==(const MatchRecord& other) const = default;
};

using MatchList = std::vector<MatchRecord>;

/// Team name → scalar value (rating, attack factor, defense factor).
using TeamValueMap = std::unordered_map<std::string, double>;

/// Build a completed match record.
inline MatchRecord makeResult(std::string date, std::string competition, int season,
                              std::string home, std::string away,
                              int homeGoals, int awayGoals) {
    return MatchRecord{std::move(date), std::move(competition), season,
                       std::move(home), std::move(away), homeGoals, awayGoals};
}

/// Build a pending fixture record.
inline MatchRecord makeFixture(std::string date, std::string competition, int season,
                               std::string home, std::string away) {
    return MatchRecord{std::move(date), std::move(competition), season,
                       std::move(home), std::move(away), std::nullopt, std::nullopt};
}

}  // namespace sfe::model
