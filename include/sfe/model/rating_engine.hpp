#pragma once

/// @file rating_engine.hpp
/// @brief Elo-style team ratings updated sequentially over match history.
///
/// Uses the standard Elo formula:
///   E(A) = 1 / (1 + 10^((R_B - R_A) / 400))
///   R_A' = R_A + K * (S_A - E(A))
/// with S_A = 1 for a win, 0.5 for a draw and 0 for a loss. There is no
/// clamping, decay or margin-of-victory scaling, so every update is
/// zero-sum between the two teams.

#include <cstddef>
#include <string>

#include "sfe/model/match_types.hpp"

namespace sfe::model {

/// Team name → Elo rating.
using RatingTable = TeamValueMap;

/// Per-instance Elo rating state.
///
/// Teams are created lazily at the base rating on first update; const
/// lookups of unseen teams return the base rating without inserting.
/// Ratings are only meaningful if matches are applied in non-decreasing
/// date order, which is the caller's responsibility.
///
/// Not safe for concurrent update(); use one engine per worker or
/// serialize access externally.
class RatingEngine {
public:
    static constexpr double kDefaultKFactor = 20.0;
    static constexpr double kDefaultBaseRating = 1500.0;

    explicit RatingEngine(double kFactor = kDefaultKFactor,
                          double baseRating = kDefaultBaseRating);

    /// Expected score of a team rated @p ratingA against one rated @p ratingB.
    [[nodiscard]] static double expectedScore(double ratingA, double ratingB);

    /// Actual score for side A: 1.0 win, 0.5 draw, 0.0 loss.
    [[nodiscard]] static double actualScore(int goalsA, int goalsB) noexcept;

    /// Apply one completed match between @p teamA and @p teamB.
    void update(const std::string& teamA, const std::string& teamB,
                int goalsA, int goalsB);

    /// Apply a completed match record (home as side A).
    /// Pending or half-filled records are ignored and return false.
    bool apply(const MatchRecord& match);

    /// Current rating, or the base rating for an unseen team.
    [[nodiscard]] double rating(const std::string& team) const;

    /// Expected score of @p teamA against @p teamB from current ratings.
    [[nodiscard]] double expectedScore(const std::string& teamA,
                                       const std::string& teamB) const;

    [[nodiscard]] const RatingTable& ratings() const noexcept { return ratings_; }
    [[nodiscard]] std::size_t teamCount() const noexcept { return ratings_.size(); }
    [[nodiscard]] std::size_t matchesApplied() const noexcept { return matchesApplied_; }
    [[nodiscard]] double kFactor() const noexcept { return kFactor_; }
    [[nodiscard]] double baseRating() const noexcept { return baseRating_; }

private:
    double& ratingSlot(const std::string& team);

    double kFactor_;
    double baseRating_;
    RatingTable ratings_;
    std::size_t matchesApplied_ = 0;
};

/// Replay a chronologically ordered history through a fresh engine.
///
/// Pending records are skipped. The returned engine can be queried
/// read-only afterwards.
[[nodiscard]] RatingEngine replayHistory(const MatchList& completed,
                                         double kFactor = RatingEngine::kDefaultKFactor,
                                         double baseRating = RatingEngine::kDefaultBaseRating);

/// Same as replayHistory() but returns only the rating map.
[[nodiscard]] RatingTable replayRatings(const MatchList& completed,
                                        double kFactor = RatingEngine::kDefaultKFactor,
                                        double baseRating = RatingEngine::kDefaultBaseRating);

}  // namespace sfe::model
