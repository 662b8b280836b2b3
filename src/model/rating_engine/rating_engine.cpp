/// @file rating_engine.cpp
/// @brief RatingEngine implementation.

#include "sfe/model/rating_engine.hpp"

#include <cmath>

#include "sfe/foundation/engine_logger.hpp"
#include "sfe/model/team_lookup.hpp"

namespace sfe::model {

using foundation::LogCategory;

RatingEngine::RatingEngine(double kFactor, double baseRating)
    : kFactor_(kFactor), baseRating_(baseRating) {}

double RatingEngine::expectedScore(double ratingA, double ratingB) {
    return 1.0 / (1.0 + std::pow(10.0, (ratingB - ratingA) / 400.0));
}

double RatingEngine::actualScore(int goalsA, int goalsB) noexcept {
    if (goalsA > goalsB) {
        return 1.0;
    }
    if (goalsA == goalsB) {
        return 0.5;
    }
    return 0.0;
}

void RatingEngine::update(const std::string& teamA, const std::string& teamB,
                          int goalsA, int goalsB) {
    double& ratingA = ratingSlot(teamA);
    double& ratingB = ratingSlot(teamB);

    double expectedA = expectedScore(ratingA, ratingB);
    double expectedB = 1.0 - expectedA;
    double scoreA = actualScore(goalsA, goalsB);
    double scoreB = 1.0 - scoreA;

    // Both deltas come from the pre-match ratings.
    double deltaA = kFactor_ * (scoreA - expectedA);
    double deltaB = kFactor_ * (scoreB - expectedB);
    ratingA += deltaA;
    ratingB += deltaB;
    ++matchesApplied_;
}

bool RatingEngine::apply(const MatchRecord& match) {
    if (!match.isCompleted()) {
        return false;
    }
    update(match.homeTeam, match.awayTeam, *match.homeGoals, *match.awayGoals);
    return true;
}

double RatingEngine::rating(const std::string& team) const {
    return lookupOr(ratings_, team, baseRating_);
}

double RatingEngine::expectedScore(const std::string& teamA,
                                   const std::string& teamB) const {
    return expectedScore(rating(teamA), rating(teamB));
}

double& RatingEngine::ratingSlot(const std::string& team) {
    // References into unordered_map stay valid across later insertions.
    return ratings_.try_emplace(team, baseRating_).first->second;
}

RatingEngine replayHistory(const MatchList& completed, double kFactor, double baseRating) {
    RatingEngine engine(kFactor, baseRating);
    std::size_t skipped = 0;
    for (const auto& match : completed) {
        if (!engine.apply(match)) {
            ++skipped;
        }
    }

    SFE_LOG_DEBUG(LogCategory::Rating,
                  "replayed " + std::to_string(engine.matchesApplied()) +
                  " matches over " + std::to_string(engine.teamCount()) +
                  " teams (" + std::to_string(skipped) + " skipped)");
    return engine;
}

RatingTable replayRatings(const MatchList& completed, double kFactor, double baseRating) {
    return replayHistory(completed, kFactor, baseRating).ratings();
}

}  // namespace sfe::model
