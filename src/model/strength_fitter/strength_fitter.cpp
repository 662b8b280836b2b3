/// @file strength_fitter.cpp
/// @brief Attack/defense strength aggregation.

#include "sfe/model/strength_fitter.hpp"

#include <unordered_map>

#include "sfe/foundation/engine_logger.hpp"
#include "sfe/model/team_lookup.hpp"

namespace sfe::model {

using foundation::LogCategory;

namespace {

struct TeamTotals {
    long long scored = 0;
    long long conceded = 0;
    long long played = 0;
};

} // namespace

double TeamStrengths::attackOf(const std::string& team) const {
    return lookupOr(attack, team, kNeutralFactor);
}

double TeamStrengths::defenseOf(const std::string& team) const {
    return lookupOr(defense, team, kNeutralFactor);
}

TeamStrengths fitStrengths(const MatchList& matches, const FitOptions& options) {
    std::unordered_map<std::string, TeamTotals> totals;
    long long totalGoals = 0;
    long long totalAppearances = 0;
    std::size_t completed = 0;

    for (const auto& match : matches) {
        auto& home = totals[match.homeTeam];
        auto& away = totals[match.awayTeam];
        if (!match.isCompleted()) {
            continue;
        }

        int hg = *match.homeGoals;
        int ag = *match.awayGoals;
        home.scored += hg;
        home.conceded += ag;
        home.played += 1;
        away.scored += ag;
        away.conceded += hg;
        away.played += 1;

        totalGoals += hg + ag;
        totalAppearances += 2;
        ++completed;
    }

    TeamStrengths result;
    result.matchesFitted = completed;
    // A goalless history would make every factor a division by zero.
    result.leagueAverageGoals =
        (totalAppearances > 0 && totalGoals > 0)
            ? static_cast<double>(totalGoals) / static_cast<double>(totalAppearances)
            : options.fallbackLeagueAverage;

    const double avg = result.leagueAverageGoals;
    for (const auto& [team, t] : totals) {
        if (t.played > 0) {
            auto played = static_cast<double>(t.played);
            result.attack[team] = (static_cast<double>(t.scored) / played) / avg;
            result.defense[team] = (static_cast<double>(t.conceded) / played) / avg;
        } else {
            result.attack[team] = kNeutralFactor;
            result.defense[team] = kNeutralFactor;
        }
    }

    SFE_LOG_DEBUG(LogCategory::Strength,
                  "fitted " + std::to_string(result.attack.size()) + " teams from " +
                  std::to_string(completed) + " matches, league average " +
                  std::to_string(avg));
    return result;
}

}  // namespace sfe::model
