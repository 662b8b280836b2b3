/// @file forecaster.cpp
/// @brief Poisson scoreline grid and fixture predictions.

#include "sfe/model/forecaster.hpp"

#include <algorithm>

#include <gsl/gsl_randist.h>

#include "sfe/foundation/engine_logger.hpp"
#include "sfe/model/team_lookup.hpp"

namespace sfe::model {

using foundation::LogCategory;

double poissonPmf(int k, double lambda) {
    if (k < 0) {
        return 0.0;
    }
    if (lambda == 0.0) {
        return k == 0 ? 1.0 : 0.0;
    }
    return gsl_ran_poisson_pdf(static_cast<unsigned int>(k), lambda);
}

// ---------------------------------------------------------------------------
// ScorelineGrid
// ---------------------------------------------------------------------------

ScorelineGrid ScorelineGrid::fromRates(double lambdaHome, double lambdaAway) {
    std::array<double, kGridSide> home{};
    std::array<double, kGridSide> away{};
    for (int g = 0; g <= kMaxGoals; ++g) {
        home[g] = poissonPmf(g, lambdaHome);
        away[g] = poissonPmf(g, lambdaAway);
    }

    ScorelineGrid grid;
    for (std::size_t h = 0; h < kGridSide; ++h) {
        for (std::size_t a = 0; a < kGridSide; ++a) {
            grid.cells_[h][a] = home[h] * away[a];
        }
    }
    return grid;
}

double ScorelineGrid::at(int homeGoals, int awayGoals) const {
    if (homeGoals < 0 || awayGoals < 0 || homeGoals > kMaxGoals || awayGoals > kMaxGoals) {
        return 0.0;
    }
    return cells_[homeGoals][awayGoals];
}

double ScorelineGrid::totalMass() const {
    double sum = 0.0;
    for (const auto& row : cells_) {
        for (double p : row) {
            sum += p;
        }
    }
    return sum;
}

double ScorelineGrid::homeWinMass() const {
    double sum = 0.0;
    for (std::size_t h = 0; h < kGridSide; ++h) {
        for (std::size_t a = 0; a < h; ++a) {
            sum += cells_[h][a];
        }
    }
    return sum;
}

double ScorelineGrid::drawMass() const {
    double sum = 0.0;
    for (std::size_t g = 0; g < kGridSide; ++g) {
        sum += cells_[g][g];
    }
    return sum;
}

double ScorelineGrid::awayWinMass() const {
    double sum = 0.0;
    for (std::size_t h = 0; h < kGridSide; ++h) {
        for (std::size_t a = h + 1; a < kGridSide; ++a) {
            sum += cells_[h][a];
        }
    }
    return sum;
}

std::vector<Scoreline> ScorelineGrid::ranked() const {
    std::vector<Scoreline> out;
    out.reserve(kGridSide * kGridSide);
    for (std::size_t h = 0; h < kGridSide; ++h) {
        for (std::size_t a = 0; a < kGridSide; ++a) {
            out.push_back(Scoreline{static_cast<int>(h), static_cast<int>(a), cells_[h][a]});
        }
    }
    // Stable: ties stay in enumeration order.
    std::stable_sort(out.begin(), out.end(),
                     [](const Scoreline& lhs, const Scoreline& rhs) {
                         return lhs.probability > rhs.probability;
                     });
    return out;
}

// ---------------------------------------------------------------------------
// predict()
// ---------------------------------------------------------------------------

Prediction predict(const std::string& homeTeam,
                   const std::string& awayTeam,
                   const TeamValueMap& attack,
                   const TeamValueMap& defense,
                   double leagueAverageGoals,
                   double homeAdvantage) {
    Prediction out;
    out.homeTeam = homeTeam;
    out.awayTeam = awayTeam;
    out.lambdaHome = leagueAverageGoals *
                     lookupOr(attack, homeTeam, kNeutralFactor) *
                     lookupOr(defense, awayTeam, kNeutralFactor) *
                     homeAdvantage;
    out.lambdaAway = leagueAverageGoals *
                     lookupOr(attack, awayTeam, kNeutralFactor) *
                     lookupOr(defense, homeTeam, kNeutralFactor);

    auto grid = ScorelineGrid::fromRates(out.lambdaHome, out.lambdaAway);
    auto ranked = grid.ranked();
    ranked.resize(kTopScorelines);
    out.rankedScorelines = std::move(ranked);

    out.pWin = grid.homeWinMass();
    out.pDraw = grid.drawMass();
    out.pLoss = grid.awayWinMass();
    out.gridMass = out.pWin + out.pDraw + out.pLoss;

    SFE_LOG_DEBUG(LogCategory::Forecast,
                  homeTeam + " vs " + awayTeam + ": lambda " +
                  std::to_string(out.lambdaHome) + "/" + std::to_string(out.lambdaAway));
    return out;
}

Prediction predict(const std::string& homeTeam,
                   const std::string& awayTeam,
                   const TeamStrengths& strengths,
                   double homeAdvantage) {
    return predict(homeTeam, awayTeam, strengths.attack, strengths.defense,
                   strengths.leagueAverageGoals, homeAdvantage);
}

}  // namespace sfe::model
