#pragma once

/// @file forecaster.hpp
/// @brief Independent-Poisson scoreline forecasts on a truncated 7x7 grid.
///
/// For a fixture (home, away):
///   lambda_home = league_avg * attack(home) * defense(away) * home_advantage
///   lambda_away = league_avg * attack(away) * defense(home)
///   P(gh, ga)   = Poisson(gh; lambda_home) * Poisson(ga; lambda_away)
/// for gh, ga in 0..6. The grid is not renormalized, so its total mass is
/// slightly below 1 (the tail beyond six goals per side is dropped).

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "sfe/model/match_types.hpp"
#include "sfe/model/strength_fitter.hpp"

namespace sfe::model {

/// Highest goal count per side represented in the grid.
inline constexpr int kMaxGoals = 6;

/// Cells per grid side (0..kMaxGoals inclusive).
inline constexpr std::size_t kGridSide = kMaxGoals + 1;

/// Number of ranked scorelines carried in a Prediction.
inline constexpr std::size_t kTopScorelines = 6;

/// Default multiplicative home advantage applied to lambda_home.
inline constexpr double kDefaultHomeAdvantage = 1.05;

/// Poisson probability mass P(X = k) for rate @p lambda (>= 0).
/// lambda == 0 puts all mass on k == 0.
[[nodiscard]] double poissonPmf(int k, double lambda);

/// One exact result with its probability.
struct Scoreline {
    int homeGoals = 0;
    int awayGoals = 0;
    double probability = 0.0;

    bool operator==(const Scoreline& other) const = default;
};

/// Fixed-size probability grid indexed [homeGoals][awayGoals].
class ScorelineGrid {
public:
    using Cells = std::array<std::array<double, kGridSide>, kGridSide>;

    /// Fill the grid from two Poisson rates.
    static ScorelineGrid fromRates(double lambdaHome, double lambdaAway);

    [[nodiscard]] double at(int homeGoals, int awayGoals) const;

    /// Sum of all cells; below 1.0 by the truncated tail mass.
    [[nodiscard]] double totalMass() const;

    [[nodiscard]] double homeWinMass() const;
    [[nodiscard]] double drawMass() const;
    [[nodiscard]] double awayWinMass() const;

    /// All cells ordered by probability descending. Equal probabilities
    /// keep enumeration order (home goals ascending, then away goals).
    [[nodiscard]] std::vector<Scoreline> ranked() const;

    [[nodiscard]] const Cells& cells() const noexcept { return cells_; }

private:
    Cells cells_{};
};

/// Forecast for one fixture.
struct Prediction {
    std::string homeTeam;
    std::string awayTeam;
    double lambdaHome = 0.0;
    double lambdaAway = 0.0;
    /// Top kTopScorelines cells in ranked order.
    std::vector<Scoreline> rankedScorelines;
    double pWin = 0.0;
    double pDraw = 0.0;
    double pLoss = 0.0;
    /// Total truncated-grid mass; equals pWin + pDraw + pLoss.
    double gridMass = 0.0;
    /// Elo expected score of the home side, when ratings were supplied.
    std::optional<double> ratingExpectation;

    /// Most likely exact result.
    [[nodiscard]] const Scoreline& topScoreline() const { return rankedScorelines.front(); }
};

/// Forecast a fixture from raw factor maps.
///
/// Teams missing from either map use the neutral factor 1.0.
[[nodiscard]] Prediction predict(const std::string& homeTeam,
                                 const std::string& awayTeam,
                                 const TeamValueMap& attack,
                                 const TeamValueMap& defense,
                                 double leagueAverageGoals,
                                 double homeAdvantage = kDefaultHomeAdvantage);

/// Forecast a fixture from fitted strengths.
[[nodiscard]] Prediction predict(const std::string& homeTeam,
                                 const std::string& awayTeam,
                                 const TeamStrengths& strengths,
                                 double homeAdvantage = kDefaultHomeAdvantage);

}  // namespace sfe::model
