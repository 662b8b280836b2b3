#pragma once

/// @file forecast_config.hpp
/// @brief Typed forecast settings read from a ConfigManager.

#include <cstddef>
#include <optional>

#include "sfe/foundation/config_manager.hpp"
#include "sfe/foundation/engine_database.hpp"
#include "sfe/foundation/engine_logger.hpp"
#include "sfe/model/forecaster.hpp"
#include "sfe/model/rating_engine.hpp"
#include "sfe/model/strength_fitter.hpp"
#include "sfe/service/match_repository.hpp"

namespace sfe::service {

/// Settings for one forecast run. Every field has a usable default, so an
/// empty config file yields the reference model (K = 20, base 1500,
/// home advantage 1.05, fallback average 1.4).
struct ForecastConfig {
    double kFactor = model::RatingEngine::kDefaultKFactor;
    double baseRating = model::RatingEngine::kDefaultBaseRating;
    double homeAdvantage = model::kDefaultHomeAdvantage;
    double fallbackLeagueAverage = model::kFallbackLeagueAverage;

    /// Applied to both the completed-history and pending-fixture listings.
    MatchQuery query;

    foundation::DatabaseConfig database;
    std::size_t schedulerThreads = 2;

    /// Applied to every log category when set.
    std::optional<foundation::LogLevel> logLevel;
};

/// Read a ForecastConfig from @p config.
///
/// Recognized keys: rating.k_factor, rating.base_rating,
/// forecast.home_advantage, forecast.fallback_league_average,
/// query.competition, query.season, query.limit,
/// database.connection_string, database.type, database.min_connections,
/// database.max_connections, database.connection_timeout_seconds,
/// scheduler.threads, logging.level.
///
/// @return ConfigTypeMismatch for a key of the wrong type, or
///         ConfigValueInvalid for an out-of-range or unknown value.
[[nodiscard]] foundation::EngineResult<ForecastConfig> buildForecastConfig(
    const foundation::ConfigManager& config);

}  // namespace sfe::service
