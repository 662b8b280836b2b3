/// @file forecast_config.cpp
/// @brief buildForecastConfig implementation.

#include "sfe/service/forecast_config.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace sfe::service {

using foundation::ConfigManager;
using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;

namespace {

/// Copy @p key into @p out when present. Returns the error for a key of
/// the wrong type.
template <typename T>
EngineResult<void> readOptional(const ConfigManager& config, const char* key, T& out) {
    if (!config.hasKey(key)) {
        return EngineResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return EngineResult<void>::err(value.error());
    }
    out = value.value();
    return EngineResult<void>::ok();
}

EngineResult<void> invalid(const std::string& message) {
    return EngineResult<void>::err(EngineError(ErrorCode::ConfigValueInvalid, message));
}

EngineResult<void> readModel(const ConfigManager& config, ForecastConfig& cfg) {
    for (auto read : {readOptional<double>(config, "rating.k_factor", cfg.kFactor),
                      readOptional<double>(config, "rating.base_rating", cfg.baseRating),
                      readOptional<double>(config, "forecast.home_advantage", cfg.homeAdvantage),
                      readOptional<double>(config, "forecast.fallback_league_average",
                                           cfg.fallbackLeagueAverage)}) {
        if (!read) {
            return read;
        }
    }

    if (!(cfg.kFactor > 0.0)) {
        return invalid("rating.k_factor must be positive");
    }
    if (!(cfg.homeAdvantage > 0.0)) {
        return invalid("forecast.home_advantage must be positive");
    }
    if (!(cfg.fallbackLeagueAverage > 0.0)) {
        return invalid("forecast.fallback_league_average must be positive");
    }
    return EngineResult<void>::ok();
}

EngineResult<void> readQuery(const ConfigManager& config, ForecastConfig& cfg) {
    if (config.hasKey("query.competition")) {
        std::string competition;
        auto read = readOptional(config, "query.competition", competition);
        if (!read) {
            return read;
        }
        if (!competition.empty()) {
            cfg.query.competition = competition;
        }
    }
    if (config.hasKey("query.season")) {
        int season = 0;
        auto read = readOptional(config, "query.season", season);
        if (!read) {
            return read;
        }
        cfg.query.season = season;
    }
    if (config.hasKey("query.limit")) {
        unsigned int limit = 0;
        auto read = readOptional(config, "query.limit", limit);
        if (!read) {
            return read;
        }
        // 0 means no limit.
        if (limit > 0) {
            cfg.query.limit = limit;
        }
    }
    return EngineResult<void>::ok();
}

EngineResult<void> readDatabase(const ConfigManager& config, ForecastConfig& cfg) {
    auto& db = cfg.database;

    auto read = readOptional(config, "database.connection_string", db.connectionString);
    if (!read) {
        return read;
    }

    std::string type;
    read = readOptional(config, "database.type", type);
    if (!read) {
        return read;
    }
    if (!type.empty()) {
        auto parsed = foundation::parseDatabaseType(type);
        if (!parsed) {
            return invalid("unknown database.type: " + type);
        }
        db.dbType = *parsed;
    }

    read = readOptional(config, "database.min_connections", db.minConnections);
    if (!read) {
        return read;
    }
    read = readOptional(config, "database.max_connections", db.maxConnections);
    if (!read) {
        return read;
    }
    if (db.maxConnections == 0 || db.minConnections > db.maxConnections) {
        return invalid("database connection bounds must satisfy 0 < min <= max");
    }

    if (config.hasKey("database.connection_timeout_seconds")) {
        int seconds = 0;
        read = readOptional(config, "database.connection_timeout_seconds", seconds);
        if (!read) {
            return read;
        }
        if (seconds <= 0) {
            return invalid("database.connection_timeout_seconds must be positive");
        }
        db.connectionTimeout = std::chrono::seconds(seconds);
    }
    return EngineResult<void>::ok();
}

} // namespace

EngineResult<ForecastConfig> buildForecastConfig(const ConfigManager& config) {
    ForecastConfig cfg;

    for (auto* step : {&readModel, &readQuery, &readDatabase}) {
        auto result = step(config, cfg);
        if (!result) {
            return EngineResult<ForecastConfig>::err(result.error());
        }
    }

    unsigned int threads = static_cast<unsigned int>(cfg.schedulerThreads);
    auto read = readOptional(config, "scheduler.threads", threads);
    if (!read) {
        return EngineResult<ForecastConfig>::err(read.error());
    }
    if (threads == 0) {
        return EngineResult<ForecastConfig>::err(
            EngineError(ErrorCode::ConfigValueInvalid, "scheduler.threads must be positive"));
    }
    cfg.schedulerThreads = threads;

    std::string level;
    read = readOptional(config, "logging.level", level);
    if (!read) {
        return EngineResult<ForecastConfig>::err(read.error());
    }
    if (!level.empty()) {
        auto parsed = foundation::parseLogLevel(level);
        if (!parsed) {
            return EngineResult<ForecastConfig>::err(
                EngineError(ErrorCode::ConfigValueInvalid, "unknown logging.level: " + level));
        }
        cfg.logLevel = *parsed;
    }

    return EngineResult<ForecastConfig>::ok(std::move(cfg));
}

}  // namespace sfe::service
