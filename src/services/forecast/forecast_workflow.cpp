/// @file forecast_workflow.cpp
/// @brief ForecastWorkflow implementation.

#include "sfe/service/forecast_workflow.hpp"

#include <string>
#include <utility>

#include "sfe/foundation/engine_logger.hpp"
#include "sfe/model/team_lookup.hpp"

namespace sfe::service {

using foundation::EngineJobScheduler;
using foundation::EngineLogger;
using foundation::EngineResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using model::MatchList;

namespace {

LogContext contextFor(const MatchQuery& query) {
    return LogContext::scope(query.competition, query.season);
}

} // namespace

ForecastWorkflow::ForecastWorkflow(const IMatchRepository& repository, ForecastConfig config)
    : repository_(repository), config_(std::move(config)) {}

EngineResult<MatchList> ForecastWorkflow::loadHistory(const MatchQuery& query) const {
    auto completed = repository_.listCompleted(query);
    if (!completed) {
        SFE_LOG_ERROR(LogCategory::Workflow,
                      "failed to load match history: " +
                      std::string(completed.error().message()));
    }
    return completed;
}

EngineResult<ForecastModel> ForecastWorkflow::buildModels(const MatchQuery& query) const {
    auto history = loadHistory(query);
    if (!history) {
        return EngineResult<ForecastModel>::err(history.error());
    }

    ForecastModel out;
    out.matchCount = history.value().size();
    out.ratings = model::replayRatings(history.value(), config_.kFactor, config_.baseRating);
    out.strengths = model::fitStrengths(history.value(),
                                        model::FitOptions{config_.fallbackLeagueAverage});

    auto ctx = contextFor(query);
    ctx.add("matches", std::to_string(out.matchCount))
        .add("teams", std::to_string(out.ratings.size()));
    EngineLogger::instance().log(LogLevel::Info, LogCategory::Workflow, "Models built", ctx);
    return EngineResult<ForecastModel>::ok(std::move(out));
}

EngineResult<ForecastModel> ForecastWorkflow::buildModels(
    const MatchQuery& query, EngineJobScheduler& scheduler) const {
    auto history = loadHistory(query);
    if (!history) {
        return EngineResult<ForecastModel>::err(history.error());
    }
    const MatchList& matches = history.value();

    ForecastModel out;
    out.matchCount = matches.size();

    // Both jobs read the shared snapshot and write disjoint fields of out.
    auto ratingJob = scheduler.schedule([&] {
        out.ratings = model::replayRatings(matches, config_.kFactor, config_.baseRating);
    });
    if (!ratingJob) {
        return EngineResult<ForecastModel>::err(ratingJob.error());
    }
    auto strengthJob = scheduler.schedule([&] {
        out.strengths = model::fitStrengths(matches,
                                            model::FitOptions{config_.fallbackLeagueAverage});
    });
    if (!strengthJob) {
        // The rating job references locals; it must finish before returning.
        (void)scheduler.wait(ratingJob.value());
        return EngineResult<ForecastModel>::err(strengthJob.error());
    }

    auto ratingDone = scheduler.wait(ratingJob.value());
    auto strengthDone = scheduler.wait(strengthJob.value());
    if (!ratingDone) {
        return EngineResult<ForecastModel>::err(ratingDone.error());
    }
    if (!strengthDone) {
        return EngineResult<ForecastModel>::err(strengthDone.error());
    }

    auto ctx = contextFor(query);
    ctx.add("matches", std::to_string(out.matchCount))
        .add("teams", std::to_string(out.ratings.size()))
        .add("mode", "scheduled");
    EngineLogger::instance().log(LogLevel::Info, LogCategory::Workflow, "Models built", ctx);
    return EngineResult<ForecastModel>::ok(std::move(out));
}

EngineResult<std::vector<FixtureForecast>> ForecastWorkflow::predictUpcoming(
    const ForecastModel& forecastModel, const MatchQuery& query) const {
    using Out = EngineResult<std::vector<FixtureForecast>>;

    auto pending = repository_.listPending(query);
    if (!pending) {
        SFE_LOG_ERROR(LogCategory::Workflow,
                      "failed to load pending fixtures: " +
                      std::string(pending.error().message()));
        return Out::err(pending.error());
    }

    std::vector<FixtureForecast> forecasts;
    forecasts.reserve(pending.value().size());
    for (const auto& fixture : pending.value()) {
        FixtureForecast item;
        item.fixture = fixture;
        item.prediction = model::predict(fixture.homeTeam, fixture.awayTeam,
                                         forecastModel.strengths, config_.homeAdvantage);

        double homeRating = model::lookupOr(forecastModel.ratings, fixture.homeTeam,
                                            config_.baseRating);
        double awayRating = model::lookupOr(forecastModel.ratings, fixture.awayTeam,
                                            config_.baseRating);
        item.prediction.ratingExpectation =
            model::RatingEngine::expectedScore(homeRating, awayRating);
        forecasts.push_back(std::move(item));
    }

    auto ctx = contextFor(query);
    ctx.add("fixtures", std::to_string(forecasts.size()));
    EngineLogger::instance().log(LogLevel::Info, LogCategory::Workflow, "Forecasts produced",
                                 ctx);
    return Out::ok(std::move(forecasts));
}

}  // namespace sfe::service
