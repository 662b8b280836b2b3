#pragma once

/// @file forecast_workflow.hpp
/// @brief Builds rating and strength models from a match repository and
///        forecasts its pending fixtures.

#include <cstddef>
#include <vector>

#include "sfe/foundation/engine_result.hpp"
#include "sfe/foundation/job_scheduler.hpp"
#include "sfe/model/forecaster.hpp"
#include "sfe/model/match_types.hpp"
#include "sfe/model/rating_engine.hpp"
#include "sfe/model/strength_fitter.hpp"
#include "sfe/service/forecast_config.hpp"
#include "sfe/service/match_repository.hpp"

namespace sfe::service {

/// Models fitted from one snapshot of completed matches.
struct ForecastModel {
    model::TeamStrengths strengths;
    model::RatingTable ratings;
    std::size_t matchCount = 0;
};

/// A pending fixture and its forecast.
struct FixtureForecast {
    model::MatchRecord fixture;
    model::Prediction prediction;
};

/// Repository-driven forecast pipeline.
///
/// The completed listing is read once per buildModels() call, so the
/// ratings and strengths of a model always describe the same history.
///
/// Example:
/// @code
///   InMemoryMatchRepository repo;
///   ForecastWorkflow workflow(repo, ForecastConfig{});
///   auto model = workflow.buildModels(query);
///   auto forecasts = workflow.predictUpcoming(model.value(), query);
/// @endcode
class ForecastWorkflow {
public:
    /// @param repository Must outlive the workflow.
    ForecastWorkflow(const IMatchRepository& repository, ForecastConfig config);

    /// Replay ratings and fit strengths on the calling thread.
    [[nodiscard]] foundation::EngineResult<ForecastModel> buildModels(
        const MatchQuery& query) const;

    /// Replay ratings and fit strengths as two jobs on @p scheduler and wait
    /// for both. Produces the same model as the sequential overload.
    [[nodiscard]] foundation::EngineResult<ForecastModel> buildModels(
        const MatchQuery& query, foundation::EngineJobScheduler& scheduler) const;

    /// Forecast every pending fixture selected by @p query, in date order.
    /// Each prediction carries the home side's Elo expectation.
    [[nodiscard]] foundation::EngineResult<std::vector<FixtureForecast>> predictUpcoming(
        const ForecastModel& model, const MatchQuery& query) const;

    [[nodiscard]] const ForecastConfig& config() const noexcept { return config_; }

private:
    foundation::EngineResult<model::MatchList> loadHistory(const MatchQuery& query) const;

    const IMatchRepository& repository_;
    ForecastConfig config_;
};

}  // namespace sfe::service
