/// @file main.cpp
/// @brief Forecast runner entry point.
///
/// Loads the configuration, opens the match database, builds rating and
/// strength models from the completed history and prints a forecast for
/// every pending fixture.

#include <cstdlib>
#include <iomanip>
#include <iostream>

#include "sfe/foundation/config_manager.hpp"
#include "sfe/foundation/engine_database.hpp"
#include "sfe/foundation/engine_logger.hpp"
#include "sfe/foundation/job_scheduler.hpp"
#include "sfe/service/forecast_config.hpp"
#include "sfe/service/forecast_workflow.hpp"
#include "sfe/service/service_runner.hpp"
#include "sfe/service/sql_match_repository.hpp"

namespace {

void printForecast(const sfe::service::FixtureForecast& item) {
    const auto& fixture = item.fixture;
    const auto& prediction = item.prediction;
    const auto& top = prediction.topScoreline();

    std::cout << fixture.date << "  " << fixture.competition << "  "
              << fixture.homeTeam << " vs " << fixture.awayTeam << "  "
              << std::fixed << std::setprecision(3)
              << "W " << prediction.pWin
              << "  D " << prediction.pDraw
              << "  L " << prediction.pLoss
              << "  top " << top.homeGoals << "-" << top.awayGoals
              << " (" << top.probability << ")";
    if (prediction.ratingExpectation) {
        std::cout << "  elo " << *prediction.ratingExpectation;
    }
    std::cout << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    using sfe::foundation::LogCategory;

    auto configPath = sfe::service::parseConfigArg(argc, argv);

    sfe::foundation::ConfigManager config;
    auto loadResult = sfe::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto forecastCfg = sfe::service::buildForecastConfig(config);
    if (!forecastCfg) {
        std::cerr << "Invalid config: " << forecastCfg.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    const auto& cfg = forecastCfg.value();

    if (cfg.logLevel) {
        sfe::foundation::EngineLogger::instance().setAllLevels(*cfg.logLevel);
    }

    sfe::foundation::EngineDatabase db;
    auto connectResult = db.connect(cfg.database);
    if (!connectResult) {
        std::cerr << "Failed to connect to " << cfg.database.connectionString
                  << ": " << connectResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    sfe::service::SqlMatchRepository repository(db, cfg.database.dbType);
    auto initResult = repository.initialize();
    if (!initResult) {
        std::cerr << "Failed to prepare match store: "
                  << initResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    sfe::foundation::EngineJobScheduler scheduler(cfg.schedulerThreads);
    sfe::service::ForecastWorkflow workflow(repository, cfg);

    auto model = workflow.buildModels(cfg.query, scheduler);
    if (!model) {
        std::cerr << "Failed to build models: " << model.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto forecasts = workflow.predictUpcoming(model.value(), cfg.query);
    if (!forecasts) {
        std::cerr << "Failed to forecast fixtures: "
                  << forecasts.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Models built from " << model.value().matchCount
              << " completed matches, " << model.value().ratings.size()
              << " rated teams\n";
    for (const auto& item : forecasts.value()) {
        printForecast(item);
    }
    if (forecasts.value().empty()) {
        SFE_LOG_INFO(LogCategory::Core, "no pending fixtures to forecast");
    }

    db.disconnect();
    (void)sfe::foundation::EngineLogger::instance().flush();
    return EXIT_SUCCESS;
}
