#pragma once

/// @file engine_logger.hpp
/// @brief EngineLogger: category-filtered logging into the kcenon
///        common_system logger registry.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sfe/foundation/engine_result.hpp"

namespace sfe::foundation {

enum class LogLevel : uint8_t { Debug, Info, Warning, Error, Off };

/// One category per stage of a forecast run.
enum class LogCategory : uint8_t {
    Core,       ///< Runner start-up and shutdown
    Repository, ///< Match store reads and writes
    Rating,     ///< Elo replay
    Strength,   ///< Attack/defence fit
    Forecast,   ///< Scoreline grids
    Workflow,   ///< Model build and fixture prediction
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Repository", "Rating", "Strength", "Forecast", "Workflow"};
    return names[static_cast<std::size_t>(cat)];
}

/// Case-insensitive: "debug", "info", "warning" (or "warn"), "error", "off".
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Fields appended to a log line. Competition and season come first, then
/// the added fields in insertion order.
///
/// @code
///   auto ctx = LogContext::scope(query.competition, query.season)
///                  .add("fixtures", std::to_string(n));
/// @endcode
struct LogContext {
    std::optional<std::string> competition;
    std::optional<int> season;
    std::vector<std::pair<std::string, std::string>> fields;

    static LogContext scope(std::optional<std::string> competition,
                            std::optional<int> season) {
        LogContext ctx;
        ctx.competition = std::move(competition);
        ctx.season = season;
        return ctx;
    }

    LogContext& add(std::string key, std::string value) {
        fields.emplace_back(std::move(key), std::move(value));
        return *this;
    }
};

/// Render "[Category] message {competition=PL, season=2023, k=v}".
/// The braces are omitted when the context is empty.
std::string formatLogLine(LogCategory cat, std::string_view msg, const LogContext& ctx);

/// Sends each line to the registry logger named "sfe.<Category>" when one
/// is registered, otherwise to the registry's default logger.
///
/// Default minimum levels: Rating, Strength and Forecast at Debug, the
/// others at Info.
class EngineLogger {
public:
    EngineLogger();
    ~EngineLogger();

    EngineLogger(const EngineLogger&) = delete;
    EngineLogger& operator=(const EngineLogger&) = delete;

    void log(LogLevel level, LogCategory cat, std::string_view msg,
             const LogContext& ctx = {});

    void setLevel(LogCategory cat, LogLevel minLevel);
    void setAllLevels(LogLevel minLevel);
    [[nodiscard]] LogLevel level(LogCategory cat) const;
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// @return LoggerFlushFailed when the default registry logger fails.
    EngineResult<void> flush();

    /// Instance used by the SFE_LOG macros.
    static EngineLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sfe::foundation

#define SFE_LOG(level, cat, msg)                                              \
    do {                                                                      \
        auto& sfeLogger = ::sfe::foundation::EngineLogger::instance();        \
        if (sfeLogger.isEnabled((level), (cat))) {                            \
            sfeLogger.log((level), (cat), (msg));                             \
        }                                                                     \
    } while (0)

#define SFE_LOG_DEBUG(cat, msg) SFE_LOG(::sfe::foundation::LogLevel::Debug, (cat), (msg))
#define SFE_LOG_INFO(cat, msg) SFE_LOG(::sfe::foundation::LogLevel::Info, (cat), (msg))
#define SFE_LOG_WARN(cat, msg) SFE_LOG(::sfe::foundation::LogLevel::Warning, (cat), (msg))
#define SFE_LOG_ERROR(cat, msg) SFE_LOG(::sfe::foundation::LogLevel::Error, (cat), (msg))
