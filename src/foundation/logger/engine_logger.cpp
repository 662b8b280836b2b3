/// @file engine_logger.cpp
/// @brief EngineLogger over kcenon::common::interfaces::GlobalLoggerRegistry.

#include "sfe/foundation/engine_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <atomic>
#include <cctype>

namespace sfe::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

kci::log_level toRegistryLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return kci::log_level::debug;
        case LogLevel::Info:    return kci::log_level::info;
        case LogLevel::Warning: return kci::log_level::warning;
        case LogLevel::Error:   return kci::log_level::error;
        case LogLevel::Off:     return kci::log_level::off;
    }
    return kci::log_level::info;
}

LogLevel defaultLevel(LogCategory cat) {
    switch (cat) {
        case LogCategory::Rating:
        case LogCategory::Strength:
        case LogCategory::Forecast:
            return LogLevel::Debug;
        default:
            return LogLevel::Info;
    }
}

} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "debug") return LogLevel::Debug;
    if (key == "info") return LogLevel::Info;
    if (key == "warning" || key == "warn") return LogLevel::Warning;
    if (key == "error") return LogLevel::Error;
    if (key == "off") return LogLevel::Off;
    return std::nullopt;
}

std::string formatLogLine(LogCategory cat, std::string_view msg, const LogContext& ctx) {
    std::string line;
    line += '[';
    line += logCategoryName(cat);
    line += "] ";
    line += msg;

    std::string fields;
    auto field = [&fields](std::string_view key, std::string_view value) {
        fields += fields.empty() ? " {" : ", ";
        fields += key;
        fields += '=';
        fields += value;
    };
    if (ctx.competition) {
        field("competition", *ctx.competition);
    }
    if (ctx.season) {
        field("season", std::to_string(*ctx.season));
    }
    for (const auto& [key, value] : ctx.fields) {
        field(key, value);
    }
    if (!fields.empty()) {
        line += fields;
        line += '}';
    }
    return line;
}

struct EngineLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> minLevels;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            minLevels[i].store(defaultLevel(static_cast<LogCategory>(i)));
        }
    }

    static std::shared_ptr<kci::ILogger> sinkFor(LogCategory cat) {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto named = registry.get_logger("sfe." + std::string(logCategoryName(cat)));
        if (named && named != kci::GlobalLoggerRegistry::null_logger()) {
            return named;
        }
        return registry.get_default_logger();
    }
};

EngineLogger::EngineLogger() : impl_(std::make_unique<Impl>()) {}

EngineLogger::~EngineLogger() = default;

void EngineLogger::log(LogLevel level, LogCategory cat, std::string_view msg,
                       const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    // Sink failures are not reported back to model code.
    (void)Impl::sinkFor(cat)->log(toRegistryLevel(level), formatLogLine(cat, msg, ctx));
}

void EngineLogger::setLevel(LogCategory cat, LogLevel minLevel) {
    impl_->minLevels[static_cast<std::size_t>(cat)].store(minLevel);
}

void EngineLogger::setAllLevels(LogLevel minLevel) {
    for (auto& slot : impl_->minLevels) {
        slot.store(minLevel);
    }
}

LogLevel EngineLogger::level(LogCategory cat) const {
    return impl_->minLevels[static_cast<std::size_t>(cat)].load();
}

bool EngineLogger::isEnabled(LogLevel level, LogCategory cat) const {
    return level != LogLevel::Off && level >= this->level(cat);
}

EngineResult<void> EngineLogger::flush() {
    auto result = kci::GlobalLoggerRegistry::instance().get_default_logger()->flush();
    if (result.is_err()) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::LoggerFlushFailed, "default logger failed to flush"));
    }
    return EngineResult<void>::ok();
}

EngineLogger& EngineLogger::instance() {
    static EngineLogger logger;
    return logger;
}

} // namespace sfe::foundation
