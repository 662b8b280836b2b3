#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for the forecast executable's entry point.

#include <filesystem>

#include "sfe/foundation/config_manager.hpp"
#include "sfe/foundation/engine_result.hpp"

namespace sfe::service {

/// Environment variable that overrides the config file path.
inline constexpr const char* kConfigPathEnv = "SFE_CONFIG_PATH";

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The config file path is resolved in order:
///   1. SFE_CONFIG_PATH environment variable (if set and non-empty)
///   2. @p defaultPath parameter
///
/// When neither names a file the config is left empty, so every setting
/// takes its built-in default.
///
/// @param config      ConfigManager to populate.
/// @param defaultPath Fallback config file path; may be empty.
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] sfe::foundation::EngineResult<void>
loadConfig(sfe::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

} // namespace sfe::service
