/// @file service_runner.cpp
/// @brief Implementation of shared entry-point utilities.

#include "sfe/service/service_runner.hpp"

#include <cstdlib>
#include <string_view>

namespace sfe::service {

// -- Config loading ----------------------------------------------------------

sfe::foundation::EngineResult<void>
loadConfig(sfe::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv(kConfigPathEnv);
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    if (configPath.empty()) {
        return sfe::foundation::EngineResult<void>::ok();
    }
    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

} // namespace sfe::service
