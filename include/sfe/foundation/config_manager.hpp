#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed, dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "sfe/foundation/engine_result.hpp"

namespace sfe::foundation {

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document and dotted-key
/// access (e.g., "rating.k_factor").
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any previous entries.
    /// @return Success or ConfigLoadFailed error.
    EngineResult<void> load(const std::filesystem::path& path);

    /// Load configuration from a YAML document held in memory.
    /// @return Success or ConfigLoadFailed error.
    EngineResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    EngineResult<T> get(std::string_view key) const;

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    EngineResult<void> replaceWith(const YAML::Node& root);

    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
EngineResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return EngineResult<T>::err(
            EngineError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return EngineResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return EngineResult<T>::err(
            EngineError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

} // namespace sfe::foundation
