#include "sfe/foundation/config_manager.hpp"

namespace sfe::foundation {

EngineResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        auto root = YAML::LoadFile(path.string());
        return replaceWith(root);
    } catch (const YAML::BadFile&) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

EngineResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        auto root = YAML::Load(std::string(yaml));
        return replaceWith(root);
    } catch (const YAML::ParserException& e) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

EngineResult<void> ConfigManager::replaceWith(const YAML::Node& root) {
    std::lock_guard lock(mutex_);
    entries_.clear();
    // An empty document is a valid, empty configuration.
    if (root.IsNull()) {
        return EngineResult<void>::ok();
    }
    if (!root.IsMap()) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    flatten("", root);
    return EngineResult<void>::ok();
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Leaf node (scalar, sequence, null): store under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace sfe::foundation
