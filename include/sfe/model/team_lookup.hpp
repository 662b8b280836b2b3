#pragma once

/// @file team_lookup.hpp
/// @brief Lookup-with-default used for every per-team map in the engine.

#include <unordered_map>

namespace sfe::model {

/// Neutral multiplier for a team with no recorded matches.
inline constexpr double kNeutralFactor = 1.0;

/// Return the value stored for @p key, or @p fallback when absent.
///
/// Never inserts. Unknown teams are not an error anywhere in the engine:
/// ratings fall back to the base rating and strength factors to 1.0.
template <typename Map>
[[nodiscard]] typename Map::mapped_type lookupOr(const Map& map,
                                                 const typename Map::key_type& key,
                                                 typename Map::mapped_type fallback) {
    auto it = map.find(key);
    return it == map.end() ? fallback : it->second;
}

}  // namespace sfe::model
