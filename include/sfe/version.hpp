#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define SFE_VERSION_MAJOR 0
#define SFE_VERSION_MINOR 1
#define SFE_VERSION_PATCH 0
#define SFE_VERSION_STRING "0.1.0"

namespace sfe {

/// Project version information at compile time.
struct Version {
    static constexpr int major = SFE_VERSION_MAJOR;
    static constexpr int minor = SFE_VERSION_MINOR;
    static constexpr int patch = SFE_VERSION_PATCH;
    static constexpr const char* string = SFE_VERSION_STRING;
};

} // namespace sfe
