#pragma once

/// @file version.hpp
/// @brief Library version information and root namespace definition.

#define QUARRY_VERSION_MAJOR 0
#define QUARRY_VERSION_MINOR 3
#define QUARRY_VERSION_PATCH 0
#define QUARRY_VERSION_STRING "0.3.0"

namespace quarry {

/// Library version information at compile time.
struct Version {
    static constexpr int major = QUARRY_VERSION_MAJOR;
    static constexpr int minor = QUARRY_VERSION_MINOR;
    static constexpr int patch = QUARRY_VERSION_PATCH;
    static constexpr const char* string = QUARRY_VERSION_STRING;
};

} // namespace quarry
