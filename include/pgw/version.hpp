#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define PGW_VERSION_MAJOR 0
#define PGW_VERSION_MINOR 3
#define PGW_VERSION_PATCH 0
#define PGW_VERSION_STRING "0.3.0"

namespace pgw {

/// Provider gateway version information at compile time.
struct Version {
    static constexpr int major = PGW_VERSION_MAJOR;
    static constexpr int minor = PGW_VERSION_MINOR;
    static constexpr int patch = PGW_VERSION_PATCH;
    static constexpr const char* string = PGW_VERSION_STRING;
};

} // namespace pgw
