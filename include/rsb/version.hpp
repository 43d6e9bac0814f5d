#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define RSB_VERSION_MAJOR 0
#define RSB_VERSION_MINOR 1
#define RSB_VERSION_PATCH 0
#define RSB_VERSION_STRING "0.1.0"

namespace rsb {

/// Project version information at compile time.
struct Version {
    static constexpr int major = RSB_VERSION_MAJOR;
    static constexpr int minor = RSB_VERSION_MINOR;
    static constexpr int patch = RSB_VERSION_PATCH;
    static constexpr const char* string = RSB_VERSION_STRING;
};

} // namespace rsb
