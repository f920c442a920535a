#pragma once

/// @file version.hpp
/// @brief Project version information.

#define SRE_VERSION_MAJOR 0
#define SRE_VERSION_MINOR 1
#define SRE_VERSION_PATCH 0
#define SRE_VERSION_STRING "0.1.0"

namespace sre {

/// Project version information at compile time.
struct Version {
    static constexpr int major = SRE_VERSION_MAJOR;
    static constexpr int minor = SRE_VERSION_MINOR;
    static constexpr int patch = SRE_VERSION_PATCH;
    static constexpr const char* string = SRE_VERSION_STRING;
};

} // namespace sre
