#pragma once

/// @file version.hpp
/// @brief Engine version, usable in preprocessor checks and at compile time.

#include <string_view>

#define GW_VERSION_MAJOR 0
#define GW_VERSION_MINOR 3
#define GW_VERSION_PATCH 0
#define GW_VERSION_STRING "0.3.0"

namespace gw {

struct Version {
    static constexpr int major = GW_VERSION_MAJOR;
    static constexpr int minor = GW_VERSION_MINOR;
    static constexpr int patch = GW_VERSION_PATCH;
    static constexpr const char* string = GW_VERSION_STRING;

    /// Encoded as major * 10000 + minor * 100 + patch for ordering.
    static constexpr int number = major * 10000 + minor * 100 + patch;
};

/// Version string as a view, e.g. for log lines.
constexpr std::string_view versionString() noexcept {
    return GW_VERSION_STRING;
}

} // namespace gw
