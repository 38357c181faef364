#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the gravity wars engine.

#include <cstdint>
#include <string_view>

namespace gw::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Command validation (0x0100 - 0x01FF)
    InvalidAngle = 0x0100,
    InvalidSpeed = 0x0101,
    NoTurnInProgress = 0x0102,
    NotAiming = 0x0103,
    NoShipForPlayer = 0x0104,
    GameAlreadyStarted = 0x0105,
    NotFiring = 0x0106,

    // Map generation (0x0200 - 0x02FF)
    PlacementFailed = 0x0200,
    InvalidMapParameters = 0x0201,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigValueInvalid = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Command";
        case 0x0200: return "MapGen";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace gw::foundation
