#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon common_system logger interfaces.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control for the simulation
/// subsystems (physics, turns, map generation, input).

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gw/foundation/game_result.hpp"

namespace gw::foundation {

/// Log severity levels for the engine.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Session and host loop
    Physics = 1, ///< Missile integration and collisions
    Turn    = 2, ///< Turn / phase transitions
    MapGen  = 3, ///< Procedural map generation
    Input   = 4, ///< Input event handling
    Config  = 5  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 6;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Physics", "Turn", "MapGen", "Input", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.playerId = 1;
///   ctx.entityIndex = 7;
///   logger.logWithContext(LogLevel::Debug, LogCategory::Physics,
///                         "Missile hit entity", ctx);
/// @endcode
struct LogContext {
    std::optional<std::size_t> entityIndex;
    std::optional<std::size_t> playerId;
    std::optional<uint64_t> tick;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logging interfaces.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Physics  | Info          |
/// | Turn     | Info          |
/// | MapGen   | Info          |
/// | Input    | Debug         |
/// | Config   | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    // Non-copyable, movable.
    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    /// Context fields are appended as key-value pairs to the log message.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GameResult<void> flush();

    /// Get the global GameLogger singleton instance.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gw::foundation

// ---------------------------------------------------------------------------
// Convenience macros (outside the namespace; macros are global)
// ---------------------------------------------------------------------------

/// @name GW_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// GW_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef GW_MIN_LOG_LEVEL
    #define GW_MIN_LOG_LEVEL 0
#endif

#define GW_LOG(level, cat, msg)                                                  \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= GW_MIN_LOG_LEVEL &&                       \
            ::gw::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::gw::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define GW_LOG_DEBUG(cat, msg) \
    GW_LOG(::gw::foundation::LogLevel::Debug, (cat), (msg))

#define GW_LOG_INFO(cat, msg) \
    GW_LOG(::gw::foundation::LogLevel::Info, (cat), (msg))

#define GW_LOG_WARN(cat, msg) \
    GW_LOG(::gw::foundation::LogLevel::Warning, (cat), (msg))

#define GW_LOG_ERROR(cat, msg) \
    GW_LOG(::gw::foundation::LogLevel::Error, (cat), (msg))

/// @}
