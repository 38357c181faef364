#pragma once

/// @file match_runner.hpp
/// @brief Shared utilities for the headless match runner (gw_match).
///
/// Provides:
///   - SignalHandler: SIGINT/SIGTERM handling with an atomic shutdown flag.
///   - parseMatchArgs(): --config / --seed / --max-ticks / --realtime.
///   - loadConfig(): YAML loading with GW_CONFIG_PATH override.
///   - generateMatch(): map generation with reseeding on placement failure.
///   - MatchBot: pseudo-random shooter for every player.
///   - runMatch(): drive a GameSession through a GameLoop to the end.

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>

#include "gw/foundation/config_manager.hpp"
#include "gw/foundation/game_result.hpp"
#include "gw/game/game_config.hpp"
#include "gw/game/game_session.hpp"
#include "gw/game/game_state.hpp"
#include "gw/game/input_event.hpp"
#include "gw/game/random_source.hpp"
#include "gw/service/game_loop.hpp"

namespace gw::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Command-line options of gw_match.
struct MatchOptions {
    std::filesystem::path configPath;
    std::optional<uint64_t> seed;       ///< Random when absent.
    std::optional<uint64_t> maxTicks;   ///< Defaults to ten minutes of game time.
    bool realtime = false;              ///< Pace ticks at the configured rate.
};

/// Parse gw_match arguments.
/// @return The options, or InvalidArgument for an unknown flag or a
///         malformed number.
[[nodiscard]] gw::foundation::GameResult<MatchOptions> parseMatchArgs(int argc, char* argv[]);

/// Load the YAML config at @p path, or at $GW_CONFIG_PATH when set.
/// With neither, @p config is left untouched and the call succeeds.
gw::foundation::GameResult<void> loadConfig(gw::foundation::ConfigManager& config,
                                            const std::filesystem::path& path);

/// A generated map together with the seed that produced it.
struct GeneratedMatch {
    gw::game::GameState state;
    uint64_t seed = 0;
    uint32_t attempts = 0;
};

/// Generate a map, reseeding (seed + 1, seed + 2, ...) after each
/// PlacementFailed up to @p maxAttempts generations.
///
/// @return The last error once all attempts failed, or any
///         non-placement error immediately.
[[nodiscard]] gw::foundation::GameResult<GeneratedMatch> generateMatch(
    const gw::game::SimulationConfig& config, uint64_t seed, uint32_t maxAttempts);

/// Picks a shot for whoever is aiming.
///
/// Angle and speed are drawn uniformly from [0, 2*pi) and [0, maxSpeed];
/// the map is never inspected.
class MatchBot {
public:
    MatchBot(uint64_t seed, float maxSpeed);

    /// Shot for the current player, or std::nullopt when nobody is aiming.
    [[nodiscard]] std::optional<gw::game::FireMissile> chooseShot(const gw::game::GameState& state);

private:
    gw::game::SeededRandomSource random_;
    float maxSpeed_;
};

/// Final outcome of a match.
struct MatchOutcome {
    std::optional<gw::game::PlayerId> winner;
    bool finished = false; ///< GameOver reached (winner or draw).
    uint64_t ticks = 0;
    uint32_t shotsFired = 0;
    uint32_t rejectedShots = 0;
};

/// Run @p session to GameOver, @p maxTicks, or a shutdown signal.
///
/// The session must already be started.  Ticks run on the calling thread,
/// paced by @p loop's tick period when @p pacing is Realtime.
MatchOutcome runMatch(gw::game::GameSession& session, GameLoop& loop, MatchBot& bot,
                      uint64_t maxTicks, Pacing pacing,
                      const SignalHandler* signals = nullptr);

} // namespace gw::service
