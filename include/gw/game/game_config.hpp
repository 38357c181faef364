#pragma once

/// @file game_config.hpp
/// @brief Simulation constants threaded through the integrator, the
///        session and the map generator.
///
/// Defaults reproduce the classic tuning (30 Hz ticks, 30 s missile
/// lifetime, G = 5e-10).  Any subset can be overridden from YAML via
/// LoadSimulationConfig().

#include <chrono>
#include <cstdint>

#include "gw/foundation/config_manager.hpp"
#include "gw/foundation/game_result.hpp"

namespace gw::game {

/// Map generation parameters.
struct MapGenConfig {
    float width = 150.0f;
    float height = 100.0f;
    uint32_t playerCount = 2;

    /// Planets per unit area (normal distribution).
    float planetCountDensityMean = 4e-4f;
    float planetCountDensityStdDev = 1e-4f;

    float planetRadiusMean = 8.0f;
    float planetRadiusStdDev = 3.0f;
    float planetRadiusMin = 2.0f;

    /// Mass per unit volume (normal distribution, clamped at 0).
    float planetDensityMean = 20.0f;
    float planetDensityStdDev = 6.0f;

    /// Disc radius for ships without a supplied hull contour.
    float shipRadius = 1.5f;

    uint32_t maxPlacementAttempts = 100;

    /// Minimum clearance between any two placed shapes.
    float placementMargin = 1.0f;
};

/// Top-level simulation constants.
struct SimulationConfig {
    uint32_t ticksPerSecond = 30;
    float gravitationalConstant = 5e-10f;

    float missileTimeToLive = 30.0f;    ///< Seconds.
    float missileMaxVelocity = 10.0f;   ///< Upper bound on fire speed.
    float missileVelocityScale = 10.0f; ///< Speed units to world units per second.

    /// Spawn walk step, as a fraction of the firing ship's bounding radius.
    float spawnStepFraction = 0.1f;

    MapGenConfig mapgen;

    /// Fixed integration timestep in seconds.
    [[nodiscard]] float TickInterval() const noexcept {
        return 1.0f / static_cast<float>(ticksPerSecond);
    }

    /// Fixed timestep as a duration, for the host loop.
    [[nodiscard]] std::chrono::microseconds TickPeriod() const noexcept {
        return std::chrono::microseconds(1'000'000 / ticksPerSecond);
    }
};

/// Build a SimulationConfig from the keys present in @p config.
///
/// Absent keys keep their defaults.  Recognised keys:
/// `simulation.ticks_per_second`, `simulation.gravitational_constant`,
/// `missile.time_to_live`, `missile.max_velocity`,
/// `missile.velocity_scale`, `missile.spawn_step_fraction` and the
/// `mapgen.*` family (see MapGenConfig).
///
/// @return The config, ConfigTypeMismatch for a value of the wrong type,
///         or ConfigValueInvalid for an out-of-range value.
[[nodiscard]] gw::foundation::GameResult<SimulationConfig> LoadSimulationConfig(
    const gw::foundation::ConfigManager& config);

/// Check the invariants LoadSimulationConfig() enforces.
[[nodiscard]] gw::foundation::GameResult<void> ValidateSimulationConfig(
    const SimulationConfig& config);

} // namespace gw::game
