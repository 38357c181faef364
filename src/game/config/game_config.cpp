/// @file game_config.cpp
/// @brief YAML overlay and validation for SimulationConfig.

#include "gw/game/game_config.hpp"

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

#include "gw/foundation/game_logger.hpp"

namespace gw::game {

using gw::foundation::ConfigManager;
using gw::foundation::ErrorCode;
using gw::foundation::GameError;
using gw::foundation::GameResult;
using gw::foundation::LogCategory;

namespace {

GameResult<void> invalid(std::string_view key, std::string_view reason) {
    return GameResult<void>::err(GameError(
        ErrorCode::ConfigValueInvalid,
        std::string(key) + ": " + std::string(reason)));
}

/// Overwrite @p target with the value at @p key, if present.
GameResult<void> overlay(const ConfigManager& config, std::string_view key, float& target) {
    if (!config.hasKey(key)) {
        return GameResult<void>::ok();
    }
    auto value = config.get<double>(key);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    target = static_cast<float>(value.value());
    return GameResult<void>::ok();
}

/// Counts are read signed so that negative input reports as out of range
/// rather than as a type mismatch.
GameResult<void> overlay(const ConfigManager& config, std::string_view key, uint32_t& target) {
    if (!config.hasKey(key)) {
        return GameResult<void>::ok();
    }
    auto value = config.get<int64_t>(key);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    if (value.value() < 0 || value.value() > std::numeric_limits<uint32_t>::max()) {
        return invalid(key, "out of range");
    }
    target = static_cast<uint32_t>(value.value());
    return GameResult<void>::ok();
}

const std::initializer_list<std::string_view> kKnownKeys = {
    "simulation.ticks_per_second",
    "simulation.gravitational_constant",
    "missile.time_to_live",
    "missile.max_velocity",
    "missile.velocity_scale",
    "missile.spawn_step_fraction",
    "mapgen.width",
    "mapgen.height",
    "mapgen.player_count",
    "mapgen.planet_count_density_mean",
    "mapgen.planet_count_density_stddev",
    "mapgen.planet_radius_mean",
    "mapgen.planet_radius_stddev",
    "mapgen.planet_radius_min",
    "mapgen.planet_density_mean",
    "mapgen.planet_density_stddev",
    "mapgen.ship_radius",
    "mapgen.max_placement_attempts",
    "mapgen.placement_margin",
};

bool positive(float v) { return std::isfinite(v) && v > 0.0f; }
bool nonNegative(float v) { return std::isfinite(v) && v >= 0.0f; }

} // namespace

GameResult<void> ValidateSimulationConfig(const SimulationConfig& c) {
    if (c.ticksPerSecond == 0) {
        return invalid("simulation.ticks_per_second", "must be positive");
    }
    if (!nonNegative(c.gravitationalConstant)) {
        return invalid("simulation.gravitational_constant", "must be finite and non-negative");
    }
    if (!positive(c.missileTimeToLive)) {
        return invalid("missile.time_to_live", "must be positive");
    }
    if (!positive(c.missileMaxVelocity)) {
        return invalid("missile.max_velocity", "must be positive");
    }
    if (!positive(c.missileVelocityScale)) {
        return invalid("missile.velocity_scale", "must be positive");
    }
    if (!positive(c.spawnStepFraction) || c.spawnStepFraction > 1.0f) {
        return invalid("missile.spawn_step_fraction", "must be in (0, 1]");
    }

    const MapGenConfig& m = c.mapgen;
    if (!positive(m.width) || !positive(m.height)) {
        return invalid("mapgen.width/height", "must be positive");
    }
    if (m.playerCount < 2) {
        return invalid("mapgen.player_count", "at least two players are required");
    }
    if (!nonNegative(m.planetCountDensityMean) || !nonNegative(m.planetCountDensityStdDev)) {
        return invalid("mapgen.planet_count_density", "must be finite and non-negative");
    }
    if (!positive(m.planetRadiusMean) || !nonNegative(m.planetRadiusStdDev) ||
        !positive(m.planetRadiusMin)) {
        return invalid("mapgen.planet_radius", "radii must be positive");
    }
    if (!std::isfinite(m.planetDensityMean) || !nonNegative(m.planetDensityStdDev)) {
        return invalid("mapgen.planet_density", "must be finite");
    }
    if (!positive(m.shipRadius)) {
        return invalid("mapgen.ship_radius", "must be positive");
    }
    if (m.maxPlacementAttempts == 0) {
        return invalid("mapgen.max_placement_attempts", "must be positive");
    }
    if (!nonNegative(m.placementMargin)) {
        return invalid("mapgen.placement_margin", "must be finite and non-negative");
    }
    return GameResult<void>::ok();
}

GameResult<SimulationConfig> LoadSimulationConfig(const ConfigManager& config) {
    SimulationConfig out;
    MapGenConfig& m = out.mapgen;

    GameResult<void> status = GameResult<void>::ok();
    auto apply = [&status](GameResult<void> result) {
        if (status && !result) {
            status = std::move(result);
        }
    };

    apply(overlay(config, "simulation.ticks_per_second", out.ticksPerSecond));
    apply(overlay(config, "simulation.gravitational_constant", out.gravitationalConstant));
    apply(overlay(config, "missile.time_to_live", out.missileTimeToLive));
    apply(overlay(config, "missile.max_velocity", out.missileMaxVelocity));
    apply(overlay(config, "missile.velocity_scale", out.missileVelocityScale));
    apply(overlay(config, "missile.spawn_step_fraction", out.spawnStepFraction));

    apply(overlay(config, "mapgen.width", m.width));
    apply(overlay(config, "mapgen.height", m.height));
    apply(overlay(config, "mapgen.player_count", m.playerCount));
    apply(overlay(config, "mapgen.planet_count_density_mean", m.planetCountDensityMean));
    apply(overlay(config, "mapgen.planet_count_density_stddev", m.planetCountDensityStdDev));
    apply(overlay(config, "mapgen.planet_radius_mean", m.planetRadiusMean));
    apply(overlay(config, "mapgen.planet_radius_stddev", m.planetRadiusStdDev));
    apply(overlay(config, "mapgen.planet_radius_min", m.planetRadiusMin));
    apply(overlay(config, "mapgen.planet_density_mean", m.planetDensityMean));
    apply(overlay(config, "mapgen.planet_density_stddev", m.planetDensityStdDev));
    apply(overlay(config, "mapgen.ship_radius", m.shipRadius));
    apply(overlay(config, "mapgen.max_placement_attempts", m.maxPlacementAttempts));
    apply(overlay(config, "mapgen.placement_margin", m.placementMargin));

    for (const auto& key : config.unrecognizedKeys(kKnownKeys)) {
        GW_LOG_WARN(LogCategory::Config, "Ignoring unknown config key " + key);
    }

    if (status) {
        apply(ValidateSimulationConfig(out));
    }
    if (!status) {
        GW_LOG_WARN(LogCategory::Config,
                    "Rejected simulation config: " + status.error().describe());
        return GameResult<SimulationConfig>::err(status.error());
    }

    GW_LOG_INFO(LogCategory::Config,
                "Simulation config from " +
                    (config.source().empty() ? std::string("defaults") : config.source()) +
                    ": " + std::to_string(out.ticksPerSecond) +
                    " ticks/s, " + std::to_string(m.playerCount) + " players");
    return GameResult<SimulationConfig>::ok(out);
}

} // namespace gw::game
