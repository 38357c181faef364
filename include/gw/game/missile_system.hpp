#pragma once

/// @file missile_system.hpp
/// @brief MissileSystem: gravity integrator and missile lifecycle.
///
/// Advances every live missile by one fixed timestep, casting its motion
/// against every other entity's collision shape and accumulating the
/// gravity of every other entity.  Fire commands are validated here and
/// turned into new missile entities.

#include <cstdint>
#include <optional>
#include <vector>

#include "gw/foundation/game_result.hpp"
#include "gw/game/entity.hpp"
#include "gw/game/game_config.hpp"
#include "gw/game/game_state.hpp"
#include "gw/game/missile_types.hpp"

namespace gw::game {

/// System that integrates missile flight each tick.
///
/// Per tick, for each live missile in collection order:
///   1. Decrease time to live by the tick interval.
///   2. For each other entity: ray-cast the current segment against its
///      shape (solid); on a hit, stop at the impact point and emit
///      HitEntity.  Otherwise add its gravity to the velocity.
///   3. Without a hit, append the next position and emit Expired if the
///      time to live has run out.
class MissileSystem {
public:
    explicit MissileSystem(const SimulationConfig& config);

    /// Advance every live missile by one tick.
    ///
    /// @return Events for the missiles that hit or expired during this
    ///         tick, in collection order.
    std::vector<MissileEvent> Update(GameState& state);

    /// Validate a fire command and spawn the missile.
    ///
    /// Validation happens before any mutation; on error @p state is
    /// untouched.  On success a missile entity is appended and the turn
    /// moves to Firing.
    ///
    /// @return The new missile's index, or one of InvalidAngle,
    ///         InvalidSpeed, NoTurnInProgress, NotAiming, NoShipForPlayer.
    gw::foundation::GameResult<EntityIndex> FireMissile(GameState& state,
                                                        const FireParams& params);

    /// Gravitational acceleration of @p source at @p point.
    ///
    /// This is a pure function exposed for testability.
    [[nodiscard]] static Vector3 GravityAcceleration(const Entity& source,
                                                     const Vector3& point,
                                                     float gravitationalConstant) noexcept;

    /// Initial missile velocity: `(cos a, sin a, 0) * speed * velocityScale`.
    [[nodiscard]] static Vector3 LaunchVelocity(float angle, float speed,
                                                float velocityScale) noexcept;

    /// Walk from @p ship's centre along @p angle until clear of its hull.
    ///
    /// Steps of `boundingRadius * stepFraction`; stops at the first step
    /// that is outside the shape and farther than the bounding radius from
    /// the centre, however small the fraction.  A shapeless ship, or a
    /// non-positive fraction, spawns at the centre.
    [[nodiscard]] static Vector3 FindSpawnPoint(const Entity& ship, float angle,
                                                float stepFraction);

    /// Steps tried past the last one inside the bounding radius.
    static constexpr uint32_t kMaxSettleSteps = 32;

    [[nodiscard]] const SimulationConfig& Config() const noexcept { return config_; }

private:
    /// Advance one missile; returns its event when it hit or expired.
    std::optional<MissileEvent> advanceMissile(GameState& state, EntityIndex missile);

    SimulationConfig config_;
};

} // namespace gw::game
