#pragma once

/// @file missile_types.hpp
/// @brief Fire command parameters and missile lifecycle events.

#include <variant>

#include "gw/game/entity.hpp"

namespace gw::game {

/// Player-issued fire command.
struct FireParams {
    float angle = 0.0f; ///< Radians, counter-clockwise from +X.
    float speed = 0.0f; ///< In [0, SimulationConfig::missileMaxVelocity].
};

/// The missile ran out of time to live without hitting anything.
struct Expired {
    constexpr bool operator==(const Expired&) const = default;
};

/// The missile struck another entity.
struct HitEntity {
    EntityIndex target = 0;

    constexpr bool operator==(const HitEntity&) const = default;
};

/// Outcome kind of a missile's flight.
using MissileEventKind = std::variant<Expired, HitEntity>;

/// Terminal event for one missile.  Each missile emits at most one.
struct MissileEvent {
    EntityIndex missile = 0;
    MissileEventKind kind;

    bool operator==(const MissileEvent&) const = default;
};

} // namespace gw::game
