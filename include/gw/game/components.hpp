#pragma once

/// @file components.hpp
/// @brief Entity role records: Transform, Ship, MissileTrail, Player.
///
/// Each struct is plain data attached to an Entity as an optional role.
/// Mutation helpers enforce the one-way transitions (a disabled ship
/// stays disabled, an expired trail stops growing).

#include <cstddef>
#include <cstdint>
#include <vector>

#include "gw/game/math_types.hpp"

namespace gw::game {

/// Index of a player in the roster.
using PlayerId = std::size_t;

// ── Transform ───────────────────────────────────────────────────────────

/// Spatial transform: position, rotation, and uniform scale in world space.
struct EntityTransform {
    Vector3 position;
    Quaternion rotation;
    float scale = 1.0f;

    bool operator==(const EntityTransform&) const = default;
};

// ── Ship ────────────────────────────────────────────────────────────────

/// Ship lifecycle.  Disabled is terminal.
enum class ShipState : uint8_t {
    Active,
    Disabled
};

/// Player-controlled craft.
struct Ship {
    PlayerId playerId = 0;
    ShipState state = ShipState::Active;

    [[nodiscard]] bool IsActive() const noexcept { return state == ShipState::Active; }

    /// Disable the ship.  Idempotent; there is no way back to Active.
    void Disable() noexcept { state = ShipState::Disabled; }

    bool operator==(const Ship&) const = default;
};

// ── MissileTrail ────────────────────────────────────────────────────────

/// Flight record of a projectile.
///
/// `positions` is append-only and never empty once created; the first
/// element is the spawn point.  `dataVersion` counts appends so renderers
/// can detect stale vertex buffers cheaply.
struct MissileTrail {
    PlayerId playerId = 0;
    float timeToLive = 0.0f;  ///< Seconds remaining; <= 0 means expired.
    Vector3 velocity;
    std::vector<Vector3> positions;
    uint64_t dataVersion = 0;

    /// Start a trail at @p spawn.
    static MissileTrail Start(PlayerId owner, const Vector3& spawn,
                              const Vector3& velocity, float timeToLive) {
        MissileTrail trail;
        trail.playerId = owner;
        trail.timeToLive = timeToLive;
        trail.velocity = velocity;
        trail.AddPosition(spawn);
        return trail;
    }

    [[nodiscard]] bool IsLive() const noexcept { return timeToLive > 0.0f; }

    /// Most recent position (the spawn point for a fresh trail).
    [[nodiscard]] const Vector3& LastPosition() const { return positions.back(); }

    void AddPosition(const Vector3& position) {
        positions.push_back(position);
        ++dataVersion;
    }

    bool operator==(const MissileTrail&) const = default;
};

// ── Player ──────────────────────────────────────────────────────────────

/// Linear RGB color, each channel in [0, 1].
struct Color {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;

    constexpr bool operator==(const Color&) const = default;
};

/// Per-game roster entry.  Immutable once the roster is built.
struct Player {
    Color color;

    bool operator==(const Player&) const = default;
};

} // namespace gw::game
