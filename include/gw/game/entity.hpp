#pragma once

/// @file entity.hpp
/// @brief Entity: one world object with optional ship / missile roles.
///
/// Entities live in an insertion-ordered vector owned by GameState and are
/// addressed by index.  They are never removed, so an index stays valid
/// for the whole game.

#include <cstddef>
#include <memory>
#include <optional>

#include "gw/game/components.hpp"
#include "gw/game/math_types.hpp"
#include "gw/game/shape.hpp"

namespace gw::game {

/// Position of an entity in GameState::entities.
using EntityIndex = std::size_t;

struct Entity;

/// Opaque drawing handle attached to an entity.
///
/// The simulation stores and copies the handle but never calls it; the
/// host's renderer walks the entity list and invokes Render itself.
class IEntityRenderer {
public:
    virtual ~IEntityRenderer() = default;

    virtual void Render(const Entity& entity) = 0;
};

/// Any world object: planet, ship or missile.
///
/// Gameplay never sets both `ship` and `missileTrail`; use the Make*
/// helpers to build entities with a consistent role combination.
struct Entity {
    EntityTransform transform;
    float mass = 0.0f;
    std::optional<Shape> collisionShape;
    std::shared_ptr<IEntityRenderer> renderer;
    std::optional<MissileTrail> missileTrail;
    std::optional<Ship> ship;

    /// Massive, immobile disc.
    static Entity MakePlanet(const Vector3& position, float radius, float mass);

    /// Massless craft owned by @p playerId, starting Active.
    static Entity MakeShip(const Vector3& position, PlayerId playerId, Shape shape);

    /// Massless, shapeless projectile.  @p position is normally the
    /// trail's spawn point.
    static Entity MakeMissile(const Vector3& position, MissileTrail trail);

    /// Gravitational acceleration this entity imparts at @p point.
    ///
    /// `normalize(position - point) * (|position - point|^2 * mass * G)`.
    /// The magnitude grows with the square of the distance.  Coincident
    /// points yield the zero vector.
    [[nodiscard]] Vector3 GravitationalAccelerationAt(const Vector3& point,
                                                      float gravitationalConstant) const noexcept;

    /// Projection of the 3D transform onto the collision plane.
    ///
    /// Translation is position.xy; rotation is the heading of the rotated
    /// local +X axis in the XY plane.
    [[nodiscard]] ShapeTransform CollisionTransform() const noexcept;

    /// Field-wise; renderers compare by handle identity.
    bool operator==(const Entity&) const = default;
};

} // namespace gw::game
