/// @file entity.cpp
/// @brief Entity construction helpers and derived queries.

#include "gw/game/entity.hpp"

#include <cmath>
#include <utility>

namespace gw::game {

Entity Entity::MakePlanet(const Vector3& position, float radius, float mass) {
    Entity e;
    e.transform.position = position;
    e.mass = mass;
    e.collisionShape = Disc{radius};
    return e;
}

Entity Entity::MakeShip(const Vector3& position, PlayerId playerId, Shape shape) {
    Entity e;
    e.transform.position = position;
    e.collisionShape = std::move(shape);
    e.ship = Ship{playerId, ShipState::Active};
    return e;
}

Entity Entity::MakeMissile(const Vector3& position, MissileTrail trail) {
    Entity e;
    e.transform.position = position;
    e.missileTrail = std::move(trail);
    return e;
}

Vector3 Entity::GravitationalAccelerationAt(const Vector3& point,
                                            float gravitationalConstant) const noexcept {
    const Vector3 offset = transform.position - point;
    return offset.Normalized() * (offset.LengthSquared() * mass * gravitationalConstant);
}

ShapeTransform Entity::CollisionTransform() const noexcept {
    const Vector3 heading = transform.rotation.Rotate(Vector3{1.0f, 0.0f, 0.0f});
    float angle = 0.0f;
    if (heading.x != 0.0f || heading.y != 0.0f) {
        angle = std::atan2(heading.y, heading.x);
    }
    return ShapeTransform{transform.position.XY(), angle};
}

} // namespace gw::game
