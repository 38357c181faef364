#pragma once

/// @file shape.hpp
/// @brief Collision shapes on the simulation plane and their geometric
///        queries.
///
/// The closed set of shapes is {Disc, Polyline}, held in a std::variant.
/// Every query dispatches on the variant, so adding a shape means adding
/// one overload per query rather than a class hierarchy.
///
/// All queries work in world space: the shape is described in local
/// coordinates and placed with a ShapeTransform (translation + rotation).

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "gw/game/math_types.hpp"

namespace gw::game {

/// Filled circle centred on the local origin.
struct Disc {
    float radius = 0.0f;

    bool operator==(const Disc&) const = default;
};

/// Closed contour in local coordinates.
///
/// The last point connects back to the first; the enclosed area (even-odd
/// rule) counts as the shape's interior for solid ray casts and proximity.
/// Ship hulls imported from mesh data are supplied in this form.
struct Polyline {
    std::vector<Vector2> points;

    bool operator==(const Polyline&) const = default;
};

/// A collision shape: one of the closed set of variants.
using Shape = std::variant<Disc, Polyline>;

/// Placement of a shape on the collision plane.
struct ShapeTransform {
    Vector2 translation;
    float rotation = 0.0f;  ///< Counter-clockwise, radians.

    /// Map a local point to world space.
    [[nodiscard]] Vector2 Apply(const Vector2& local) const noexcept {
        return local.Rotated(rotation) + translation;
    }
};

/// Qualitative result of a proximity test.
enum class Proximity : uint8_t {
    Disjoint,      ///< Farther apart than the margin.
    WithinMargin,  ///< Not touching, but closer than the margin.
    Intersecting   ///< Overlapping or touching.
};

/// Radius of the smallest origin-centred circle containing the shape.
///
/// Rotation does not change it, so only the shape is needed.
[[nodiscard]] float BoundingRadius(const Shape& shape);

/// Earliest time of impact of a ray against a placed shape.
///
/// The ray is `origin + t * direction`; @p direction is not normalised,
/// so `t` is measured in the ray's own units (seconds, when the direction
/// is a velocity).
///
/// @param solid  When true, an origin inside the shape hits at t = 0.
///               When false, the ray only hits the boundary.
/// @return The smallest t in [0, maxTime] at which the ray meets the
///         shape, or std::nullopt.  A zero direction never hits unless
///         @p solid and the origin is inside.
[[nodiscard]] std::optional<float> TimeOfImpact(const Shape& shape,
                                                const ShapeTransform& transform,
                                                const Vector2& origin,
                                                const Vector2& direction,
                                                float maxTime,
                                                bool solid);

/// Whether a world point lies inside (or on) a placed shape.
[[nodiscard]] bool ContainsPoint(const Shape& shape,
                                 const ShapeTransform& transform,
                                 const Vector2& point);

/// Classify how close two placed shapes are.
///
/// @param margin  Distance below which disjoint shapes report
///                WithinMargin.  Must be non-negative.
[[nodiscard]] Proximity TestProximity(const Shape& a, const ShapeTransform& ta,
                                      const Shape& b, const ShapeTransform& tb,
                                      float margin);

}  // namespace gw::game
