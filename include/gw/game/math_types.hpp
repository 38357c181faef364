#pragma once

/// @file math_types.hpp
/// @brief Lightweight math types for the simulation layer.
///
/// Provides Vector2, Vector3 and Quaternion value types with the small
/// set of operations the integrator, the collision shapes and the map
/// generator need.  All arithmetic is single precision so that replays
/// on the same platform reproduce trajectories bit for bit.

#include <cmath>
#include <cstdint>

namespace gw::game {

/// Two-component floating-point vector on the collision plane.
struct Vector2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vector2() = default;
    constexpr Vector2(float x, float y) : x(x), y(y) {}

    constexpr Vector2 operator+(const Vector2& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y};
    }
    constexpr Vector2 operator-(const Vector2& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y};
    }
    constexpr Vector2 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar};
    }

    constexpr Vector2& operator+=(const Vector2& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    [[nodiscard]] constexpr float Dot(const Vector2& rhs) const noexcept {
        return x * rhs.x + y * rhs.y;
    }

    /// Z component of the 3D cross product (signed parallelogram area).
    [[nodiscard]] constexpr float Cross(const Vector2& rhs) const noexcept {
        return x * rhs.y - y * rhs.x;
    }

    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// Rotate counter-clockwise by @p angle radians.
    [[nodiscard]] Vector2 Rotated(float angle) const noexcept {
        const float c = std::cos(angle);
        const float s = std::sin(angle);
        return {x * c - y * s, x * s + y * c};
    }

    constexpr auto operator<=>(const Vector2&) const = default;
};

/// Three-component floating-point vector.
///
/// Used for positions and velocities.  The simulation plane is z = 0.
struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float x, float y, float z) : x(x), y(y), z(z) {}

    // Arithmetic operators.
    constexpr Vector3 operator+(const Vector3& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }
    constexpr Vector3 operator-(const Vector3& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y, z - rhs.z};
    }
    constexpr Vector3 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vector3& operator+=(const Vector3& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    constexpr Vector3& operator-=(const Vector3& rhs) noexcept {
        x -= rhs.x;
        y -= rhs.y;
        z -= rhs.z;
        return *this;
    }

    /// Dot product.
    [[nodiscard]] constexpr float Dot(const Vector3& rhs) const noexcept {
        return x * rhs.x + y * rhs.y + z * rhs.z;
    }

    /// Cross product.
    [[nodiscard]] constexpr Vector3 Cross(const Vector3& rhs) const noexcept {
        return {y * rhs.z - z * rhs.y, z * rhs.x - x * rhs.z, x * rhs.y - y * rhs.x};
    }

    /// Squared magnitude (avoids sqrt).
    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    /// Magnitude.
    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// Return a normalized copy, or zero vector if length is near zero.
    [[nodiscard]] Vector3 Normalized() const noexcept {
        const float len = Length();
        if (len < 1e-6f) {
            return {};
        }
        return {x / len, y / len, z / len};
    }

    /// Projection onto the collision plane.
    [[nodiscard]] constexpr Vector2 XY() const noexcept { return {x, y}; }

    /// The zero vector.
    [[nodiscard]] static constexpr Vector3 Zero() noexcept { return {}; }

    constexpr auto operator<=>(const Vector3&) const = default;
};

/// Scalar * Vector3.
constexpr Vector3 operator*(float scalar, const Vector3& v) noexcept {
    return v * scalar;
}

/// Quaternion for rotation representation.
///
/// Stored as (w, x, y, z) where w is the scalar part.
/// Defaults to the identity rotation (1, 0, 0, 0).
struct Quaternion {
    float w = 1.0f;
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Quaternion() = default;
    constexpr Quaternion(float w, float x, float y, float z) : w(w), x(x), y(y), z(z) {}

    /// The identity rotation.
    [[nodiscard]] static constexpr Quaternion Identity() noexcept { return {}; }

    /// Rotation of @p angle radians about the (unit) @p axis.
    [[nodiscard]] static Quaternion FromAxisAngle(const Vector3& axis, float angle) noexcept {
        const float half = angle * 0.5f;
        const float s = std::sin(half);
        return {std::cos(half), axis.x * s, axis.y * s, axis.z * s};
    }

    /// Rotate a vector: v' = q v q*.
    [[nodiscard]] Vector3 Rotate(const Vector3& v) const noexcept {
        const Vector3 u{x, y, z};
        const Vector3 t = u.Cross(v) * 2.0f;
        return v + t * w + u.Cross(t);
    }

    constexpr auto operator<=>(const Quaternion&) const = default;
};

}  // namespace gw::game
