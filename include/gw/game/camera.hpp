#pragma once

/// @file camera.hpp
/// @brief View and lighting state carried for the renderer.
///
/// Neither type influences the simulation; input events update the camera
/// and the host reads both when drawing.

#include <cmath>

#include "gw/game/components.hpp"
#include "gw/game/math_types.hpp"

namespace gw::game {

/// 2D view over the arena.
///
/// Zoom is stored logarithmically so that repeated zoom steps compose
/// additively and the scale can never reach zero.
struct Camera {
    Vector2 position;
    float logScale = 0.0f;

    /// Linear scale factor, `10^logScale`.
    [[nodiscard]] float Scale() const noexcept { return std::pow(10.0f, logScale); }

    /// Move the view centre by (dx, dy).
    void Pan(float dx, float dy) noexcept { position += Vector2{dx, dy}; }

    /// Multiply the scale by @p factor.
    /// @return false (no change) for non-positive or non-finite factors.
    bool Zoom(float factor) noexcept {
        if (!std::isfinite(factor) || factor <= 0.0f) {
            return false;
        }
        logScale += std::log10(factor);
        return true;
    }
};

/// Directional sun plus ambient term.
struct Lighting {
    Vector3 sunDirection{-1.0f, -1.0f, -1.0f};
    Color sunColor{1.0f, 1.0f, 1.0f};
    Color ambientColor{0.1f, 0.1f, 0.1f};
};

} // namespace gw::game
