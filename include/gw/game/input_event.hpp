#pragma once

/// @file input_event.hpp
/// @brief Player input consumed by GameSession.

#include <variant>

namespace gw::game {

/// Move the camera by (dx, dy) world units.
struct PanCamera {
    float dx = 0.0f;
    float dy = 0.0f;
};

/// Multiply the camera scale by @p factor (must be positive).
struct ZoomCamera {
    float factor = 1.0f;
};

/// Fire the current player's missile.
struct FireMissile {
    float angle = 0.0f;
    float speed = 0.0f;
};

/// Closed set of input events.
using InputEvent = std::variant<PanCamera, ZoomCamera, FireMissile>;

} // namespace gw::game
