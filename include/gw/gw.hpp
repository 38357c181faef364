#pragma once

/// @file gw.hpp
/// @brief Umbrella header for the gravity wars engine.

#include "gw/version.hpp"

#include "gw/foundation/common_adapter.hpp"

#include "gw/game/camera.hpp"
#include "gw/game/components.hpp"
#include "gw/game/entity.hpp"
#include "gw/game/game_config.hpp"
#include "gw/game/game_session.hpp"
#include "gw/game/game_state.hpp"
#include "gw/game/input_event.hpp"
#include "gw/game/map_generator.hpp"
#include "gw/game/math_types.hpp"
#include "gw/game/missile_system.hpp"
#include "gw/game/missile_types.hpp"
#include "gw/game/random_source.hpp"
#include "gw/game/shape.hpp"
#include "gw/game/turn.hpp"
#include "gw/game/turn_system.hpp"
