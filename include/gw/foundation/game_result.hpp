#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for engine error handling.

#include "gw/core/result.hpp"
#include "gw/foundation/game_error.hpp"

namespace gw::foundation {

/// Result type specialized with GameError for engine operations.
///
/// Every command handler, generator and config loader that can fail
/// returns GameResult<T> instead of throwing exceptions.
///
/// Example:
/// @code
///   GameResult<float> checkSpeed(float speed, float maxSpeed) {
///       if (!(speed >= 0.0f && speed <= maxSpeed)) {
///           return GameResult<float>::err(
///               GameError(ErrorCode::InvalidSpeed, "speed out of range"));
///       }
///       return GameResult<float>::ok(speed);
///   }
/// @endcode
template <typename T>
using GameResult = gw::Result<T, GameError>;

}  // namespace gw::foundation
