#pragma once

/// @file common_adapter.hpp
/// @brief Aggregate header for the engine foundation layer.
///
/// Provides error codes, Result aliases, configuration management and
/// the category logger built on kcenon common_system.

#include "gw/foundation/config_manager.hpp"
#include "gw/foundation/error_code.hpp"
#include "gw/foundation/game_error.hpp"
#include "gw/foundation/game_logger.hpp"
#include "gw/foundation/game_result.hpp"
