#pragma once

/// @file turn.hpp
/// @brief Turn and GamePhase: the closed set of match phases.

#include <cstdint>
#include <string_view>
#include <variant>

#include "gw/game/components.hpp"

namespace gw::game {

/// Progress within a single player's turn.
enum class TurnState : uint8_t {
    Aiming, ///< Waiting for the current player's fire command.
    Firing  ///< The turn's missile is in flight.
};

/// The player whose turn it is and how far the turn has progressed.
struct Turn {
    PlayerId currentPlayer = 0;
    TurnState state = TurnState::Aiming;

    constexpr bool operator==(const Turn&) const = default;
};

// ── GamePhase ───────────────────────────────────────────────────────────

/// Map generated, no turn taken yet.
struct NotStarted {
    constexpr bool operator==(const NotStarted&) const = default;
};

/// A turn is in progress.
struct Playing {
    Turn turn;

    constexpr bool operator==(const Playing&) const = default;
};

/// Terminal phase.  The winner, if any, is derived from ship states.
struct GameOver {
    constexpr bool operator==(const GameOver&) const = default;
};

/// Exactly one phase is current at any time.
using GamePhase = std::variant<NotStarted, Playing, GameOver>;

/// Human-readable phase name for logs.
constexpr std::string_view phaseName(const GamePhase& phase) {
    switch (phase.index()) {
        case 0: return "NotStarted";
        case 1: return "Playing";
        case 2: return "GameOver";
        default: return "Unknown";
    }
}

} // namespace gw::game
