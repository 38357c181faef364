#pragma once

/// @file turn_system.hpp
/// @brief TurnSystem: match phase transitions and elimination.
///
/// Phase flow:
/// @code
///   NotStarted --StartGame--> Playing(p, Aiming)
///   Playing(p, Aiming) --fire--> Playing(p, Firing)
///   Playing(p, Firing) --AdvanceAfterResolution--> Playing(q, Aiming) | GameOver
/// @endcode
///
/// Elimination is never stored: a player is active while they own an
/// Active ship.

#include <cstddef>
#include <optional>
#include <vector>

#include "gw/foundation/game_result.hpp"
#include "gw/game/game_state.hpp"
#include "gw/game/missile_types.hpp"

namespace gw::game {

class TurnSystem {
public:
    /// Begin the match with the lowest-indexed active player.
    ///
    /// Goes straight to GameOver when nobody has an active ship.
    /// @return GameAlreadyStarted (state untouched) outside NotStarted.
    static gw::foundation::GameResult<void> StartGame(GameState& state);

    /// Apply the finished turn's missile events and pick the next turn.
    ///
    /// HitEntity on a ship disables it; Expired changes nothing.  With
    /// fewer than two active players left the phase becomes GameOver,
    /// otherwise the next active player after the current one starts
    /// Aiming.
    ///
    /// @return NoTurnInProgress outside Playing, NotFiring while the turn
    ///         is still Aiming; the state is untouched in both cases.
    static gw::foundation::GameResult<void> AdvanceAfterResolution(
        GameState& state, const std::vector<MissileEvent>& events);

    /// Sorted, distinct ids of players owning at least one Active ship.
    [[nodiscard]] static std::vector<PlayerId> ActivePlayers(const GameState& state);

    /// The sole surviving player once the game is over.
    ///
    /// std::nullopt while the game is running, or for a draw.
    [[nodiscard]] static std::optional<PlayerId> Winner(const GameState& state);

    /// First player strictly after @p current, wrapping at
    /// @p playerCount, that appears in @p activePlayers.
    ///
    /// Returns @p current itself only when it is the sole active player,
    /// and std::nullopt when @p activePlayers holds no valid id.
    /// This is a pure function exposed for testability.
    [[nodiscard]] static std::optional<PlayerId> NextPlayer(
        PlayerId current, std::size_t playerCount,
        const std::vector<PlayerId>& activePlayers);
};

} // namespace gw::game
