/// @file turn_system.cpp
/// @brief TurnSystem implementation.

#include "gw/game/turn_system.hpp"

#include <algorithm>
#include <string>

#include "gw/foundation/game_logger.hpp"

namespace gw::game {

using gw::foundation::ErrorCode;
using gw::foundation::GameError;
using gw::foundation::GameResult;
using gw::foundation::LogCategory;

namespace {

std::size_t rosterSize(const GameState& state, const std::vector<PlayerId>& active) {
    std::size_t count = state.players.size();
    if (!active.empty()) {
        count = std::max(count, active.back() + 1);
    }
    return count;
}

void logTurn(const Turn& turn) {
    GW_LOG_INFO(LogCategory::Turn,
                "Turn passes to player " + std::to_string(turn.currentPlayer));
}

} // namespace

GameResult<void> TurnSystem::StartGame(GameState& state) {
    if (!std::holds_alternative<NotStarted>(state.phase)) {
        return GameResult<void>::err(GameError(
            ErrorCode::GameAlreadyStarted,
            "game already started (phase " + std::string(phaseName(state.phase)) + ")"));
    }

    const auto active = ActivePlayers(state);
    if (active.empty()) {
        state.phase = GameOver{};
        GW_LOG_INFO(LogCategory::Turn, "Game over at start: no active ships");
        return GameResult<void>::ok();
    }

    const Turn first{active.front(), TurnState::Aiming};
    state.phase = Playing{first};
    GW_LOG_INFO(LogCategory::Turn, "Game started");
    logTurn(first);
    return GameResult<void>::ok();
}

GameResult<void> TurnSystem::AdvanceAfterResolution(GameState& state,
                                                    const std::vector<MissileEvent>& events) {
    const Turn* turn = state.CurrentTurn();
    if (turn == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::NoTurnInProgress, "no turn to resolve"));
    }
    if (turn->state != TurnState::Firing) {
        return GameResult<void>::err(GameError(
            ErrorCode::NotFiring,
            "player " + std::to_string(turn->currentPlayer) + " has not fired yet"));
    }
    const PlayerId current = turn->currentPlayer;

    for (const auto& event : events) {
        const auto* hit = std::get_if<HitEntity>(&event.kind);
        if (hit == nullptr || hit->target >= state.entities.size()) {
            continue;
        }
        auto& ship = state.entities[hit->target].ship;
        if (ship && ship->IsActive()) {
            ship->Disable();
            GW_LOG_INFO(LogCategory::Turn,
                        "Ship of player " + std::to_string(ship->playerId) + " disabled");
        }
    }

    const auto active = ActivePlayers(state);
    if (active.size() < 2) {
        state.phase = GameOver{};
        if (active.size() == 1) {
            GW_LOG_INFO(LogCategory::Turn,
                        "Game over: player " + std::to_string(active.front()) + " wins");
        } else {
            GW_LOG_INFO(LogCategory::Turn, "Game over: draw");
        }
        return GameResult<void>::ok();
    }

    auto next = NextPlayer(current, rosterSize(state, active), active);
    // Two or more active players always yield a successor.
    const Turn following{next.value_or(active.front()), TurnState::Aiming};
    state.phase = Playing{following};
    logTurn(following);
    return GameResult<void>::ok();
}

std::vector<PlayerId> TurnSystem::ActivePlayers(const GameState& state) {
    std::vector<PlayerId> players;
    for (const auto& entity : state.entities) {
        if (entity.ship && entity.ship->IsActive()) {
            players.push_back(entity.ship->playerId);
        }
    }
    std::sort(players.begin(), players.end());
    players.erase(std::unique(players.begin(), players.end()), players.end());
    return players;
}

std::optional<PlayerId> TurnSystem::Winner(const GameState& state) {
    if (!state.IsGameOver()) {
        return std::nullopt;
    }
    const auto active = ActivePlayers(state);
    if (active.size() != 1) {
        return std::nullopt;
    }
    return active.front();
}

std::optional<PlayerId> TurnSystem::NextPlayer(PlayerId current, std::size_t playerCount,
                                               const std::vector<PlayerId>& activePlayers) {
    if (playerCount == 0) {
        return std::nullopt;
    }
    for (std::size_t step = 1; step <= playerCount; ++step) {
        const PlayerId candidate = (current + step) % playerCount;
        if (std::find(activePlayers.begin(), activePlayers.end(), candidate) !=
            activePlayers.end()) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace gw::game
