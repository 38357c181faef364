#pragma once

/// @file game_state.hpp
/// @brief GameState: the caller-owned container every system operates on.

#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "gw/game/camera.hpp"
#include "gw/game/components.hpp"
#include "gw/game/entity.hpp"
#include "gw/game/turn.hpp"

namespace gw::game {

/// Produces a renderer handle for each newly fired missile.
using MissileRendererFactory = std::function<std::shared_ptr<IEntityRenderer>()>;

/// Whole match state: entities, roster, phase and render passthrough.
struct GameState {
    /// Insertion-ordered; never shrinks.
    std::vector<Entity> entities;
    std::vector<Player> players;
    GamePhase phase = NotStarted{};

    Camera camera;
    Lighting lighting;

    /// Optional; missiles get a null renderer when unset.
    MissileRendererFactory missileRendererFactory;

    /// The turn in progress, or nullptr outside Playing.
    [[nodiscard]] const Turn* CurrentTurn() const noexcept {
        const auto* playing = std::get_if<Playing>(&phase);
        return playing != nullptr ? &playing->turn : nullptr;
    }

    [[nodiscard]] Turn* CurrentTurn() noexcept {
        auto* playing = std::get_if<Playing>(&phase);
        return playing != nullptr ? &playing->turn : nullptr;
    }

    [[nodiscard]] bool IsGameOver() const noexcept {
        return std::holds_alternative<GameOver>(phase);
    }

    /// First entity carrying an Active ship owned by @p player.
    [[nodiscard]] std::optional<EntityIndex> FindActiveShip(PlayerId player) const noexcept {
        for (EntityIndex i = 0; i < entities.size(); ++i) {
            const auto& ship = entities[i].ship;
            if (ship && ship->playerId == player && ship->IsActive()) {
                return i;
            }
        }
        return std::nullopt;
    }

    /// Whether any missile trail still has time to live.
    [[nodiscard]] bool HasLiveMissile() const noexcept {
        for (const auto& e : entities) {
            if (e.missileTrail && e.missileTrail->IsLive()) {
                return true;
            }
        }
        return false;
    }
};

} // namespace gw::game
