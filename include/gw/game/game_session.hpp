#pragma once

/// @file game_session.hpp
/// @brief GameSession: input queue + per-tick driver for one match.
///
/// Binds together the missile integrator and the turn machine over a
/// single GameState.  Input may be queued from any thread; Tick() must be
/// called from one thread at a time (normally the host GameLoop).

#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "gw/foundation/game_error.hpp"
#include "gw/foundation/game_result.hpp"
#include "gw/game/game_config.hpp"
#include "gw/game/game_state.hpp"
#include "gw/game/input_event.hpp"
#include "gw/game/missile_system.hpp"
#include "gw/game/missile_types.hpp"

namespace gw::game {

/// What happened during one Tick().
struct TickReport {
    /// Tick number, starting at 0.
    uint64_t tick = 0;

    /// Missile events emitted this tick.
    std::vector<MissileEvent> events;

    /// Fire commands rejected this tick, in queue order.
    std::vector<gw::foundation::GameError> rejectedCommands;

    /// Missiles fired this tick.
    std::vector<EntityIndex> firedMissiles;

    /// True when the turn was resolved at the end of this tick.
    bool turnResolved = false;
};

/// One match in progress.
class GameSession {
public:
    GameSession(GameState state, const SimulationConfig& config);

    // Non-copyable, non-movable (owns a mutex).
    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    /// Start the match (see TurnSystem::StartGame).
    gw::foundation::GameResult<void> Start();

    /// Enqueue an input event for the next Tick().
    void QueueInput(InputEvent event);

    /// Apply queued input, advance missiles one step and, once the
    /// current turn's missiles are all spent, resolve the turn.
    TickReport Tick();

    [[nodiscard]] const GameState& State() const noexcept { return state_; }
    [[nodiscard]] GameState& State() noexcept { return state_; }

    [[nodiscard]] const SimulationConfig& Config() const noexcept { return config_; }

    /// Number of ticks executed so far.
    [[nodiscard]] uint64_t TickCount() const noexcept { return tickCount_; }

    /// Number of input events waiting for the next Tick().
    [[nodiscard]] std::size_t PendingInputCount() const;

private:
    void applyInput(const InputEvent& event, TickReport& report);

    GameState state_;
    SimulationConfig config_;
    MissileSystem missiles_;

    /// Events of the turn in progress, consumed at resolution.
    std::vector<MissileEvent> turnEvents_;
    uint64_t tickCount_ = 0;

    mutable std::mutex inputMutex_;
    std::deque<InputEvent> inputQueue_;
};

} // namespace gw::game
