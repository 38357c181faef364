/// @file game_session.cpp
/// @brief GameSession implementation.

#include "gw/game/game_session.hpp"

#include <string>
#include <type_traits>
#include <utility>

#include "gw/foundation/game_logger.hpp"
#include "gw/game/turn_system.hpp"

namespace gw::game {

using gw::foundation::GameResult;
using gw::foundation::LogCategory;

GameSession::GameSession(GameState state, const SimulationConfig& config)
    : state_(std::move(state)), config_(config), missiles_(config) {}

GameResult<void> GameSession::Start() {
    turnEvents_.clear();
    return TurnSystem::StartGame(state_);
}

void GameSession::QueueInput(InputEvent event) {
    std::lock_guard lock(inputMutex_);
    inputQueue_.push_back(std::move(event));
}

std::size_t GameSession::PendingInputCount() const {
    std::lock_guard lock(inputMutex_);
    return inputQueue_.size();
}

TickReport GameSession::Tick() {
    TickReport report;
    report.tick = tickCount_;

    std::deque<InputEvent> pending;
    {
        std::lock_guard lock(inputMutex_);
        pending.swap(inputQueue_);
    }
    for (const auto& event : pending) {
        applyInput(event, report);
    }

    report.events = missiles_.Update(state_);
    turnEvents_.insert(turnEvents_.end(), report.events.begin(), report.events.end());

    const Turn* turn = state_.CurrentTurn();
    if (turn != nullptr && turn->state == TurnState::Firing && !state_.HasLiveMissile()) {
        auto resolved = TurnSystem::AdvanceAfterResolution(state_, turnEvents_);
        if (!resolved) {
            GW_LOG_ERROR(LogCategory::Core,
                         "Turn resolution failed: " + resolved.error().describe());
        }
        turnEvents_.clear();
        report.turnResolved = resolved.hasValue();
    }

    ++tickCount_;
    return report;
}

void GameSession::applyInput(const InputEvent& event, TickReport& report) {
    std::visit(
        [&](const auto& input) {
            using T = std::decay_t<decltype(input)>;
            if constexpr (std::is_same_v<T, PanCamera>) {
                state_.camera.Pan(input.dx, input.dy);
            } else if constexpr (std::is_same_v<T, ZoomCamera>) {
                if (!state_.camera.Zoom(input.factor)) {
                    GW_LOG_DEBUG(LogCategory::Input,
                                 "Ignored zoom factor " + std::to_string(input.factor));
                }
            } else {
                auto fired = missiles_.FireMissile(state_, FireParams{input.angle, input.speed});
                if (fired) {
                    report.firedMissiles.push_back(fired.value());
                } else if (fired.error().isCommandRejection()) {
                    GW_LOG_WARN(LogCategory::Input,
                                "Rejected fire command: " + fired.error().describe());
                    report.rejectedCommands.push_back(fired.error());
                } else {
                    GW_LOG_ERROR(LogCategory::Input,
                                 "Fire command failed: " + fired.error().describe());
                    report.rejectedCommands.push_back(fired.error());
                }
            }
        },
        event);
}

} // namespace gw::game
