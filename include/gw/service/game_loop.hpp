#pragma once

/// @file game_loop.hpp
/// @brief Fixed-step driver for a match.
///
/// The simulation advances by exactly SimulationConfig::TickInterval() per
/// step whatever the wall clock does.  GameLoop only decides when the next
/// step runs: back to back for headless matches and tests, or one per
/// TickPeriod() when a match is watched in real time.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

#include "gw/game/game_config.hpp"

namespace gw::service {

/// When steps run relative to the wall clock.
enum class Pacing : uint8_t {
    Unpaced,  ///< As fast as the steps allow.
    Realtime, ///< One step per tick period.
};

/// Timing of one executed step.
struct TickMetrics {
    /// 0-based index of the step within the loop's lifetime.
    uint64_t tick = 0;

    /// Wall time spent inside the step function.
    std::chrono::microseconds stepTime{0};

    /// stepTime as a fraction of the tick period.
    float budgetUsed = 0.0f;

    /// The step took longer than the tick period.
    bool overrun = false;
};

/// Runs a step function at the simulation's fixed tick rate.
///
/// @code
///   GameLoop loop(config);
///   loop.run([&] {
///       if (session.State().IsGameOver()) {
///           return false;
///       }
///       (void)session.Tick();
///       return true;
///   }, maxTicks, Pacing::Realtime);
/// @endcode
class GameLoop {
public:
    /// Advance the match by one tick.  Returning false means no step was
    /// taken and the run is over.
    using StepFn = std::function<bool()>;
    using MetricsFn = std::function<void(const TickMetrics&)>;

    /// A zero tick rate falls back to the default 30 Hz period.
    explicit GameLoop(const gw::game::SimulationConfig& config);

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;

    /// Called after every executed step, on the thread running the loop.
    void setMetricsCallback(MetricsFn callback);

    /// Call @p step until it returns false, @p maxTicks steps have run or
    /// requestStop() is seen.  Blocks the calling thread.
    /// @return The number of steps executed by this call.
    uint64_t run(const StepFn& step, uint64_t maxTicks, Pacing pacing);

    /// Make the current or next run() return after its current step.
    /// Safe to call from the step function or from another thread.
    void requestStop() noexcept;

    [[nodiscard]] std::chrono::microseconds tickPeriod() const noexcept { return period_; }

    /// Steps executed over the loop's lifetime.
    [[nodiscard]] uint64_t tickCount() const noexcept { return ticks_; }

private:
    /// Execute one step.  @p stepped is false when the step declined.
    TickMetrics execute(const StepFn& step, bool& stepped);

    std::chrono::microseconds period_;
    MetricsFn metricsCallback_;
    std::atomic<bool> stopRequested_{false};
    uint64_t ticks_ = 0;
};

}  // namespace gw::service
