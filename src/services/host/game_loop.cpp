/// @file game_loop.cpp
/// @brief GameLoop implementation.

#include "gw/service/game_loop.hpp"

#include <thread>
#include <utility>

namespace gw::service {

using Clock = std::chrono::steady_clock;

GameLoop::GameLoop(const gw::game::SimulationConfig& config)
    : period_(config.ticksPerSecond > 0 ? config.TickPeriod()
                                        : gw::game::SimulationConfig{}.TickPeriod()) {}

void GameLoop::setMetricsCallback(MetricsFn callback) {
    metricsCallback_ = std::move(callback);
}

void GameLoop::requestStop() noexcept {
    stopRequested_.store(true, std::memory_order_release);
}

uint64_t GameLoop::run(const StepFn& step, uint64_t maxTicks, Pacing pacing) {
    uint64_t executed = 0;
    auto deadline = Clock::now();

    while (executed < maxTicks && !stopRequested_.load(std::memory_order_acquire)) {
        bool stepped = false;
        const TickMetrics metrics = execute(step, stepped);
        if (!stepped) {
            break;
        }
        ++executed;
        if (metricsCallback_) {
            metricsCallback_(metrics);
        }

        if (pacing == Pacing::Realtime) {
            deadline += period_;
            const auto now = Clock::now();
            if (now < deadline) {
                std::this_thread::sleep_until(deadline);
            } else {
                // Late: restart the schedule rather than bursting to catch up.
                deadline = now;
            }
        }
    }

    stopRequested_.store(false, std::memory_order_release);
    return executed;
}

TickMetrics GameLoop::execute(const StepFn& step, bool& stepped) {
    const auto start = Clock::now();
    stepped = step();
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);

    TickMetrics metrics;
    if (!stepped) {
        return metrics;
    }
    metrics.tick = ticks_++;
    metrics.stepTime = elapsed;
    if (period_.count() > 0) {
        metrics.budgetUsed =
            static_cast<float>(elapsed.count()) / static_cast<float>(period_.count());
    }
    metrics.overrun = elapsed > period_;
    return metrics;
}

} // namespace gw::service
