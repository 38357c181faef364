/// @file main.cpp
/// @brief Headless match runner entry point.
///
/// Generates a map, lets a pseudo-random bot play every side and reports
/// the outcome.  Without --config or GW_CONFIG_PATH the built-in
/// defaults are used.

#include <cstdlib>
#include <iostream>
#include <random>
#include <string>

#include "gw/foundation/config_manager.hpp"
#include "gw/foundation/game_logger.hpp"
#include "gw/game/game_config.hpp"
#include "gw/game/game_session.hpp"
#include "gw/service/game_loop.hpp"
#include "gw/service/match_runner.hpp"
#include "gw/version.hpp"

namespace {

constexpr uint32_t kMaxMapAttempts = 16;

/// Ten minutes of game time.
constexpr uint64_t kDefaultMatchSeconds = 600;

} // namespace

int main(int argc, char* argv[]) {
    using gw::foundation::LogCategory;

    auto options = gw::service::parseMatchArgs(argc, argv);
    if (!options) {
        std::cerr << "gw_match: " << options.error().message() << "\n"
                  << "usage: gw_match [--config <yaml>] [--seed <n>] "
                     "[--max-ticks <n>] [--realtime]\n";
        return EXIT_FAILURE;
    }

    gw::foundation::ConfigManager config;
    auto loadResult = gw::service::loadConfig(config, options.value().configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto simConfig = gw::game::LoadSimulationConfig(config);
    if (!simConfig) {
        std::cerr << "Invalid config: " << simConfig.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    const auto& sim = simConfig.value();

    const uint64_t seed = options.value().seed.value_or(std::random_device{}());
    auto match = gw::service::generateMatch(sim, seed, kMaxMapAttempts);
    if (!match) {
        std::cerr << "Map generation failed: " << match.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    GW_LOG_INFO(LogCategory::Core,
                "gw_match " + std::string(gw::Version::string) + " using seed " +
                    std::to_string(match.value().seed));

    const uint64_t mapSeed = match.value().seed;
    gw::game::GameSession session(std::move(match.value().state), sim);
    if (auto started = session.Start(); !started) {
        std::cerr << "Failed to start match: " << started.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    gw::service::SignalHandler signals;
    gw::service::GameLoop loop(sim);
    loop.setMetricsCallback([](const gw::service::TickMetrics& metrics) {
        if (metrics.overrun) {
            GW_LOG_WARN(LogCategory::Core,
                        "Tick " + std::to_string(metrics.tick) + " overran its period");
        }
    });

    gw::service::MatchBot bot(mapSeed, sim.missileMaxVelocity);
    const uint64_t maxTicks =
        options.value().maxTicks.value_or(kDefaultMatchSeconds * sim.ticksPerSecond);

    const auto pacing = options.value().realtime ? gw::service::Pacing::Realtime
                                                 : gw::service::Pacing::Unpaced;
    auto outcome = gw::service::runMatch(session, loop, bot, maxTicks, pacing, &signals);

    std::cout << "Seed " << mapSeed << ": " << outcome.ticks << " ticks, "
              << outcome.shotsFired << " shots\n";
    if (!outcome.finished) {
        std::cout << "Match stopped before a result\n";
    } else if (outcome.winner) {
        std::cout << "Player " << *outcome.winner << " wins\n";
    } else {
        std::cout << "Draw\n";
    }

    auto flushed = gw::foundation::GameLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Log flush failed: " << flushed.error().describe() << "\n";
    }
    return EXIT_SUCCESS;
}
