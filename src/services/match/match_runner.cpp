/// @file match_runner.cpp
/// @brief Implementation of the headless match runner utilities.

#include "gw/service/match_runner.hpp"

#include <charconv>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <numbers>
#include <string>
#include <string_view>
#include <utility>

#include "gw/foundation/game_logger.hpp"
#include "gw/game/map_generator.hpp"
#include "gw/game/turn_system.hpp"

namespace gw::service {

using gw::foundation::ErrorCode;
using gw::foundation::GameError;
using gw::foundation::GameResult;
using gw::foundation::LogCategory;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
    // Restore default handlers so that a second signal terminates immediately.
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

// -- CLI argument parsing ----------------------------------------------------

namespace {

std::optional<uint64_t> parseUnsigned(std::string_view text) {
    uint64_t value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

GameResult<MatchOptions> badArgument(std::string message) {
    return GameResult<MatchOptions>::err(GameError(ErrorCode::InvalidArgument, std::move(message)));
}

} // namespace

GameResult<MatchOptions> parseMatchArgs(int argc, char* argv[]) {
    MatchOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--realtime") {
            options.realtime = true;
            continue;
        }
        if (arg != "--config" && arg != "--seed" && arg != "--max-ticks") {
            return badArgument("unknown argument: " + std::string(arg));
        }
        if (i + 1 >= argc) {
            return badArgument("missing value for " + std::string(arg));
        }
        const std::string_view value(argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

        if (arg == "--config") {
            options.configPath = std::string(value);
            continue;
        }
        auto number = parseUnsigned(value);
        if (!number) {
            return badArgument("invalid number for " + std::string(arg) + ": " +
                               std::string(value));
        }
        if (arg == "--seed") {
            options.seed = *number;
        } else {
            options.maxTicks = *number;
        }
    }
    return GameResult<MatchOptions>::ok(std::move(options));
}

// -- Config loading ----------------------------------------------------------

GameResult<void> loadConfig(gw::foundation::ConfigManager& config,
                            const std::filesystem::path& path) {
    std::filesystem::path configPath = path;

    const char* envPath = std::getenv("GW_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }
    if (configPath.empty()) {
        GW_LOG_DEBUG(LogCategory::Config, "No config file given, using built-in defaults");
        return GameResult<void>::ok();
    }

    return config.load(configPath);
}

// -- Map generation ----------------------------------------------------------

GameResult<GeneratedMatch> generateMatch(const gw::game::SimulationConfig& config,
                                         uint64_t seed, uint32_t maxAttempts) {
    const uint32_t attempts = maxAttempts > 0 ? maxAttempts : 1;
    GameError lastError(ErrorCode::PlacementFailed, "no generation attempted");

    for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
        const uint64_t attemptSeed = seed + attempt;
        gw::game::SeededRandomSource random(attemptSeed);
        gw::game::MapGenerator generator(config.mapgen, random);

        GeneratedMatch match;
        auto generated = generator.GenerateInto(match.state);
        if (generated) {
            match.seed = attemptSeed;
            match.attempts = attempt + 1;
            return GameResult<GeneratedMatch>::ok(std::move(match));
        }
        if (generated.error().code() != ErrorCode::PlacementFailed) {
            return GameResult<GeneratedMatch>::err(generated.error());
        }
        lastError = generated.error();
        GW_LOG_INFO(LogCategory::MapGen,
                    "Seed " + std::to_string(attemptSeed) + " failed, reseeding");
    }
    return GameResult<GeneratedMatch>::err(lastError);
}

// -- MatchBot ----------------------------------------------------------------

MatchBot::MatchBot(uint64_t seed, float maxSpeed)
    : random_(seed), maxSpeed_(maxSpeed) {}

std::optional<gw::game::FireMissile> MatchBot::chooseShot(const gw::game::GameState& state) {
    using namespace gw::game;

    const Turn* turn = state.CurrentTurn();
    if (turn == nullptr || turn->state != TurnState::Aiming) {
        return std::nullopt;
    }
    if (!state.FindActiveShip(turn->currentPlayer)) {
        return std::nullopt;
    }

    const float angle = random_.Uniform(0.0f, 2.0f * std::numbers::pi_v<float>);
    const float speed = random_.Uniform(0.0f, maxSpeed_);
    return FireMissile{angle, speed};
}

// -- Match driver ------------------------------------------------------------

MatchOutcome runMatch(gw::game::GameSession& session, GameLoop& loop, MatchBot& bot,
                      uint64_t maxTicks, Pacing pacing, const SignalHandler* signals) {
    MatchOutcome outcome;

    auto step = [&]() {
        if (session.State().IsGameOver() ||
            (signals != nullptr && signals->shutdownRequested())) {
            return false;
        }
        if (session.PendingInputCount() == 0) {
            if (auto shot = bot.chooseShot(session.State())) {
                session.QueueInput(*shot);
            }
        }
        auto report = session.Tick();
        outcome.shotsFired += static_cast<uint32_t>(report.firedMissiles.size());
        outcome.rejectedShots += static_cast<uint32_t>(report.rejectedCommands.size());
        return true;
    };

    outcome.ticks = loop.run(step, maxTicks, pacing);
    outcome.finished = session.State().IsGameOver();
    outcome.winner = gw::game::TurnSystem::Winner(session.State());
    return outcome;
}

} // namespace gw::service
