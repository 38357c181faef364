/// @file map_generator.cpp
/// @brief MapGenerator implementation.

#include "gw/game/map_generator.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>
#include <utility>

#include "gw/foundation/game_logger.hpp"

namespace gw::game {

using gw::foundation::ErrorCode;
using gw::foundation::GameError;
using gw::foundation::GameResult;
using gw::foundation::LogCategory;

namespace {

GameResult<void> placementFailed(PlacedKind kind, uint32_t attempts, std::size_t placed) {
    const std::string message = "could not place " + std::string(placedKindName(kind)) +
                                " after " + std::to_string(attempts) + " attempts";
    GW_LOG_WARN(LogCategory::MapGen, message);
    return GameResult<void>::err(GameError(ErrorCode::PlacementFailed, message,
                                           PlacementFailure{kind, attempts, placed}));
}

float sphereVolume(float radius) {
    return 4.0f / 3.0f * std::numbers::pi_v<float> * radius * radius * radius;
}

} // namespace

MapGenerator::MapGenerator(const MapGenConfig& config, IRandomSource& random)
    : config_(config), random_(random) {}

void MapGenerator::SetShipContour(Polyline hull) {
    shipContour_ = std::move(hull);
}

void MapGenerator::SetShipRendererFactory(ShipRendererFactory factory) {
    shipRendererFactory_ = std::move(factory);
}

Color MapGenerator::PlayerColor(PlayerId player) noexcept {
    return kPlayerPalette[player % kPlayerPaletteSize];
}

GameResult<void> MapGenerator::validate() const {
    if (!(config_.width > 0.0f) || !(config_.height > 0.0f)) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidMapParameters, "arena width and height must be positive"));
    }
    if (config_.playerCount < 2) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidMapParameters, "at least two players are required"));
    }
    return GameResult<void>::ok();
}

GameResult<void> MapGenerator::GenerateInto(GameState& state) {
    if (auto valid = validate(); !valid) {
        return valid;
    }

    // ── Roster ──────────────────────────────────────────────────────────
    std::vector<Player> players;
    players.reserve(config_.playerCount);
    for (PlayerId p = 0; p < config_.playerCount; ++p) {
        players.push_back(Player{PlayerColor(p)});
    }

    std::vector<Entity> entities;

    // ── Planets ─────────────────────────────────────────────────────────
    const float area = config_.width * config_.height;
    const float density =
        random_.Normal(config_.planetCountDensityMean, config_.planetCountDensityStdDev);
    const auto planetCount =
        std::max<int64_t>(1, static_cast<int64_t>(std::floor(density * area)));

    for (int64_t i = 0; i < planetCount; ++i) {
        const float radius = std::max(
            config_.planetRadiusMin,
            random_.Normal(config_.planetRadiusMean, config_.planetRadiusStdDev));
        const float planetDensity = std::max(
            0.0f, random_.Normal(config_.planetDensityMean, config_.planetDensityStdDev));

        const Shape shape = Disc{radius};
        auto position = place(shape, entities);
        if (!position) {
            return placementFailed(PlacedKind::Planet, config_.maxPlacementAttempts,
                                   entities.size());
        }
        entities.push_back(
            Entity::MakePlanet(*position, radius, sphereVolume(radius) * planetDensity));
    }

    // ── Ships ───────────────────────────────────────────────────────────
    for (PlayerId p = 0; p < players.size(); ++p) {
        Shape shape = shipContour_ ? Shape{*shipContour_} : Shape{Disc{config_.shipRadius}};
        auto position = place(shape, entities);
        if (!position) {
            return placementFailed(PlacedKind::Ship, config_.maxPlacementAttempts,
                                   entities.size());
        }
        Entity ship = Entity::MakeShip(*position, p, std::move(shape));
        if (shipRendererFactory_) {
            ship.renderer = shipRendererFactory_(players[p]);
        }
        entities.push_back(std::move(ship));
    }

    GW_LOG_INFO(LogCategory::MapGen,
                "Generated map: " + std::to_string(planetCount) + " planets, " +
                    std::to_string(players.size()) + " ships");

    state.entities = std::move(entities);
    state.players = std::move(players);
    state.phase = NotStarted{};
    return GameResult<void>::ok();
}

std::optional<Vector3> MapGenerator::place(const Shape& shape,
                                           const std::vector<Entity>& placed) {
    const float halfW = config_.width * 0.5f;
    const float halfH = config_.height * 0.5f;

    for (uint32_t attempt = 0; attempt < config_.maxPlacementAttempts; ++attempt) {
        const Vector3 candidate{random_.Uniform(-halfW, halfW),
                                random_.Uniform(-halfH, halfH), 0.0f};
        const ShapeTransform at{candidate.XY(), 0.0f};

        const bool clear = std::all_of(placed.begin(), placed.end(), [&](const Entity& other) {
            return !other.collisionShape ||
                   TestProximity(shape, at, *other.collisionShape, other.CollisionTransform(),
                                 config_.placementMargin) == Proximity::Disjoint;
        });
        if (clear) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace gw::game
