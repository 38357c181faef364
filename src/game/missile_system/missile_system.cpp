/// @file missile_system.cpp
/// @brief MissileSystem implementation.
///
/// Each missile's trail is copied out of the entity list, advanced against
/// the other entities, and written back, so the entity list is only read
/// while a missile is in progress.

#include "gw/game/missile_system.hpp"

#include <cmath>
#include <string>
#include <string_view>
#include <utility>

#include "gw/foundation/game_logger.hpp"

namespace gw::game {

using gw::foundation::ErrorCode;
using gw::foundation::GameError;
using gw::foundation::GameLogger;
using gw::foundation::GameResult;
using gw::foundation::LogCategory;
using gw::foundation::LogContext;
using gw::foundation::LogLevel;

namespace {

void logMissile(LogLevel level, std::string_view msg, EntityIndex missile,
                PlayerId owner) {
    auto& logger = GameLogger::instance();
    if (!logger.isEnabled(level, LogCategory::Physics)) {
        return;
    }
    LogContext ctx;
    ctx.entityIndex = missile;
    ctx.playerId = owner;
    logger.logWithContext(level, LogCategory::Physics, msg, ctx);
}

/// Slack when converting a lifetime to whole ticks, as a fraction of a tick.
constexpr float kTickRounding = 1e-3f;

/// Lifetime left after one more tick.
///
/// Snapped to whole ticks so that float rounding cannot push expiry past
/// the tick on which elapsed time reaches the lifetime.
float remainingLifetime(float timeToLive, float dt) {
    const float ticksLeft = std::ceil(timeToLive / dt - kTickRounding);
    return ticksLeft > 1.0f ? (ticksLeft - 1.0f) * dt : 0.0f;
}

} // namespace

MissileSystem::MissileSystem(const SimulationConfig& config)
    : config_(config) {}

// ── Tick ────────────────────────────────────────────────────────────────

std::vector<MissileEvent> MissileSystem::Update(GameState& state) {
    std::vector<MissileEvent> events;
    // Missiles never spawn during Update, so the size is fixed for the tick.
    const std::size_t count = state.entities.size();
    for (EntityIndex i = 0; i < count; ++i) {
        const auto& trail = state.entities[i].missileTrail;
        if (!trail || !trail->IsLive()) {
            continue;
        }
        if (auto event = advanceMissile(state, i)) {
            events.push_back(std::move(*event));
        }
    }
    return events;
}

std::optional<MissileEvent> MissileSystem::advanceMissile(GameState& state,
                                                          EntityIndex missile) {
    MissileTrail trail = *state.entities[missile].missileTrail;
    const float dt = config_.TickInterval();
    const Vector3 lastPos = trail.LastPosition();

    trail.timeToLive = remainingLifetime(trail.timeToLive, dt);

    std::optional<MissileEvent> event;
    for (EntityIndex i = 0; i < state.entities.size(); ++i) {
        if (i == missile) {
            continue;
        }
        const Entity& other = state.entities[i];

        if (other.collisionShape && trail.velocity.XY().LengthSquared() > 0.0f) {
            auto toi = TimeOfImpact(*other.collisionShape, other.CollisionTransform(),
                                    lastPos.XY(), trail.velocity.XY(), dt, true);
            if (toi) {
                trail.timeToLive = 0.0f;
                trail.AddPosition(lastPos + trail.velocity * *toi);
                event = MissileEvent{missile, HitEntity{i}};
                break;
            }
        }
        trail.velocity += GravityAcceleration(other, lastPos, config_.gravitationalConstant);
    }

    if (!event) {
        trail.AddPosition(lastPos + trail.velocity * dt);
        if (!trail.IsLive()) {
            event = MissileEvent{missile, Expired{}};
        }
    }

    Entity& entity = state.entities[missile];
    entity.transform.position = trail.LastPosition();
    const PlayerId owner = trail.playerId;
    entity.missileTrail = std::move(trail);

    if (event) {
        if (const auto* hit = std::get_if<HitEntity>(&event->kind)) {
            logMissile(LogLevel::Debug, "Missile hit entity " + std::to_string(hit->target),
                       missile, owner);
        } else {
            logMissile(LogLevel::Debug, "Missile expired", missile, owner);
        }
    }
    return event;
}

// ── Fire command ────────────────────────────────────────────────────────

GameResult<EntityIndex> MissileSystem::FireMissile(GameState& state,
                                                   const FireParams& params) {
    if (!std::isfinite(params.angle)) {
        return GameResult<EntityIndex>::err(
            GameError(ErrorCode::InvalidAngle, "fire angle must be finite"));
    }
    if (!std::isfinite(params.speed) || params.speed < 0.0f ||
        params.speed > config_.missileMaxVelocity) {
        return GameResult<EntityIndex>::err(GameError(
            ErrorCode::InvalidSpeed,
            "fire speed must be in [0, " + std::to_string(config_.missileMaxVelocity) + "]"));
    }

    Turn* turn = state.CurrentTurn();
    if (turn == nullptr) {
        return GameResult<EntityIndex>::err(
            GameError(ErrorCode::NoTurnInProgress, "no turn in progress"));
    }
    if (turn->state != TurnState::Aiming) {
        return GameResult<EntityIndex>::err(
            GameError(ErrorCode::NotAiming, "current turn has already fired"));
    }

    const PlayerId player = turn->currentPlayer;
    auto shipIndex = state.FindActiveShip(player);
    if (!shipIndex) {
        return GameResult<EntityIndex>::err(GameError(
            ErrorCode::NoShipForPlayer,
            "player " + std::to_string(player) + " has no active ship"));
    }

    const Entity& ship = state.entities[*shipIndex];
    const Vector3 spawn = FindSpawnPoint(ship, params.angle, config_.spawnStepFraction);
    const Vector3 velocity =
        LaunchVelocity(params.angle, params.speed, config_.missileVelocityScale);

    Entity missile = Entity::MakeMissile(
        spawn, MissileTrail::Start(player, spawn, velocity, config_.missileTimeToLive));
    if (state.missileRendererFactory) {
        missile.renderer = state.missileRendererFactory();
    }

    const EntityIndex index = state.entities.size();
    state.entities.push_back(std::move(missile));
    turn->state = TurnState::Firing;

    logMissile(LogLevel::Debug, "Missile fired", index, player);
    return GameResult<EntityIndex>::ok(index);
}

// ── Static helpers ──────────────────────────────────────────────────────

Vector3 MissileSystem::GravityAcceleration(const Entity& source,
                                           const Vector3& point,
                                           float gravitationalConstant) noexcept {
    return source.GravitationalAccelerationAt(point, gravitationalConstant);
}

Vector3 MissileSystem::LaunchVelocity(float angle, float speed,
                                      float velocityScale) noexcept {
    return Vector3{std::cos(angle), std::sin(angle), 0.0f} * (speed * velocityScale);
}

Vector3 MissileSystem::FindSpawnPoint(const Entity& ship, float angle, float stepFraction) {
    const Vector3& centre = ship.transform.position;
    if (!ship.collisionShape || !(stepFraction > 0.0f)) {
        return centre;
    }

    const Shape& shape = *ship.collisionShape;
    const ShapeTransform placement = ship.CollisionTransform();
    const float radius = BoundingRadius(shape);
    if (!(radius > 0.0f)) {
        return centre;
    }
    const Vector3 heading{std::cos(angle), std::sin(angle), 0.0f};
    const float step = radius * stepFraction;

    // No step below floor(1 / stepFraction) can clear the bounding radius,
    // so the walk resumes there.  Past the radius only the boundary
    // tolerance of ContainsPoint can still hold the point, so the stride
    // doubles until it is cleared.
    double steps = std::floor(1.0 / static_cast<double>(stepFraction));
    double stride = 1.0;
    for (uint32_t i = 0; i < kMaxSettleSteps; ++i) {
        const Vector3 point = centre + heading * static_cast<float>(steps * step);
        if ((point - centre).Length() <= radius) {
            steps += 1.0;
            continue;
        }
        if (!ContainsPoint(shape, placement, point.XY())) {
            return point;
        }
        steps += stride;
        stride *= 2.0;
    }
    return centre + heading * (radius + step);
}

} // namespace gw::game
