#include <gtest/gtest.h>

#include <cmath>
#include <deque>
#include <memory>
#include <numbers>
#include <vector>

#include "gw/game/map_generator.hpp"
#include "gw/game/random_source.hpp"

using namespace gw::game;
using gw::foundation::ErrorCode;

namespace {

/// Roomy arena with a dozen or so planets; generation never runs out of
/// placement attempts.
MapGenConfig roomyConfig() {
    MapGenConfig config;
    config.width = 400.0f;
    config.height = 300.0f;
    config.playerCount = 3;
    config.planetCountDensityMean = 1e-4f;
    config.planetCountDensityStdDev = 2e-5f;
    return config;
}

/// Normal() always yields the mean; Uniform() replays a fixed script.
class ScriptedRandomSource : public IRandomSource {
public:
    explicit ScriptedRandomSource(std::deque<float> uniforms) : uniforms_(std::move(uniforms)) {}

    float Uniform(float lo, float /*hi*/) override {
        ++uniformCalls;
        if (uniforms_.empty()) {
            return lo;
        }
        const float v = uniforms_.front();
        uniforms_.pop_front();
        return v;
    }

    float Normal(float mean, float /*stddev*/) override { return mean; }

    int uniformCalls = 0;

private:
    std::deque<float> uniforms_;
};

class TaggedRenderer : public IEntityRenderer {
public:
    explicit TaggedRenderer(Color c) : color(c) {}
    void Render(const Entity&) override {}
    Color color;
};

std::size_t countShips(const GameState& state) {
    std::size_t n = 0;
    for (const auto& e : state.entities) {
        n += e.ship.has_value() ? 1 : 0;
    }
    return n;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// SeededRandomSource
// ═══════════════════════════════════════════════════════════════════════════

TEST(SeededRandomSourceTest, SameSeedSameSequence) {
    SeededRandomSource a(7);
    SeededRandomSource b(7);
    for (int i = 0; i < 32; ++i) {
        EXPECT_EQ(a.Uniform(-1.0f, 1.0f), b.Uniform(-1.0f, 1.0f));
        EXPECT_EQ(a.Normal(5.0f, 2.0f), b.Normal(5.0f, 2.0f));
    }
    EXPECT_EQ(a.Seed(), 7u);
}

TEST(SeededRandomSourceTest, UniformStaysInRange) {
    SeededRandomSource rng(1234);
    for (int i = 0; i < 1000; ++i) {
        const float v = rng.Uniform(-3.0f, 2.0f);
        EXPECT_GE(v, -3.0f);
        EXPECT_LE(v, 2.0f);
    }
}

TEST(SeededRandomSourceTest, DegenerateParameters) {
    SeededRandomSource rng(1);
    EXPECT_FLOAT_EQ(rng.Uniform(4.0f, 4.0f), 4.0f);
    EXPECT_FLOAT_EQ(rng.Uniform(4.0f, 1.0f), 4.0f);
    EXPECT_FLOAT_EQ(rng.Normal(2.5f, 0.0f), 2.5f);
    EXPECT_FLOAT_EQ(rng.Normal(2.5f, -1.0f), 2.5f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Generation
// ═══════════════════════════════════════════════════════════════════════════

TEST(MapGeneratorTest, ProducesRosterPlanetsAndShips) {
    SeededRandomSource rng(42);
    auto config = roomyConfig();
    MapGenerator generator(config, rng);

    GameState state;
    ASSERT_TRUE(generator.GenerateInto(state).hasValue());

    ASSERT_EQ(state.players.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<NotStarted>(state.phase));
    EXPECT_EQ(countShips(state), 3u);
    ASSERT_GT(state.entities.size(), 3u);

    // Planets first, then one ship per player in roster order.
    const std::size_t planets = state.entities.size() - 3;
    for (std::size_t i = 0; i < planets; ++i) {
        const Entity& planet = state.entities[i];
        EXPECT_FALSE(planet.ship.has_value());
        EXPECT_FALSE(planet.missileTrail.has_value());
        ASSERT_TRUE(planet.collisionShape.has_value());
        ASSERT_TRUE(std::holds_alternative<Disc>(*planet.collisionShape));
        EXPECT_GE(std::get<Disc>(*planet.collisionShape).radius, config.planetRadiusMin);
        EXPECT_GE(planet.mass, 0.0f);
        EXPECT_LE(std::abs(planet.transform.position.x), config.width * 0.5f);
        EXPECT_LE(std::abs(planet.transform.position.y), config.height * 0.5f);
        EXPECT_FLOAT_EQ(planet.transform.position.z, 0.0f);
    }
    for (PlayerId p = 0; p < 3; ++p) {
        const Entity& ship = state.entities[planets + p];
        ASSERT_TRUE(ship.ship.has_value());
        EXPECT_EQ(ship.ship->playerId, p);
        EXPECT_TRUE(ship.ship->IsActive());
        EXPECT_FLOAT_EQ(ship.mass, 0.0f);
        EXPECT_EQ(ship.transform.rotation, Quaternion::Identity());
        ASSERT_TRUE(ship.collisionShape.has_value());
        EXPECT_TRUE(std::holds_alternative<Disc>(*ship.collisionShape));
    }
}

TEST(MapGeneratorTest, ShapesAreSeparatedByMargin) {
    SeededRandomSource rng(2024);
    auto config = roomyConfig();
    config.playerCount = 6;
    MapGenerator generator(config, rng);

    GameState state;
    ASSERT_TRUE(generator.GenerateInto(state).hasValue());

    const auto& es = state.entities;
    for (std::size_t i = 0; i < es.size(); ++i) {
        for (std::size_t j = 0; j < i; ++j) {
            EXPECT_EQ(TestProximity(*es[i].collisionShape, es[i].CollisionTransform(),
                                    *es[j].collisionShape, es[j].CollisionTransform(),
                                    config.placementMargin),
                      Proximity::Disjoint)
                << "entities " << j << " and " << i;
        }
    }
}

TEST(MapGeneratorTest, SameSeedReproducesMap) {
    auto config = roomyConfig();

    SeededRandomSource rngA(99);
    SeededRandomSource rngB(99);
    GameState a;
    GameState b;
    ASSERT_TRUE(MapGenerator(config, rngA).GenerateInto(a).hasValue());
    ASSERT_TRUE(MapGenerator(config, rngB).GenerateInto(b).hasValue());

    ASSERT_EQ(a.entities.size(), b.entities.size());
    for (std::size_t i = 0; i < a.entities.size(); ++i) {
        EXPECT_EQ(a.entities[i].transform.position, b.entities[i].transform.position);
        EXPECT_EQ(a.entities[i].mass, b.entities[i].mass);
        EXPECT_TRUE(a.entities[i].collisionShape == b.entities[i].collisionShape);
    }
}

TEST(MapGeneratorTest, DifferentSeedsDiffer) {
    auto config = roomyConfig();

    SeededRandomSource rngA(1);
    SeededRandomSource rngB(2);
    GameState a;
    GameState b;
    ASSERT_TRUE(MapGenerator(config, rngA).GenerateInto(a).hasValue());
    ASSERT_TRUE(MapGenerator(config, rngB).GenerateInto(b).hasValue());

    EXPECT_NE(a.entities.front().transform.position, b.entities.front().transform.position);
}

TEST(MapGeneratorTest, PlanetMassFollowsVolumeAndDensity) {
    SeededRandomSource rng(5);
    auto config = roomyConfig();
    config.planetDensityStdDev = 0.0f;
    MapGenerator generator(config, rng);

    GameState state;
    ASSERT_TRUE(generator.GenerateInto(state).hasValue());

    const Entity& planet = state.entities.front();
    const float r = std::get<Disc>(*planet.collisionShape).radius;
    const float expected = 4.0f / 3.0f * std::numbers::pi_v<float> * r * r * r *
                           config.planetDensityMean;
    EXPECT_NEAR(planet.mass, expected, expected * 1e-5f);
}

TEST(MapGeneratorTest, RejectedCandidatesAreRedrawn) {
    // Planet at the origin, then each ship's first candidate lands on it.
    ScriptedRandomSource rng({0, 0,      // planet
                              0, 0,      // ship 0: rejected
                              30, 0,     // ship 0: accepted
                              30, 0,     // ship 1: rejected (overlaps ship 0)
                              -30, 0});  // ship 1: accepted
    MapGenConfig config;
    config.width = 100.0f;
    config.height = 100.0f;
    config.planetCountDensityMean = 1e-4f;
    MapGenerator generator(config, rng);

    GameState state;
    ASSERT_TRUE(generator.GenerateInto(state).hasValue());
    ASSERT_EQ(state.entities.size(), 3u);
    EXPECT_EQ(state.entities[0].transform.position, (Vector3{0, 0, 0}));
    EXPECT_EQ(state.entities[1].transform.position, (Vector3{30, 0, 0}));
    EXPECT_EQ(state.entities[2].transform.position, (Vector3{-30, 0, 0}));
    EXPECT_EQ(rng.uniformCalls, 10);
}

TEST(MapGeneratorTest, KeepsPresentationState) {
    SeededRandomSource rng(3);
    MapGenerator generator(roomyConfig(), rng);

    GameState state;
    state.camera.logScale = 1.5f;
    state.lighting.sunColor = Color{0.5f, 0.4f, 0.3f};
    state.missileRendererFactory = [] { return std::shared_ptr<IEntityRenderer>(); };

    ASSERT_TRUE(generator.GenerateInto(state).hasValue());
    EXPECT_FLOAT_EQ(state.camera.logScale, 1.5f);
    EXPECT_EQ(state.lighting.sunColor, (Color{0.5f, 0.4f, 0.3f}));
    EXPECT_TRUE(static_cast<bool>(state.missileRendererFactory));
}

TEST(MapGeneratorTest, ReplacesPreviousMatch) {
    SeededRandomSource rng(8);
    MapGenerator generator(roomyConfig(), rng);

    GameState state;
    state.entities.push_back(Entity::MakePlanet({0, 0, 0}, 1.0f, 1.0f));
    state.players.resize(5);
    state.phase = GameOver{};

    ASSERT_TRUE(generator.GenerateInto(state).hasValue());
    EXPECT_EQ(state.players.size(), 3u);
    EXPECT_EQ(countShips(state), 3u);
    EXPECT_TRUE(std::holds_alternative<NotStarted>(state.phase));
}

// ═══════════════════════════════════════════════════════════════════════════
// Ship hull and renderer hooks
// ═══════════════════════════════════════════════════════════════════════════

TEST(MapGeneratorTest, ShipContourReplacesDisc) {
    SeededRandomSource rng(11);
    MapGenerator generator(roomyConfig(), rng);
    const Polyline hull{{{-1, -0.5f}, {1.5f, 0}, {-1, 0.5f}}};
    generator.SetShipContour(hull);

    GameState state;
    ASSERT_TRUE(generator.GenerateInto(state).hasValue());
    for (const auto& e : state.entities) {
        if (!e.ship) {
            continue;
        }
        ASSERT_TRUE(std::holds_alternative<Polyline>(*e.collisionShape));
        EXPECT_EQ(std::get<Polyline>(*e.collisionShape).points, hull.points);
    }
}

TEST(MapGeneratorTest, ShipRendererFactoryReceivesPlayer) {
    SeededRandomSource rng(12);
    MapGenerator generator(roomyConfig(), rng);
    int calls = 0;
    generator.SetShipRendererFactory([&](const Player& player) {
        ++calls;
        return std::make_shared<TaggedRenderer>(player.color);
    });

    GameState state;
    ASSERT_TRUE(generator.GenerateInto(state).hasValue());
    EXPECT_EQ(calls, 3);
    for (const auto& e : state.entities) {
        if (!e.ship) {
            EXPECT_EQ(e.renderer, nullptr);
            continue;
        }
        auto tagged = std::dynamic_pointer_cast<TaggedRenderer>(e.renderer);
        ASSERT_NE(tagged, nullptr);
        EXPECT_EQ(tagged->color, MapGenerator::PlayerColor(e.ship->playerId));
    }
}

TEST(MapGeneratorTest, PaletteCycles) {
    EXPECT_EQ(MapGenerator::PlayerColor(0), kPlayerPalette[0]);
    EXPECT_EQ(MapGenerator::PlayerColor(3), kPlayerPalette[3]);
    EXPECT_EQ(MapGenerator::PlayerColor(kPlayerPaletteSize), MapGenerator::PlayerColor(0));
    EXPECT_NE(MapGenerator::PlayerColor(0), MapGenerator::PlayerColor(1));
}

TEST(MapGeneratorTest, RosterUsesPalette) {
    SeededRandomSource rng(13);
    MapGenerator generator(roomyConfig(), rng);
    GameState state;
    ASSERT_TRUE(generator.GenerateInto(state).hasValue());
    for (PlayerId p = 0; p < state.players.size(); ++p) {
        EXPECT_EQ(state.players[p].color, MapGenerator::PlayerColor(p));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Failures
// ═══════════════════════════════════════════════════════════════════════════

class MapGeneratorFailureTest : public ::testing::Test {
protected:
    void SetUp() override {
        state.entities.push_back(Entity::MakePlanet({1, 2, 0}, 3.0f, 4.0f));
        state.players = {Player{}, Player{}};
        state.phase = Playing{Turn{1, TurnState::Aiming}};
    }

    void expectUntouched() const {
        ASSERT_EQ(state.entities.size(), 1u);
        EXPECT_EQ(state.entities[0].transform.position, (Vector3{1, 2, 0}));
        EXPECT_EQ(state.players.size(), 2u);
        EXPECT_TRUE((state.phase == GamePhase{Playing{Turn{1, TurnState::Aiming}}}));
    }

    GameState state;
    SeededRandomSource rng{77};
};

TEST_F(MapGeneratorFailureTest, RejectsDegenerateArena) {
    MapGenConfig config;
    config.width = 0.0f;
    auto result = MapGenerator(config, rng).GenerateInto(state);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidMapParameters);
    expectUntouched();

    config.width = 10.0f;
    config.height = -1.0f;
    result = MapGenerator(config, rng).GenerateInto(state);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidMapParameters);
    expectUntouched();
}

TEST_F(MapGeneratorFailureTest, RejectsSinglePlayer) {
    MapGenConfig config;
    config.playerCount = 1;
    auto result = MapGenerator(config, rng).GenerateInto(state);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidMapParameters);
    expectUntouched();
}

TEST_F(MapGeneratorFailureTest, ShipPlacementFailureCarriesContext) {
    // One large planet fills a tiny arena, leaving no room for ships.
    MapGenConfig config;
    config.width = 1.0f;
    config.height = 1.0f;
    config.planetRadiusMean = 5.0f;
    config.planetRadiusStdDev = 0.0f;
    config.maxPlacementAttempts = 10;

    auto result = MapGenerator(config, rng).GenerateInto(state);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::PlacementFailed);

    const auto* failure = result.error().context<PlacementFailure>();
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->entityKind, PlacedKind::Ship);
    EXPECT_EQ(failure->attempts, 10u);
    EXPECT_EQ(failure->placedSoFar, 1u);
    expectUntouched();
}

TEST_F(MapGeneratorFailureTest, PlanetPlacementFailureCarriesContext) {
    MapGenConfig config;
    config.width = 1.0f;
    config.height = 1.0f;
    config.planetCountDensityMean = 3.0f;
    config.planetCountDensityStdDev = 0.0f;
    config.planetRadiusMean = 5.0f;
    config.planetRadiusStdDev = 0.0f;
    config.maxPlacementAttempts = 5;

    auto result = MapGenerator(config, rng).GenerateInto(state);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::PlacementFailed);

    const auto* failure = result.error().context<PlacementFailure>();
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->entityKind, PlacedKind::Planet);
    EXPECT_EQ(failure->attempts, 5u);
    EXPECT_EQ(failure->placedSoFar, 1u);
    expectUntouched();
}
