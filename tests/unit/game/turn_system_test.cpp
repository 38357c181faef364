#include <gtest/gtest.h>

#include <vector>

#include "gw/game/entity.hpp"
#include "gw/game/game_state.hpp"
#include "gw/game/missile_types.hpp"
#include "gw/game/turn.hpp"
#include "gw/game/turn_system.hpp"

using namespace gw::game;
using gw::foundation::ErrorCode;

namespace {

/// One planet followed by one ship per player; ship of player p sits at
/// entity index p + 1.
GameState arena(std::size_t playerCount) {
    GameState state;
    state.entities.push_back(Entity::MakePlanet({0, 0, 0}, 5.0f, 100.0f));
    for (PlayerId p = 0; p < playerCount; ++p) {
        state.players.push_back(Player{});
        state.entities.push_back(
            Entity::MakeShip({20.0f * static_cast<float>(p + 1), 0, 0}, p, Disc{1.0f}));
    }
    return state;
}

EntityIndex shipOf(PlayerId p) {
    return p + 1;
}

MissileEvent hit(EntityIndex target) {
    return MissileEvent{99, HitEntity{target}};
}

PlayerId currentPlayer(const GameState& state) {
    const Turn* turn = state.CurrentTurn();
    EXPECT_NE(turn, nullptr);
    return turn != nullptr ? turn->currentPlayer : 0;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// StartGame
// ═══════════════════════════════════════════════════════════════════════════

TEST(TurnSystemStartTest, FirstActivePlayerAims) {
    auto state = arena(3);
    ASSERT_TRUE(TurnSystem::StartGame(state).hasValue());
    EXPECT_TRUE((state.phase == GamePhase{Playing{Turn{0, TurnState::Aiming}}}));
}

TEST(TurnSystemStartTest, SkipsPlayersWithoutActiveShip) {
    auto state = arena(3);
    state.entities[shipOf(0)].ship->Disable();
    ASSERT_TRUE(TurnSystem::StartGame(state).hasValue());
    EXPECT_EQ(currentPlayer(state), 1u);
}

TEST(TurnSystemStartTest, NoShipsMeansGameOver) {
    GameState state;
    state.players = {Player{}, Player{}};
    ASSERT_TRUE(TurnSystem::StartGame(state).hasValue());
    EXPECT_TRUE(state.IsGameOver());
    EXPECT_FALSE(TurnSystem::Winner(state).has_value());
}

TEST(TurnSystemStartTest, SecondStartIsRejected) {
    auto state = arena(2);
    ASSERT_TRUE(TurnSystem::StartGame(state).hasValue());
    state.CurrentTurn()->state = TurnState::Firing;
    const GamePhase before = state.phase;

    auto result = TurnSystem::StartGame(state);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::GameAlreadyStarted);
    EXPECT_TRUE(state.phase == before);
}

TEST(TurnSystemStartTest, StartAfterGameOverIsRejected) {
    auto state = arena(2);
    state.phase = GameOver{};
    auto result = TurnSystem::StartGame(state);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::GameAlreadyStarted);
    EXPECT_TRUE(state.IsGameOver());
}

// ═══════════════════════════════════════════════════════════════════════════
// AdvanceAfterResolution
// ═══════════════════════════════════════════════════════════════════════════

TEST(TurnSystemAdvanceTest, RequiresTurnInProgress) {
    auto state = arena(2);
    auto result = TurnSystem::AdvanceAfterResolution(state, {hit(shipOf(1))});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NoTurnInProgress);
    // State untouched: the ship was not disabled.
    EXPECT_TRUE(state.entities[shipOf(1)].ship->IsActive());
    EXPECT_TRUE(std::holds_alternative<NotStarted>(state.phase));
}

TEST(TurnSystemAdvanceTest, RejectsAimingTurn) {
    auto state = arena(2);
    state.phase = Playing{Turn{0, TurnState::Aiming}};

    auto result = TurnSystem::AdvanceAfterResolution(state, {hit(shipOf(1))});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFiring);
    EXPECT_TRUE(result.error().isCommandRejection());
    EXPECT_TRUE(state.entities[shipOf(1)].ship->IsActive());
    EXPECT_TRUE((state.phase == GamePhase{Playing{Turn{0, TurnState::Aiming}}}));
}

TEST(TurnSystemAdvanceTest, MissPassesTurn) {
    auto state = arena(2);
    state.phase = Playing{Turn{0, TurnState::Firing}};

    ASSERT_TRUE(TurnSystem::AdvanceAfterResolution(state, {MissileEvent{3, Expired{}}}).hasValue());
    EXPECT_TRUE((state.phase == GamePhase{Playing{Turn{1, TurnState::Aiming}}}));
    EXPECT_TRUE(state.entities[shipOf(0)].ship->IsActive());
    EXPECT_TRUE(state.entities[shipOf(1)].ship->IsActive());
}

TEST(TurnSystemAdvanceTest, HitOnPlanetChangesNothing) {
    auto state = arena(2);
    state.phase = Playing{Turn{1, TurnState::Firing}};

    ASSERT_TRUE(TurnSystem::AdvanceAfterResolution(state, {hit(0)}).hasValue());
    EXPECT_EQ(currentPlayer(state), 0u);
    EXPECT_EQ(TurnSystem::ActivePlayers(state).size(), 2u);
}

TEST(TurnSystemAdvanceTest, TwoPlayerEliminationEndsGame) {
    auto state = arena(2);
    state.phase = Playing{Turn{0, TurnState::Firing}};

    ASSERT_TRUE(TurnSystem::AdvanceAfterResolution(state, {hit(shipOf(1))}).hasValue());
    EXPECT_FALSE(state.entities[shipOf(1)].ship->IsActive());
    EXPECT_TRUE(state.IsGameOver());
    ASSERT_TRUE(TurnSystem::Winner(state).has_value());
    EXPECT_EQ(*TurnSystem::Winner(state), 0u);
}

TEST(TurnSystemAdvanceTest, SelfHitHandsVictoryToOpponent) {
    auto state = arena(2);
    state.phase = Playing{Turn{0, TurnState::Firing}};

    ASSERT_TRUE(TurnSystem::AdvanceAfterResolution(state, {hit(shipOf(0))}).hasValue());
    EXPECT_TRUE(state.IsGameOver());
    EXPECT_EQ(TurnSystem::Winner(state), std::optional<PlayerId>(1));
}

TEST(TurnSystemAdvanceTest, MutualDestructionIsDraw) {
    auto state = arena(2);
    state.phase = Playing{Turn{0, TurnState::Firing}};

    ASSERT_TRUE(
        TurnSystem::AdvanceAfterResolution(state, {hit(shipOf(0)), hit(shipOf(1))}).hasValue());
    EXPECT_TRUE(state.IsGameOver());
    EXPECT_FALSE(TurnSystem::Winner(state).has_value());
}

TEST(TurnSystemAdvanceTest, ThreePlayersWrapAround) {
    auto state = arena(3);
    ASSERT_TRUE(TurnSystem::StartGame(state).hasValue());

    std::vector<PlayerId> order;
    for (int i = 0; i < 4; ++i) {
        order.push_back(currentPlayer(state));
        state.CurrentTurn()->state = TurnState::Firing;
        ASSERT_TRUE(TurnSystem::AdvanceAfterResolution(state, {}).hasValue());
    }
    EXPECT_EQ(order, (std::vector<PlayerId>{0, 1, 2, 0}));
}

TEST(TurnSystemAdvanceTest, EliminatedPlayerIsSkipped) {
    auto state = arena(3);
    state.phase = Playing{Turn{0, TurnState::Firing}};

    // Player 0 knocks out player 1; play continues with player 2.
    ASSERT_TRUE(TurnSystem::AdvanceAfterResolution(state, {hit(shipOf(1))}).hasValue());
    EXPECT_FALSE(state.IsGameOver());
    EXPECT_EQ(currentPlayer(state), 2u);

    state.CurrentTurn()->state = TurnState::Firing;
    ASSERT_TRUE(TurnSystem::AdvanceAfterResolution(state, {}).hasValue());
    EXPECT_EQ(currentPlayer(state), 0u);
}

TEST(TurnSystemAdvanceTest, ShooterEliminatedPassesToNextSurvivor) {
    auto state = arena(3);
    state.phase = Playing{Turn{1, TurnState::Firing}};

    ASSERT_TRUE(TurnSystem::AdvanceAfterResolution(state, {hit(shipOf(1))}).hasValue());
    EXPECT_EQ(currentPlayer(state), 2u);
}

TEST(TurnSystemAdvanceTest, DisablingIsIdempotent) {
    auto state = arena(3);
    state.phase = Playing{Turn{0, TurnState::Firing}};

    ASSERT_TRUE(
        TurnSystem::AdvanceAfterResolution(state, {hit(shipOf(2)), hit(shipOf(2))}).hasValue());
    EXPECT_EQ(TurnSystem::ActivePlayers(state), (std::vector<PlayerId>{0, 1}));
    EXPECT_EQ(currentPlayer(state), 1u);
}

TEST(TurnSystemAdvanceTest, OutOfRangeTargetIsIgnored) {
    auto state = arena(2);
    state.phase = Playing{Turn{0, TurnState::Firing}};

    ASSERT_TRUE(TurnSystem::AdvanceAfterResolution(state, {hit(1000)}).hasValue());
    EXPECT_EQ(currentPlayer(state), 1u);
}

// ═══════════════════════════════════════════════════════════════════════════
// ActivePlayers / Winner
// ═══════════════════════════════════════════════════════════════════════════

TEST(TurnSystemQueryTest, ActivePlayersAreSortedAndDistinct) {
    GameState state;
    state.players = {Player{}, Player{}, Player{}};
    state.entities.push_back(Entity::MakeShip({0, 0, 0}, 2, Disc{1.0f}));
    state.entities.push_back(Entity::MakeShip({5, 0, 0}, 0, Disc{1.0f}));
    state.entities.push_back(Entity::MakeShip({9, 0, 0}, 2, Disc{1.0f}));
    state.entities.push_back(Entity::MakeShip({13, 0, 0}, 1, Disc{1.0f}));
    state.entities.back().ship->Disable();

    EXPECT_EQ(TurnSystem::ActivePlayers(state), (std::vector<PlayerId>{0, 2}));
}

TEST(TurnSystemQueryTest, PlayerWithSpareShipStaysActive) {
    auto state = arena(2);
    state.entities.push_back(Entity::MakeShip({-20, 0, 0}, 1, Disc{1.0f}));
    state.phase = Playing{Turn{0, TurnState::Firing}};

    ASSERT_TRUE(TurnSystem::AdvanceAfterResolution(state, {hit(shipOf(1))}).hasValue());
    EXPECT_FALSE(state.IsGameOver());
    EXPECT_EQ(currentPlayer(state), 1u);
}

TEST(TurnSystemQueryTest, NoWinnerWhileRunning) {
    auto state = arena(2);
    EXPECT_FALSE(TurnSystem::Winner(state).has_value());
    ASSERT_TRUE(TurnSystem::StartGame(state).hasValue());
    EXPECT_FALSE(TurnSystem::Winner(state).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// NextPlayer
// ═══════════════════════════════════════════════════════════════════════════

TEST(NextPlayerTest, AllActiveCyclesInOrder) {
    const std::vector<PlayerId> all{0, 1, 2, 3};
    EXPECT_EQ(TurnSystem::NextPlayer(0, 4, all), std::optional<PlayerId>(1));
    EXPECT_EQ(TurnSystem::NextPlayer(2, 4, all), std::optional<PlayerId>(3));
    EXPECT_EQ(TurnSystem::NextPlayer(3, 4, all), std::optional<PlayerId>(0));
}

TEST(NextPlayerTest, SkipsInactive) {
    EXPECT_EQ(TurnSystem::NextPlayer(0, 4, {0, 3}), std::optional<PlayerId>(3));
    EXPECT_EQ(TurnSystem::NextPlayer(3, 4, {1, 3}), std::optional<PlayerId>(1));
}

TEST(NextPlayerTest, CurrentNeedNotBeActive) {
    EXPECT_EQ(TurnSystem::NextPlayer(1, 3, {0, 2}), std::optional<PlayerId>(2));
    EXPECT_EQ(TurnSystem::NextPlayer(2, 3, {0, 1}), std::optional<PlayerId>(0));
}

TEST(NextPlayerTest, SoleActivePlayerReturnsToSelf) {
    EXPECT_EQ(TurnSystem::NextPlayer(2, 3, {2}), std::optional<PlayerId>(2));
}

TEST(NextPlayerTest, NobodyActive) {
    EXPECT_FALSE(TurnSystem::NextPlayer(0, 3, {}).has_value());
    EXPECT_FALSE(TurnSystem::NextPlayer(0, 0, {0}).has_value());
}

TEST(NextPlayerTest, ExhaustiveForSmallRosters) {
    for (std::size_t count = 2; count <= 4; ++count) {
        // Every subset of at least two active players.
        for (unsigned mask = 0; mask < (1u << count); ++mask) {
            std::vector<PlayerId> active;
            for (PlayerId p = 0; p < count; ++p) {
                if ((mask & (1u << p)) != 0) {
                    active.push_back(p);
                }
            }
            if (active.size() < 2) {
                continue;
            }
            for (PlayerId current = 0; current < count; ++current) {
                auto next = TurnSystem::NextPlayer(current, count, active);
                ASSERT_TRUE(next.has_value());
                EXPECT_NE(*next, current);
                EXPECT_TRUE((mask & (1u << *next)) != 0);

                // No active player lies strictly between current and next.
                for (PlayerId q = (current + 1) % count; q != *next; q = (q + 1) % count) {
                    EXPECT_EQ(mask & (1u << q), 0u)
                        << "count=" << count << " mask=" << mask << " current=" << current;
                }
            }
        }
    }
}
