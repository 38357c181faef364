#pragma once

/// @file map_generator.hpp
/// @brief Procedural arena generation: roster, planets and ships.
///
/// Planets and ships are placed by rejection sampling: a candidate
/// position is drawn uniformly over the arena and accepted only when its
/// shape is disjoint (beyond the placement margin) from every shape placed
/// so far.  A generation either fully succeeds or leaves the target state
/// untouched.

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "gw/foundation/game_result.hpp"
#include "gw/game/components.hpp"
#include "gw/game/entity.hpp"
#include "gw/game/game_config.hpp"
#include "gw/game/game_state.hpp"
#include "gw/game/random_source.hpp"
#include "gw/game/shape.hpp"

namespace gw::game {

/// Produces a renderer handle for a player's ship.
using ShipRendererFactory = std::function<std::shared_ptr<IEntityRenderer>(const Player&)>;

/// What the generator was placing when it gave up.
enum class PlacedKind : uint8_t {
    Planet,
    Ship
};

constexpr std::string_view placedKindName(PlacedKind kind) {
    return kind == PlacedKind::Planet ? "planet" : "ship";
}

/// Context attached to a PlacementFailed error.
///
/// Retrieve with `error.context<PlacementFailure>()`.
struct PlacementFailure {
    PlacedKind entityKind = PlacedKind::Planet;
    uint32_t attempts = 0;
    std::size_t placedSoFar = 0; ///< Entities successfully placed before the failure.
};

/// Number of distinct colors in the player palette.
inline constexpr std::size_t kPlayerPaletteSize = 8;

/// Player colors, assigned by player index and cycled.
inline constexpr std::array<Color, kPlayerPaletteSize> kPlayerPalette = {{
    {0.90f, 0.20f, 0.20f},  // red
    {0.20f, 0.45f, 0.90f},  // blue
    {0.25f, 0.80f, 0.30f},  // green
    {0.95f, 0.80f, 0.20f},  // yellow
    {0.75f, 0.30f, 0.85f},  // purple
    {0.20f, 0.80f, 0.80f},  // cyan
    {0.95f, 0.55f, 0.15f},  // orange
    {0.85f, 0.85f, 0.85f},  // grey
}};

/// Builds the initial entity list and roster for a match.
///
/// Example:
/// @code
///   SeededRandomSource rng(42);
///   MapGenerator generator(config.mapgen, rng);
///   GameState state;
///   if (auto r = generator.GenerateInto(state); !r) {
///       // r.error().code() == ErrorCode::PlacementFailed ...
///   }
/// @endcode
class MapGenerator {
public:
    /// @param random  Borrowed; must outlive the generator.
    MapGenerator(const MapGenConfig& config, IRandomSource& random);

    /// Use @p hull as every ship's collision shape instead of a disc.
    void SetShipContour(Polyline hull);

    /// Attach a renderer to each generated ship.
    void SetShipRendererFactory(ShipRendererFactory factory);

    /// Generate a map into @p state.
    ///
    /// On success replaces entities and roster and sets the phase to
    /// NotStarted.  Camera, lighting and the missile renderer factory are
    /// left as they are.
    ///
    /// @return InvalidMapParameters for a degenerate arena or fewer than
    ///         two players; PlacementFailed (with PlacementFailure context)
    ///         when a shape could not be placed.
    gw::foundation::GameResult<void> GenerateInto(GameState& state);

    /// Color for @p player (palette cycled by index).
    [[nodiscard]] static Color PlayerColor(PlayerId player) noexcept;

private:
    /// Draw candidate positions until @p shape fits among @p placed.
    std::optional<Vector3> place(const Shape& shape, const std::vector<Entity>& placed);

    gw::foundation::GameResult<void> validate() const;

    MapGenConfig config_;
    IRandomSource& random_;
    std::optional<Polyline> shipContour_;
    ShipRendererFactory shipRendererFactory_;
};

} // namespace gw::game
