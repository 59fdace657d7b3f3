/**
 * @file terrain_layer.hpp
 * @brief Categorical map layers and their generation order
 *
 * A TerrainLayer is one categorical grid (sea, river, biome, road or city)
 * plus the tile codes derived from it. The kind is a tag, not a subclass:
 * builders dispatch on it (layer_builders.hpp) and the dependency order is
 * checked at compile time below.
 */

#pragma once

#include "terratile/core/grid.hpp"
#include "terratile/worldgen/tile_normalizer.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace terratile::worldgen {

// ============================================================================
// Layer kinds
// ============================================================================

enum class LayerKind : uint8_t {
    Sea = 0,
    River = 1,
    Biome = 2,
    Road = 3,
    City = 4,
};

constexpr size_t LAYER_KIND_COUNT = 5;

[[nodiscard]] constexpr size_t layerIndex(LayerKind kind) {
    return static_cast<size_t>(kind);
}

[[nodiscard]] std::string_view layerKindName(LayerKind kind);
[[nodiscard]] std::optional<LayerKind> parseLayerKind(std::string_view name);

/// Bitmask (1 << layerIndex) of the layers a kind reads while generating
[[nodiscard]] constexpr uint32_t layerDependencies(LayerKind kind) {
    constexpr auto bit = [](LayerKind k) { return 1u << layerIndex(k); };
    switch (kind) {
        case LayerKind::Sea: return 0;
        case LayerKind::River: return bit(LayerKind::Sea);
        case LayerKind::Biome: return bit(LayerKind::Sea) | bit(LayerKind::River);
        case LayerKind::City:
            return bit(LayerKind::Sea) | bit(LayerKind::River) | bit(LayerKind::Biome);
        case LayerKind::Road:
            return bit(LayerKind::Sea) | bit(LayerKind::River) | bit(LayerKind::Biome) |
                   bit(LayerKind::City);
    }
    return 0;
}

/// Order layers are built in
inline constexpr std::array<LayerKind, LAYER_KIND_COUNT> GENERATION_ORDER = {
    LayerKind::Sea, LayerKind::River, LayerKind::Biome, LayerKind::City, LayerKind::Road,
};

/// Order renderers should draw layers in (bottom first)
inline constexpr std::array<LayerKind, LAYER_KIND_COUNT> DRAW_ORDER = {
    LayerKind::Sea, LayerKind::River, LayerKind::Biome, LayerKind::Road, LayerKind::City,
};

/// True when every layer's dependencies are built before it
[[nodiscard]] constexpr bool dependenciesPrecede(const std::array<LayerKind, LAYER_KIND_COUNT>& order) {
    uint32_t built = 0;
    for (LayerKind kind : order) {
        if ((layerDependencies(kind) & ~built) != 0) {
            return false;
        }
        built |= 1u << layerIndex(kind);
    }
    return built == (1u << LAYER_KIND_COUNT) - 1;
}

static_assert(dependenciesPrecede(GENERATION_ORDER),
              "GENERATION_ORDER must build every layer after its dependencies");

// ============================================================================
// Categories
// ============================================================================

namespace SeaCategory {
constexpr Category Land = 0;
constexpr Category Water = 1;
}  // namespace SeaCategory

namespace RiverCategory {
constexpr Category None = 0;
constexpr Category Water = 1;
}  // namespace RiverCategory

namespace BiomeCategory {
constexpr Category Water = 0;
constexpr Category Beach = 1;
constexpr Category Plains = 2;
constexpr Category Forest = 3;
constexpr Category Desert = 4;
constexpr Category Mountain = 5;
}  // namespace BiomeCategory

namespace CityCategory {
constexpr Category None = 0;
constexpr Category Site = 1;
}  // namespace CityCategory

namespace RoadCategory {
constexpr Category None = 0;
constexpr Category Road = 1;
}  // namespace RoadCategory

/// Number of valid category values for a layer kind
[[nodiscard]] constexpr Category categoryCount(LayerKind kind) {
    return kind == LayerKind::Biome ? 6 : 2;
}

// ============================================================================
// Side data
// ============================================================================

enum class RiverTermination : uint8_t {
    MapEdge,        ///< Last cell is on the map border
    Sea,            ///< Last cell is 4-adjacent to sea
    Confluence,     ///< Last cell is 4-adjacent to an earlier river
    LocalMinimum,   ///< No strictly lower neighbor
};

[[nodiscard]] std::string_view riverTerminationName(RiverTermination termination);

/// One traced river, source first
struct RiverPath {
    std::vector<CellPos> cells;
    RiverTermination termination = RiverTermination::LocalMinimum;
};

/// One routed road, from one city site to another
struct RoadPath {
    CellPos from{0};
    CellPos to{0};
    std::vector<CellPos> cells;
    float cost = 0.0f;
};

// ============================================================================
// TerrainLayer
// ============================================================================

class TerrainLayer {
public:
    TerrainLayer() = default;

    /// Layer over a category grid; not normalized until normalize() runs
    TerrainLayer(LayerKind kind, Grid<Category> categories);

    /// All-default-category layer, already normalized (constraint fallback)
    [[nodiscard]] static TerrainLayer empty(LayerKind kind, int32_t dimension);

    [[nodiscard]] LayerKind kind() const { return kind_; }
    [[nodiscard]] int32_t dimension() const { return categories_.dimension(); }

    [[nodiscard]] const Grid<Category>& categories() const { return categories_; }

    /// Tile codes; empty until normalized
    [[nodiscard]] const Grid<TileCode>& tiles() const { return tiles_; }

    [[nodiscard]] bool normalized() const { return normalized_; }

    /// Derive tile codes from the current categories
    void normalize();

    /// Replace one cell's category. Invalidates the tile codes.
    void setCategory(int32_t x, int32_t y, Category value);

    /// Throws std::out_of_range outside the map
    [[nodiscard]] Category category(int32_t x, int32_t y) const { return categories_.at(x, y); }

    /// Throws std::logic_error if the layer has not been normalized
    [[nodiscard]] TileCode tileCode(int32_t x, int32_t y) const;

    [[nodiscard]] bool is(int32_t x, int32_t y, Category value) const {
        return categories_.at(x, y) == value;
    }

    /// Cells holding the given category
    [[nodiscard]] size_t count(Category value) const;

    /// True if any in-bounds neighbor (4- or 8-connected) holds value
    [[nodiscard]] bool adjacentTo(int32_t x, int32_t y, Category value, bool diagonals) const;

    // ---- Side data (River, City, Road) ----

    [[nodiscard]] const std::vector<RiverPath>& rivers() const { return rivers_; }
    [[nodiscard]] const std::vector<CellPos>& sites() const { return sites_; }
    [[nodiscard]] const std::vector<RoadPath>& roads() const { return roads_; }

    void setRivers(std::vector<RiverPath> rivers) { rivers_ = std::move(rivers); }
    void setSites(std::vector<CellPos> sites) { sites_ = std::move(sites); }
    void setRoads(std::vector<RoadPath> roads) { roads_ = std::move(roads); }

private:
    LayerKind kind_ = LayerKind::Sea;
    Grid<Category> categories_;
    Grid<TileCode> tiles_;
    bool normalized_ = false;

    std::vector<RiverPath> rivers_;
    std::vector<CellPos> sites_;
    std::vector<RoadPath> roads_;
};

}  // namespace terratile::worldgen
