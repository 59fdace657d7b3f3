/**
 * @file terrain.hpp
 * @brief A generated map: heightmap plus every normalized layer
 *
 * Terrain::generate runs the whole pipeline:
 *
 *   RandomSource(seed) -> HeightMap -> Sea -> River -> Biome -> City -> Road
 *
 * with each layer normalized as soon as it is built. The result is assembled
 * in locals and returned complete; a finished Terrain is read-only and is
 * replaced wholesale rather than regenerated in place.
 *
 * Usage:
 * @code
 *   auto terrain = Terrain::generate(42, 128);
 *   if (terrain.category(LayerKind::Sea, x, y) == SeaCategory::Water) { ... }
 *   TileCode tile = terrain.tileCode(LayerKind::Sea, x, y);
 * @endcode
 */

#pragma once

#include "terratile/worldgen/generation_config.hpp"
#include "terratile/worldgen/height_map.hpp"
#include "terratile/worldgen/terrain_layer.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace terratile::worldgen {

/// Wall-clock duration of one pipeline stage
struct StageTiming {
    std::string stage;
    double milliseconds = 0.0;
};

class Terrain {
public:
    using LayerSet = std::array<TerrainLayer, LAYER_KIND_COUNT>;

    /// Empty terrain (no grids)
    Terrain() = default;

    /// Generate a map. Throws InvalidDimension before allocating anything if
    /// dimension <= 0 or dimension > config.maxDimension, and
    /// std::invalid_argument if the config is invalid. Layers whose placement
    /// rule cannot be met are replaced by empty layers and listed in warnings().
    [[nodiscard]] static Terrain generate(uint64_t seed, int64_t dimension,
                                          const GenerationConfig& config = {});

    /// Assemble a terrain from stored grids (map loading). Every layer must
    /// match the heightmap dimension and its kind slot. Tiles are derived and
    /// the city site list is rebuilt from the city grid; traced river and
    /// road paths are not restored.
    [[nodiscard]] static Terrain fromParts(uint64_t seed, const GenerationConfig& config,
                                           HeightMap heightmap, LayerSet layers);

    /// Generate twice and compare. Throws NonDeterminismDetected naming the
    /// first differing grid.
    static void verifyDeterminism(uint64_t seed, int64_t dimension,
                                  const GenerationConfig& config = {});

    /// Throws InvalidDimension unless 0 < dimension <= config.maxDimension
    static void validateDimension(int64_t dimension, const GenerationConfig& config);

    [[nodiscard]] bool empty() const { return heightmap_.dimension() == 0; }

    [[nodiscard]] uint64_t seed() const { return seed_; }
    [[nodiscard]] int32_t dimension() const { return heightmap_.dimension(); }
    [[nodiscard]] const GenerationConfig& config() const { return config_; }

    [[nodiscard]] const HeightMap& heightmap() const { return heightmap_; }
    [[nodiscard]] const TerrainLayer& layer(LayerKind kind) const { return layers_[layerIndex(kind)]; }

    // ---- Per-cell queries (throw std::out_of_range outside the map) ----

    [[nodiscard]] float elevation(int32_t x, int32_t y) const { return heightmap_.elevation(x, y); }
    [[nodiscard]] Category category(LayerKind kind, int32_t x, int32_t y) const {
        return layer(kind).category(x, y);
    }
    [[nodiscard]] TileCode tileCode(LayerKind kind, int32_t x, int32_t y) const {
        return layer(kind).tileCode(x, y);
    }

    /// Layer constraint failures recovered during generation
    [[nodiscard]] const std::vector<std::string>& warnings() const { return warnings_; }

    /// Per-stage durations of the generation run (empty for loaded maps)
    [[nodiscard]] const std::vector<StageTiming>& timings() const { return timings_; }

    /// Name of the first grid that differs from other ("heightmap",
    /// "sea.categories", "road.tiles", ...), or nullopt if all grids match
    [[nodiscard]] std::optional<std::string> firstDifference(const Terrain& other) const;

private:
    uint64_t seed_ = 0;
    GenerationConfig config_;
    HeightMap heightmap_;
    LayerSet layers_;
    std::vector<std::string> warnings_;
    std::vector<StageTiming> timings_;
};

}  // namespace terratile::worldgen
