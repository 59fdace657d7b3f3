/**
 * @file layer_builders.hpp
 * @brief Generation of each terrain layer from the heightmap and earlier layers
 *
 * Builders return the layer's category grid (and side data) without tile
 * codes; buildLayer() dispatches on the kind and normalizes the result.
 *
 * A builder that cannot satisfy its placement rule throws
 * LayerConstraintUnsatisfied. Terrain turns that into an empty layer plus a
 * warning.
 */

#pragma once

#include "terratile/core/random_source.hpp"
#include "terratile/worldgen/generation_config.hpp"
#include "terratile/worldgen/height_map.hpp"
#include "terratile/worldgen/terrain_layer.hpp"

#include <array>
#include <vector>

namespace terratile::worldgen {

/// Everything a builder may read. Layers not yet built are null.
struct LayerInputs {
    const HeightMap& heightmap;
    const GenerationConfig& config;
    std::array<const TerrainLayer*, LAYER_KIND_COUNT> built{};

    /// Earlier layer of the given kind. Throws std::logic_error if it has not
    /// been built, which means the generation order is wrong.
    [[nodiscard]] const TerrainLayer& require(LayerKind kind) const;
};

[[nodiscard]] TerrainLayer buildSeaLayer(const LayerInputs& inputs);
[[nodiscard]] TerrainLayer buildRiverLayer(const LayerInputs& inputs, RandomSource& random);
[[nodiscard]] TerrainLayer buildBiomeLayer(const LayerInputs& inputs);
[[nodiscard]] TerrainLayer buildCityLayer(const LayerInputs& inputs, RandomSource& random);
[[nodiscard]] TerrainLayer buildRoadLayer(const LayerInputs& inputs, RandomSource& random);

/// Build and normalize one layer
[[nodiscard]] TerrainLayer buildLayer(LayerKind kind, const LayerInputs& inputs, RandomSource& random);

// ---- Helpers shared by the builders ----

/// 4-connected components of cells where member[i] is true. Returns a
/// component id per cell (-1 for non-members) and fills sizes per id.
/// Components are numbered in row-major order of their first cell.
[[nodiscard]] Grid<int32_t> labelComponents(const Grid<uint8_t>& member, std::vector<size_t>& sizes);

/// Minimum distance between city sites on a map of the given dimension:
/// dimension / closeness_factor, clamped to [min_distance, max_distance]
[[nodiscard]] int32_t citySpacing(int32_t dimension, const CityParams& params);

/// Movement cost of entering each cell before roads exist (infinity where
/// impassable). Straight river sections are bridges; other river cells and
/// sea are impassable.
[[nodiscard]] Grid<float> roadCostMap(const LayerInputs& inputs);

/// 4-connected BFS distance from every source cell (0 at sources, -1 if
/// unreachable)
[[nodiscard]] Grid<int32_t> distanceFrom(const Grid<uint8_t>& source);

}  // namespace terratile::worldgen
