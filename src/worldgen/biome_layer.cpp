/**
 * @file biome_layer.cpp
 * @brief Biome: elevation bands and distance to water
 */

#include "terratile/worldgen/layer_builders.hpp"
#include "terratile/core/log.hpp"

#include <string>

namespace terratile::worldgen {

namespace {

/// Revert forest or desert patches smaller than minSegment to plains
size_t dissolveSmallSegments(Grid<Category>& categories, Category biome, int32_t minSegment) {
    Grid<uint8_t> member(categories.dimension(), 0);
    for (size_t i = 0; i < categories.cellCount(); ++i) {
        member[i] = categories[i] == biome ? 1 : 0;
    }

    std::vector<size_t> sizes;
    Grid<int32_t> labels = labelComponents(member, sizes);

    size_t reverted = 0;
    for (size_t i = 0; i < categories.cellCount(); ++i) {
        if (labels[i] >= 0 && sizes[static_cast<size_t>(labels[i])] < static_cast<size_t>(minSegment)) {
            categories[i] = BiomeCategory::Plains;
            ++reverted;
        }
    }
    return reverted;
}

}  // namespace

TerrainLayer buildBiomeLayer(const LayerInputs& inputs) {
    const HeightMap& heightmap = inputs.heightmap;
    const GenerationConfig& config = inputs.config;
    const BiomeParams& params = config.biome;
    const TerrainLayer& sea = inputs.require(LayerKind::Sea);
    const TerrainLayer& river = inputs.require(LayerKind::River);
    const int32_t dim = heightmap.dimension();

    Grid<uint8_t> water(dim, 0);
    for (int32_t y = 0; y < dim; ++y) {
        for (int32_t x = 0; x < dim; ++x) {
            water(x, y) = sea.is(x, y, SeaCategory::Water) || river.is(x, y, RiverCategory::Water);
        }
    }
    // -1 (no water on the map) counts as arbitrarily far
    Grid<int32_t> distance = distanceFrom(water);

    const float beachLimit = config.sea.threshold + params.beachBand;

    Grid<Category> categories(dim, BiomeCategory::Plains);
    for (int32_t y = 0; y < dim; ++y) {
        for (int32_t x = 0; x < dim; ++x) {
            Category& cell = categories(x, y);
            const int32_t d = distance(x, y);

            if (water(x, y)) {
                cell = BiomeCategory::Water;
            } else if (heightmap.isAbove(x, y, config.river.mountainThreshold)) {
                cell = BiomeCategory::Mountain;
            } else if (sea.adjacentTo(x, y, SeaCategory::Water, true) ||
                       heightmap.elevation(x, y) < beachLimit) {
                cell = BiomeCategory::Beach;
            } else if (d >= 0 && d <= params.forestDistance) {
                cell = BiomeCategory::Forest;
            } else if (d < 0 || d >= params.desertDistance) {
                cell = BiomeCategory::Desert;
            }
        }
    }

    size_t reverted = dissolveSmallSegments(categories, BiomeCategory::Forest, params.minSegment) +
                      dissolveSmallSegments(categories, BiomeCategory::Desert, params.minSegment);

    TerrainLayer layer(LayerKind::Biome, std::move(categories));
    Log::debug("BiomeLayer", std::to_string(layer.count(BiomeCategory::Forest)) + " forest, " +
                                 std::to_string(layer.count(BiomeCategory::Desert)) + " desert, " +
                                 std::to_string(reverted) + " cells reverted to plains");
    return layer;
}

}  // namespace terratile::worldgen
