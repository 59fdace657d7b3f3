/**
 * @file sea_layer.cpp
 * @brief Sea: low cells connected to the map border
 */

#include "terratile/worldgen/layer_builders.hpp"
#include "terratile/core/log.hpp"

#include <string>

namespace terratile::worldgen {

TerrainLayer buildSeaLayer(const LayerInputs& inputs) {
    const HeightMap& heightmap = inputs.heightmap;
    const SeaParams& params = inputs.config.sea;
    const int32_t dim = heightmap.dimension();

    Grid<uint8_t> candidate(dim, 0);
    for (int32_t y = 0; y < dim; ++y) {
        for (int32_t x = 0; x < dim; ++x) {
            candidate(x, y) = heightmap.elevation(x, y) <= params.threshold ? 1 : 0;
        }
    }

    std::vector<size_t> sizes;
    Grid<int32_t> labels = labelComponents(candidate, sizes);

    // Only bodies that touch the border are sea; inland basins stay land
    std::vector<uint8_t> reachesBorder(sizes.size(), 0);
    for (int32_t y = 0; y < dim; ++y) {
        for (int32_t x = 0; x < dim; ++x) {
            if (labels(x, y) >= 0 && candidate.onBorder(x, y)) {
                reachesBorder[static_cast<size_t>(labels(x, y))] = 1;
            }
        }
    }

    size_t bodies = 0;
    std::vector<uint8_t> isSea(sizes.size(), 0);
    for (size_t id = 0; id < sizes.size(); ++id) {
        if (reachesBorder[id] && sizes[id] >= static_cast<size_t>(params.minSize)) {
            isSea[id] = 1;
            ++bodies;
        }
    }

    Grid<Category> categories(dim, SeaCategory::Land);
    for (size_t i = 0; i < categories.cellCount(); ++i) {
        if (labels[i] >= 0 && isSea[static_cast<size_t>(labels[i])]) {
            categories[i] = SeaCategory::Water;
        }
    }

    TerrainLayer layer(LayerKind::Sea, std::move(categories));
    Log::debug("SeaLayer", std::to_string(bodies) + " sea bodies, " +
                               std::to_string(layer.count(SeaCategory::Water)) + " water cells");
    return layer;
}

}  // namespace terratile::worldgen
