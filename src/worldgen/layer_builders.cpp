#include "terratile/worldgen/layer_builders.hpp"

#include <queue>
#include <stdexcept>
#include <string>

namespace terratile::worldgen {

const TerrainLayer& LayerInputs::require(LayerKind kind) const {
    const TerrainLayer* layer = built[layerIndex(kind)];
    if (!layer) {
        throw std::logic_error("Layer '" + std::string(layerKindName(kind)) +
                               "' requested before it was built");
    }
    return *layer;
}

TerrainLayer buildLayer(LayerKind kind, const LayerInputs& inputs, RandomSource& random) {
    TerrainLayer layer;
    switch (kind) {
        case LayerKind::Sea:
            layer = buildSeaLayer(inputs);
            break;
        case LayerKind::River:
            layer = buildRiverLayer(inputs, random);
            break;
        case LayerKind::Biome:
            layer = buildBiomeLayer(inputs);
            break;
        case LayerKind::City:
            layer = buildCityLayer(inputs, random);
            break;
        case LayerKind::Road:
            layer = buildRoadLayer(inputs, random);
            break;
    }
    layer.normalize();
    return layer;
}

// ============================================================================
// Grid helpers
// ============================================================================

Grid<int32_t> labelComponents(const Grid<uint8_t>& member, std::vector<size_t>& sizes) {
    sizes.clear();
    Grid<int32_t> labels(member.dimension(), -1);
    std::queue<CellPos> frontier;

    for (size_t start = 0; start < member.cellCount(); ++start) {
        if (!member[start] || labels[start] >= 0) {
            continue;
        }

        const auto id = static_cast<int32_t>(sizes.size());
        size_t size = 0;
        labels[start] = id;
        frontier.push(member.position(start));

        while (!frontier.empty()) {
            CellPos pos = frontier.front();
            frontier.pop();
            ++size;

            for (const auto& offset : NEIGHBORS_4) {
                int32_t nx = pos.x + offset.dx;
                int32_t ny = pos.y + offset.dy;
                if (member.contains(nx, ny) && member(nx, ny) && labels(nx, ny) < 0) {
                    labels(nx, ny) = id;
                    frontier.push(CellPos(nx, ny));
                }
            }
        }
        sizes.push_back(size);
    }
    return labels;
}

Grid<int32_t> distanceFrom(const Grid<uint8_t>& source) {
    Grid<int32_t> distance(source.dimension(), -1);
    std::queue<CellPos> frontier;

    for (size_t i = 0; i < source.cellCount(); ++i) {
        if (source[i]) {
            distance[i] = 0;
            frontier.push(source.position(i));
        }
    }

    while (!frontier.empty()) {
        CellPos pos = frontier.front();
        frontier.pop();
        int32_t next = distance(pos.x, pos.y) + 1;

        for (const auto& offset : NEIGHBORS_4) {
            int32_t nx = pos.x + offset.dx;
            int32_t ny = pos.y + offset.dy;
            if (distance.contains(nx, ny) && distance(nx, ny) < 0) {
                distance(nx, ny) = next;
                frontier.push(CellPos(nx, ny));
            }
        }
    }
    return distance;
}

}  // namespace terratile::worldgen
