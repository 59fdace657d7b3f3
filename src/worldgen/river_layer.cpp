/**
 * @file river_layer.cpp
 * @brief River: steepest-descent paths from random mountain sources
 */

#include "terratile/worldgen/layer_builders.hpp"
#include "terratile/core/errors.hpp"
#include "terratile/core/log.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

namespace terratile::worldgen {

namespace {

/// Lowest strictly-lower 4-neighbor; the first in N, E, S, W order wins ties
std::optional<CellPos> steepestDescent(const HeightMap& heightmap, CellPos pos) {
    const Grid<float>& values = heightmap.values();
    float best = values(pos.x, pos.y);
    std::optional<CellPos> result;

    for (const auto& offset : NEIGHBORS_4) {
        int32_t nx = pos.x + offset.dx;
        int32_t ny = pos.y + offset.dy;
        if (values.contains(nx, ny) && values(nx, ny) < best) {
            best = values(nx, ny);
            result = CellPos(nx, ny);
        }
    }
    return result;
}

bool touchesOtherRiver(const Grid<int32_t>& owner, CellPos pos, int32_t self) {
    for (const auto& offset : NEIGHBORS_4) {
        int32_t nx = pos.x + offset.dx;
        int32_t ny = pos.y + offset.dy;
        if (owner.contains(nx, ny) && owner(nx, ny) >= 0 && owner(nx, ny) != self) {
            return true;
        }
    }
    return false;
}

}  // namespace

TerrainLayer buildRiverLayer(const LayerInputs& inputs, RandomSource& random) {
    const HeightMap& heightmap = inputs.heightmap;
    const RiverParams& params = inputs.config.river;
    const TerrainLayer& sea = inputs.require(LayerKind::Sea);
    const int32_t dim = heightmap.dimension();

    std::vector<CellPos> mountains;
    for (int32_t y = 0; y < dim; ++y) {
        for (int32_t x = 0; x < dim; ++x) {
            if (heightmap.isAbove(x, y, params.mountainThreshold) && !sea.is(x, y, SeaCategory::Water)) {
                mountains.emplace_back(x, y);
            }
        }
    }
    if (mountains.empty()) {
        throw LayerConstraintUnsatisfied("no mountain cells to source rivers from");
    }

    random.shuffle(mountains);
    auto scaled = static_cast<size_t>(std::floor(static_cast<double>(mountains.size()) * params.density));
    size_t sourceCount = std::max(static_cast<size_t>(params.minSources), scaled);
    sourceCount = std::min(sourceCount, mountains.size());

    Grid<int32_t> owner(dim, -1);
    std::vector<RiverPath> rivers;

    for (size_t s = 0; s < sourceCount; ++s) {
        const CellPos source = mountains[s];
        if (owner(source.x, source.y) >= 0) {
            continue;
        }

        const auto self = static_cast<int32_t>(rivers.size());
        RiverPath path;
        path.cells.push_back(source);
        owner(source.x, source.y) = self;

        while (true) {
            const CellPos pos = path.cells.back();
            if (owner.onBorder(pos.x, pos.y)) {
                path.termination = RiverTermination::MapEdge;
                break;
            }
            if (sea.adjacentTo(pos.x, pos.y, SeaCategory::Water, false)) {
                path.termination = RiverTermination::Sea;
                break;
            }
            if (touchesOtherRiver(owner, pos, self)) {
                path.termination = RiverTermination::Confluence;
                break;
            }

            auto next = steepestDescent(heightmap, pos);
            if (!next) {
                path.termination = RiverTermination::LocalMinimum;
                break;
            }

            // Strict descent means a path can never return to a cell
            owner(next->x, next->y) = self;
            path.cells.push_back(*next);
        }

        rivers.push_back(std::move(path));
    }

    Grid<Category> categories(dim, RiverCategory::None);
    for (size_t i = 0; i < owner.cellCount(); ++i) {
        if (owner[i] >= 0) {
            categories[i] = RiverCategory::Water;
        }
    }

    TerrainLayer layer(LayerKind::River, std::move(categories));
    Log::debug("RiverLayer", std::to_string(rivers.size()) + " rivers from " +
                                 std::to_string(mountains.size()) + " mountain cells");
    layer.setRivers(std::move(rivers));
    return layer;
}

}  // namespace terratile::worldgen
