/**
 * @file road_layer.cpp
 * @brief Road: least-cost routes between random pairs of city sites
 *
 * Dijkstra over 4-neighbors. Entering a cell costs its terrain cost plus a
 * penalty per level of height change; cells already on a road cost a small
 * fixed amount instead, so later roads join earlier ones.
 */

#include "terratile/worldgen/layer_builders.hpp"
#include "terratile/core/errors.hpp"
#include "terratile/core/log.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <queue>
#include <string>
#include <utility>

namespace terratile::worldgen {

namespace {

constexpr float IMPASSABLE = std::numeric_limits<float>::infinity();
constexpr size_t NO_CELL = std::numeric_limits<size_t>::max();

std::string describe(CellPos pos) {
    return "(" + std::to_string(pos.x) + ", " + std::to_string(pos.y) + ")";
}

/// River cell whose river neighbors are exactly N+S or exactly E+W
bool straightRiver(const TerrainLayer& river, int32_t x, int32_t y) {
    uint8_t pattern = 0;
    for (size_t i = 0; i < NEIGHBORS_4.size(); ++i) {
        int32_t nx = x + NEIGHBORS_4[i].dx;
        int32_t ny = y + NEIGHBORS_4[i].dy;
        if (river.categories().contains(nx, ny) && river.categories()(nx, ny) == RiverCategory::Water) {
            pattern |= static_cast<uint8_t>(1u << i);
        }
    }
    return pattern == (NeighborBit::North | NeighborBit::South) ||
           pattern == (NeighborBit::East | NeighborBit::West);
}

class RoadRouter {
public:
    RoadRouter(const HeightMap& heightmap, Grid<float> costs, const RoadParams& params)
        : heightmap_(heightmap), costs_(std::move(costs)), params_(params),
          roads_(heightmap.dimension(), RoadCategory::None) {}

    /// Route from -> to and mark the path. Returns false if unreachable.
    bool route(CellPos from, CellPos to, RoadPath& path);

    [[nodiscard]] Grid<Category> takeCategories() { return std::move(roads_); }

private:
    [[nodiscard]] float stepCost(CellPos from, int32_t nx, int32_t ny) const;

    const HeightMap& heightmap_;
    Grid<float> costs_;
    const RoadParams& params_;
    Grid<Category> roads_;
};

float RoadRouter::stepCost(CellPos from, int32_t nx, int32_t ny) const {
    const float terrain = costs_(nx, ny);
    if (terrain == IMPASSABLE) {
        return IMPASSABLE;
    }
    if (roads_(nx, ny) == RoadCategory::Road) {
        return params_.roadCost;
    }
    float levelChange = std::fabs(std::round(heightmap_.level(from.x, from.y)) -
                                  std::round(heightmap_.level(nx, ny)));
    return terrain + levelChange * params_.elevationCost;
}

bool RoadRouter::route(CellPos from, CellPos to, RoadPath& path) {
    using QueueEntry = std::pair<float, size_t>;

    const size_t start = costs_.index(from.x, from.y);
    const size_t goal = costs_.index(to.x, to.y);

    std::vector<float> distance(costs_.cellCount(), IMPASSABLE);
    std::vector<size_t> previous(costs_.cellCount(), NO_CELL);
    // Ties pop the lower cell index first
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, std::greater<QueueEntry>> open;

    distance[start] = 0.0f;
    open.emplace(0.0f, start);

    while (!open.empty()) {
        auto [dist, current] = open.top();
        open.pop();

        if (dist > distance[current]) {
            continue;
        }
        if (current == goal) {
            break;
        }

        const CellPos pos = costs_.position(current);
        for (const auto& offset : NEIGHBORS_4) {
            int32_t nx = pos.x + offset.dx;
            int32_t ny = pos.y + offset.dy;
            if (!costs_.contains(nx, ny)) {
                continue;
            }

            float step = stepCost(pos, nx, ny);
            if (step == IMPASSABLE) {
                continue;
            }

            size_t next = costs_.index(nx, ny);
            float candidate = dist + step;
            if (candidate < distance[next]) {
                distance[next] = candidate;
                previous[next] = current;
                open.emplace(candidate, next);
            }
        }
    }

    if (distance[goal] == IMPASSABLE) {
        return false;
    }

    path.from = from;
    path.to = to;
    path.cost = distance[goal];
    path.cells.clear();
    for (size_t cell = goal; cell != NO_CELL; cell = previous[cell]) {
        path.cells.push_back(costs_.position(cell));
    }
    std::reverse(path.cells.begin(), path.cells.end());

    for (const auto& cell : path.cells) {
        roads_(cell.x, cell.y) = RoadCategory::Road;
    }
    return true;
}

}  // namespace

Grid<float> roadCostMap(const LayerInputs& inputs) {
    const RoadParams& params = inputs.config.road;
    const TerrainLayer& sea = inputs.require(LayerKind::Sea);
    const TerrainLayer& river = inputs.require(LayerKind::River);
    const TerrainLayer& biome = inputs.require(LayerKind::Biome);
    const int32_t dim = inputs.heightmap.dimension();

    Grid<float> costs(dim, params.baseCost);
    for (int32_t y = 0; y < dim; ++y) {
        for (int32_t x = 0; x < dim; ++x) {
            float& cost = costs(x, y);

            if (sea.is(x, y, SeaCategory::Water)) {
                cost = IMPASSABLE;
            } else if (river.is(x, y, RiverCategory::Water)) {
                cost = straightRiver(river, x, y) ? params.bridgeCost : IMPASSABLE;
            } else {
                switch (biome.category(x, y)) {
                    case BiomeCategory::Desert: cost += params.desertCost; break;
                    case BiomeCategory::Forest: cost += params.forestCost; break;
                    case BiomeCategory::Mountain: cost += params.mountainCost; break;
                    default: break;
                }
            }
        }
    }
    return costs;
}

TerrainLayer buildRoadLayer(const LayerInputs& inputs, RandomSource& random) {
    const TerrainLayer& city = inputs.require(LayerKind::City);
    const std::vector<CellPos>& sites = city.sites();

    if (sites.size() < 2) {
        throw LayerConstraintUnsatisfied("roads need at least two city sites, found " +
                                         std::to_string(sites.size()));
    }

    RoadRouter router(inputs.heightmap, roadCostMap(inputs), inputs.config.road);
    const size_t roadCount = sites.size() / 2;
    const auto last = static_cast<int32_t>(sites.size()) - 1;

    std::vector<RoadPath> roads;
    for (size_t r = 0; r < roadCount; ++r) {
        // Two distinct sites
        int32_t a = random.nextInt(0, last);
        int32_t b = random.nextInt(0, last - 1);
        if (b >= a) {
            ++b;
        }

        const CellPos from = sites[static_cast<size_t>(a)];
        const CellPos to = sites[static_cast<size_t>(b)];

        RoadPath path;
        if (router.route(from, to, path)) {
            Log::debug("RoadLayer", "Road " + describe(from) + " -> " + describe(to) + ", " +
                                        std::to_string(path.cells.size()) + " cells");
            roads.push_back(std::move(path));
        } else {
            Log::info("RoadLayer", "No route from " + describe(from) + " to " + describe(to));
        }
    }

    TerrainLayer layer(LayerKind::Road, router.takeCategories());
    layer.setRoads(std::move(roads));
    return layer;
}

}  // namespace terratile::worldgen
