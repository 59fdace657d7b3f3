/**
 * @file city_layer.cpp
 * @brief City: weighted random sites on flat, habitable land
 *
 * Sites are drawn one at a time with probability proportional to a score
 * (water access raises it, desert lowers it). Each pick removes every
 * remaining candidate closer than the minimum spacing.
 */

#include "terratile/worldgen/layer_builders.hpp"
#include "terratile/core/errors.hpp"
#include "terratile/core/log.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace terratile::worldgen {

namespace {

struct Candidate {
    CellPos pos;
    float score;
};

bool habitableBiome(Category biome) {
    return biome == BiomeCategory::Beach || biome == BiomeCategory::Plains ||
           biome == BiomeCategory::Desert;
}

/// Index of a score-weighted draw over candidates
size_t weightedPick(const std::vector<Candidate>& candidates, RandomSource& random) {
    double total = 0.0;
    for (const auto& c : candidates) {
        total += c.score;
    }

    double target = static_cast<double>(random.nextFloat()) * total;
    double cumulative = 0.0;
    for (size_t i = 0; i < candidates.size(); ++i) {
        cumulative += candidates[i].score;
        if (target < cumulative) {
            return i;
        }
    }
    return candidates.size() - 1;
}

}  // namespace

int32_t citySpacing(int32_t dimension, const CityParams& params) {
    return std::clamp(dimension / params.closenessFactor, params.minDistance, params.maxDistance);
}

TerrainLayer buildCityLayer(const LayerInputs& inputs, RandomSource& random) {
    const HeightMap& heightmap = inputs.heightmap;
    const CityParams& params = inputs.config.city;
    const TerrainLayer& sea = inputs.require(LayerKind::Sea);
    const TerrainLayer& river = inputs.require(LayerKind::River);
    const TerrainLayer& biome = inputs.require(LayerKind::Biome);
    const int32_t dim = heightmap.dimension();

    // Land masses large enough to support a population
    Grid<uint8_t> land(dim, 0);
    for (size_t i = 0; i < land.cellCount(); ++i) {
        land[i] = sea.categories()[i] == SeaCategory::Land ? 1 : 0;
    }
    std::vector<size_t> landSizes;
    Grid<int32_t> landLabels = labelComponents(land, landSizes);

    std::vector<Candidate> candidates;
    for (int32_t y = 0; y < dim; ++y) {
        for (int32_t x = 0; x < dim; ++x) {
            const int32_t label = landLabels(x, y);
            if (label < 0 || landSizes[static_cast<size_t>(label)] < static_cast<size_t>(params.minLandSegment)) {
                continue;
            }
            if (river.is(x, y, RiverCategory::Water) || !habitableBiome(biome.category(x, y))) {
                continue;
            }
            if (glm::length(heightmap.gradient(x, y)) > params.maxSlope) {
                continue;
            }

            float score = 1.0f;
            if (river.adjacentTo(x, y, RiverCategory::Water, true)) score += params.riverBonus;
            if (sea.adjacentTo(x, y, SeaCategory::Water, true)) score += params.seaBonus;
            if (biome.is(x, y, BiomeCategory::Desert)) score -= params.desertPenalty;

            candidates.push_back({CellPos(x, y), score});
        }
    }

    if (candidates.empty()) {
        throw LayerConstraintUnsatisfied("no eligible city sites");
    }

    const size_t eligible = candidates.size();
    auto scaled = static_cast<size_t>(std::floor(static_cast<double>(eligible) * params.density));
    const size_t target = std::max(static_cast<size_t>(params.minCount), scaled);
    const int32_t spacing = citySpacing(dim, params);

    std::vector<CellPos> sites;
    while (sites.size() < target && !candidates.empty()) {
        const CellPos site = candidates[weightedPick(candidates, random)].pos;
        sites.push_back(site);

        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [&](const Candidate& c) {
                                            glm::ivec2 d = c.pos - site;
                                            return d.x * d.x + d.y * d.y < spacing * spacing;
                                        }),
                         candidates.end());
    }

    // Row-major, the same order a loaded map rebuilds them in
    std::sort(sites.begin(), sites.end(), [](const CellPos& a, const CellPos& b) {
        return a.y != b.y ? a.y < b.y : a.x < b.x;
    });

    Grid<Category> categories(dim, CityCategory::None);
    for (const auto& site : sites) {
        categories(site.x, site.y) = CityCategory::Site;
    }

    if (sites.size() < target) {
        Log::debug("CityLayer", "Spacing " + std::to_string(spacing) + " allowed only " +
                                    std::to_string(sites.size()) + " of " + std::to_string(target) +
                                    " sites");
    }

    TerrainLayer layer(LayerKind::City, std::move(categories));
    Log::debug("CityLayer", std::to_string(sites.size()) + " sites from " +
                                std::to_string(eligible) + " eligible cells");
    layer.setSites(std::move(sites));
    return layer;
}

}  // namespace terratile::worldgen
