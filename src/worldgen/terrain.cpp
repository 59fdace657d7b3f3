#include "terratile/worldgen/terrain.hpp"
#include "terratile/worldgen/layer_builders.hpp"
#include "terratile/core/errors.hpp"
#include "terratile/core/log.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace terratile::worldgen {

namespace {

using Clock = std::chrono::steady_clock;

double elapsedMs(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

}  // namespace

void Terrain::validateDimension(int64_t dimension, const GenerationConfig& config) {
    if (dimension <= 0) {
        throw InvalidDimension("Map dimension must be positive, got " + std::to_string(dimension),
                               dimension);
    }
    if (dimension > config.maxDimension) {
        throw InvalidDimension("Map dimension " + std::to_string(dimension) + " exceeds the maximum of " +
                                   std::to_string(config.maxDimension),
                               dimension);
    }
}

// ============================================================================
// Generation
// ============================================================================

Terrain Terrain::generate(uint64_t seed, int64_t dimension, const GenerationConfig& config) {
    validateDimension(dimension, config);
    config.validate();

    const auto dim = static_cast<int32_t>(dimension);
    const auto totalStart = Clock::now();

    Terrain terrain;
    terrain.seed_ = seed;
    terrain.config_ = config;

    RandomSource random(seed);

    auto stageStart = Clock::now();
    terrain.heightmap_ = HeightMap::generate(dim, random, config.heightmap);
    terrain.timings_.push_back({"heightmap", elapsedMs(stageStart)});

    LayerInputs inputs{terrain.heightmap_, terrain.config_, {}};
    for (LayerKind kind : GENERATION_ORDER) {
        const size_t index = layerIndex(kind);
        stageStart = Clock::now();

        try {
            terrain.layers_[index] = buildLayer(kind, inputs, random);
        } catch (const LayerConstraintUnsatisfied& e) {
            std::string warning = std::string(layerKindName(kind)) + " layer left empty: " + e.what();
            Log::warn("Terrain", warning);
            terrain.warnings_.push_back(std::move(warning));
            terrain.layers_[index] = TerrainLayer::empty(kind, dim);
        }

        inputs.built[index] = &terrain.layers_[index];
        terrain.timings_.push_back({std::string(layerKindName(kind)), elapsedMs(stageStart)});
    }

    Log::info("Terrain", "Generated " + std::to_string(dim) + "x" + std::to_string(dim) +
                             " map from seed " + std::to_string(seed) + " in " +
                             std::to_string(elapsedMs(totalStart)) + " ms");
    return terrain;
}

Terrain Terrain::fromParts(uint64_t seed, const GenerationConfig& config,
                           HeightMap heightmap, LayerSet layers) {
    validateDimension(heightmap.dimension(), config);

    for (LayerKind kind : GENERATION_ORDER) {
        TerrainLayer& layer = layers[layerIndex(kind)];
        if (layer.kind() != kind) {
            throw std::invalid_argument("Layer slot '" + std::string(layerKindName(kind)) +
                                        "' holds a '" + std::string(layerKindName(layer.kind())) +
                                        "' layer");
        }
        if (layer.dimension() != heightmap.dimension()) {
            throw std::invalid_argument("Layer '" + std::string(layerKindName(kind)) +
                                        "' does not match the heightmap dimension");
        }
        layer.normalize();
    }

    // Site list in row-major order, as the city builder stores it
    TerrainLayer& city = layers[layerIndex(LayerKind::City)];
    std::vector<CellPos> sites;
    city.categories().forEach([&](int32_t x, int32_t y, Category value) {
        if (value == CityCategory::Site) {
            sites.emplace_back(x, y);
        }
    });
    city.setSites(std::move(sites));

    Terrain terrain;
    terrain.seed_ = seed;
    terrain.config_ = config;
    terrain.heightmap_ = std::move(heightmap);
    terrain.layers_ = std::move(layers);
    return terrain;
}

void Terrain::verifyDeterminism(uint64_t seed, int64_t dimension, const GenerationConfig& config) {
    Terrain first = generate(seed, dimension, config);
    Terrain second = generate(seed, dimension, config);

    if (auto grid = first.firstDifference(second)) {
        throw NonDeterminismDetected("Seed " + std::to_string(seed) + " at dimension " +
                                     std::to_string(dimension) + " produced different '" + *grid +
                                     "' grids on two runs");
    }
    Log::debug("Terrain", "Seed " + std::to_string(seed) + " reproduced identically");
}

std::optional<std::string> Terrain::firstDifference(const Terrain& other) const {
    if (heightmap_.values() != other.heightmap_.values()) {
        return std::string("heightmap");
    }
    for (LayerKind kind : GENERATION_ORDER) {
        const TerrainLayer& a = layer(kind);
        const TerrainLayer& b = other.layer(kind);
        if (a.categories() != b.categories()) {
            return std::string(layerKindName(kind)) + ".categories";
        }
        if (a.tiles() != b.tiles()) {
            return std::string(layerKindName(kind)) + ".tiles";
        }
    }
    return std::nullopt;
}

}  // namespace terratile::worldgen
