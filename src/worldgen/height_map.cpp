#include "terratile/worldgen/height_map.hpp"
#include "terratile/worldgen/noise.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <utility>

namespace terratile::worldgen {

namespace {

constexpr int32_t MAX_LEVEL = 255;

/// Smallest 2^n + 1 that covers the requested dimension
int32_t latticeSize(int32_t dimension) {
    int32_t size = 2;
    while (size < dimension) {
        size = (size - 1) * 2 + 1;
    }
    return size;
}

int32_t perturb(int32_t value, int32_t range, RandomSource& random) {
    int32_t half = range / 2;
    return std::clamp(value + random.nextInt(-half, half), 0, MAX_LEVEL);
}

/// Rescale the cropped region to [0, 1]; a flat field becomes all zero
Grid<float> stretchLevels(const Grid<int32_t>& lattice, int32_t dimension) {
    int32_t minLevel = MAX_LEVEL;
    int32_t maxLevel = 0;
    for (int32_t y = 0; y < dimension; ++y) {
        for (int32_t x = 0; x < dimension; ++x) {
            minLevel = std::min(minLevel, lattice(x, y));
            maxLevel = std::max(maxLevel, lattice(x, y));
        }
    }

    Grid<float> values(dimension, 0.0f);
    if (maxLevel == minLevel) {
        return values;
    }

    int32_t span = maxLevel - minLevel;
    for (int32_t y = 0; y < dimension; ++y) {
        for (int32_t x = 0; x < dimension; ++x) {
            int32_t level = (lattice(x, y) - minLevel) * MAX_LEVEL / span;
            values(x, y) = static_cast<float>(level) / static_cast<float>(MAX_LEVEL);
        }
    }
    return values;
}

}  // namespace

HeightMap::HeightMap(Grid<float> values) : values_(std::move(values)) {
    for (float v : values_.cells()) {
        if (!std::isfinite(v) || v < 0.0f || v > 1.0f) {
            throw std::invalid_argument("HeightMap value outside [0, 1]");
        }
    }
}

HeightMap HeightMap::generate(int32_t dimension, RandomSource& random, const HeightMapParams& params) {
    if (dimension <= 0) {
        throw std::invalid_argument("HeightMap dimension must be positive");
    }

    HeightMap map;
    switch (params.algorithm) {
        case HeightAlgorithm::DiamondSquare:
            map.values_ = diamondSquare(dimension, random, params);
            break;
        case HeightAlgorithm::PerlinFBM:
            map.values_ = perlinFBM(dimension, random, params);
            break;
    }
    return map;
}

// ============================================================================
// Diamond-square
// ============================================================================

Grid<float> HeightMap::diamondSquare(int32_t dimension, RandomSource& random,
                                     const HeightMapParams& params) {
    const int32_t size = latticeSize(dimension);
    const int32_t last = size - 1;
    Grid<int32_t> lattice(size, 0);

    lattice(0, 0) = random.nextInt(params.initialMin, params.initialMax);
    lattice(last, 0) = random.nextInt(params.initialMin, params.initialMax);
    lattice(0, last) = random.nextInt(params.initialMin, params.initialMax);
    lattice(last, last) = random.nextInt(params.initialMin, params.initialMax);

    int32_t range = params.perturbRange;
    for (int32_t step = last; step > 1; step /= 2) {
        const int32_t half = step / 2;

        // Square step: centers of every square at this level
        for (int32_t y = 0; y < last; y += step) {
            for (int32_t x = 0; x < last; x += step) {
                int32_t sum = lattice(x, y) + lattice(x + step, y) +
                              lattice(x, y + step) + lattice(x + step, y + step);
                lattice(x + half, y + half) = perturb(sum / 4, range, random);
            }
        }

        // Diamond step: edge midpoints, averaging the in-bounds diamond corners
        for (int32_t y = 0; y < size; y += half) {
            int32_t startX = ((y / half) % 2 == 0) ? half : 0;
            for (int32_t x = startX; x < size; x += step) {
                int32_t sum = 0;
                int32_t count = 0;
                for (const auto& offset : NEIGHBORS_4) {
                    int32_t nx = x + offset.dx * half;
                    int32_t ny = y + offset.dy * half;
                    if (lattice.contains(nx, ny)) {
                        sum += lattice(nx, ny);
                        ++count;
                    }
                }
                lattice(x, y) = perturb(sum / count, range, random);
            }
        }

        range -= static_cast<int32_t>(static_cast<float>(range) * params.perturbDecrease);
    }

    return stretchLevels(lattice, dimension);
}

// ============================================================================
// Perlin FBM
// ============================================================================

Grid<float> HeightMap::perlinFBM(int32_t dimension, RandomSource& random,
                                 const HeightMapParams& params) {
    auto perlin = std::make_unique<PerlinNoise2D>(random);

    // Offset away from the lattice origin where gradient noise is zero
    float originX = random.nextFloat() * 256.0f;
    float originY = random.nextFloat() * 256.0f;

    FBMNoise2D fbm(std::move(perlin), params.fbmOctaves, 2.0f, params.fbmPersistence);

    const float scale = params.fbmFeatureScale / static_cast<float>(dimension);
    Grid<float> raw(dimension, 0.0f);
    float minValue = std::numeric_limits<float>::max();
    float maxValue = std::numeric_limits<float>::lowest();

    for (int32_t y = 0; y < dimension; ++y) {
        for (int32_t x = 0; x < dimension; ++x) {
            float v = fbm.evaluate(originX + static_cast<float>(x) * scale,
                                   originY + static_cast<float>(y) * scale);
            raw(x, y) = v;
            minValue = std::min(minValue, v);
            maxValue = std::max(maxValue, v);
        }
    }

    Grid<float> values(dimension, 0.0f);
    if (!(maxValue > minValue)) {
        return values;
    }

    float span = maxValue - minValue;
    for (size_t i = 0; i < raw.cellCount(); ++i) {
        values[i] = std::clamp((raw[i] - minValue) / span, 0.0f, 1.0f);
    }
    return values;
}

// ============================================================================
// Queries
// ============================================================================

glm::vec2 HeightMap::gradient(int32_t x, int32_t y) const {
    if (!values_.contains(x, y)) {
        throw std::out_of_range("HeightMap::gradient out of bounds");
    }

    const int32_t last = values_.dimension() - 1;

    auto difference = [&](int32_t x0, int32_t y0, int32_t x1, int32_t y1, float spacing) {
        return (values_(x1, y1) - values_(x0, y0)) / spacing;
    };

    glm::vec2 result(0.0f);
    if (last > 0) {
        if (x == 0) {
            result.x = difference(0, y, 1, y, 1.0f);
        } else if (x == last) {
            result.x = difference(last - 1, y, last, y, 1.0f);
        } else {
            result.x = difference(x - 1, y, x + 1, y, 2.0f);
        }

        if (y == 0) {
            result.y = difference(x, 0, x, 1, 1.0f);
        } else if (y == last) {
            result.y = difference(x, last - 1, x, last, 1.0f);
        } else {
            result.y = difference(x, y - 1, x, y + 1, 2.0f);
        }
    }
    return result;
}

std::vector<CellPos> HeightMap::neighbors4(int32_t x, int32_t y) const {
    std::vector<CellPos> result;
    result.reserve(4);
    for (const auto& offset : NEIGHBORS_4) {
        if (values_.contains(x + offset.dx, y + offset.dy)) {
            result.emplace_back(x + offset.dx, y + offset.dy);
        }
    }
    return result;
}

std::vector<CellPos> HeightMap::neighbors8(int32_t x, int32_t y) const {
    std::vector<CellPos> result;
    result.reserve(8);
    for (const auto& offset : NEIGHBORS_8) {
        if (values_.contains(x + offset.dx, y + offset.dy)) {
            result.emplace_back(x + offset.dx, y + offset.dy);
        }
    }
    return result;
}

}  // namespace terratile::worldgen
