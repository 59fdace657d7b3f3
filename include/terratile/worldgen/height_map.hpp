/**
 * @file height_map.hpp
 * @brief Continuous elevation field underlying every terrain layer
 *
 * Elevations are normalized to [0, 1]. The default generator is
 * diamond-square on integer levels 0..255, matching the classic
 * 8-bit heightmap; Perlin FBM is available through HeightMapParams.
 */

#pragma once

#include "terratile/core/grid.hpp"
#include "terratile/core/random_source.hpp"
#include "terratile/worldgen/generation_config.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <vector>

namespace terratile::worldgen {

class HeightMap {
public:
    HeightMap() = default;

    /// Wrap existing values (map loading). Throws std::invalid_argument if a
    /// value is non-finite or outside [0, 1].
    explicit HeightMap(Grid<float> values);

    /// Synthesize a heightmap. Draws from random in a fixed order, so the
    /// result depends only on (dimension, random state, params).
    [[nodiscard]] static HeightMap generate(int32_t dimension, RandomSource& random,
                                            const HeightMapParams& params = {});

    [[nodiscard]] int32_t dimension() const { return values_.dimension(); }
    [[nodiscard]] const Grid<float>& values() const { return values_; }

    // ---- Queries (throw std::out_of_range outside the map) ----

    [[nodiscard]] float elevation(int32_t x, int32_t y) const { return values_.at(x, y); }

    /// Elevation on the 0..255 level scale
    [[nodiscard]] float level(int32_t x, int32_t y) const { return values_.at(x, y) * 255.0f; }

    /// True when elevation >= threshold
    [[nodiscard]] bool isAbove(int32_t x, int32_t y, float threshold) const {
        return values_.at(x, y) >= threshold;
    }

    /// Finite-difference slope (d/dx, d/dy): central differences inside the
    /// map, one-sided at the borders, zero along an axis of extent 1.
    [[nodiscard]] glm::vec2 gradient(int32_t x, int32_t y) const;

    /// In-bounds neighbors, N, E, S, W order
    [[nodiscard]] std::vector<CellPos> neighbors4(int32_t x, int32_t y) const;

    /// In-bounds neighbors, N, NE, E, SE, S, SW, W, NW order
    [[nodiscard]] std::vector<CellPos> neighbors8(int32_t x, int32_t y) const;

private:
    [[nodiscard]] static Grid<float> diamondSquare(int32_t dimension, RandomSource& random,
                                                   const HeightMapParams& params);
    [[nodiscard]] static Grid<float> perlinFBM(int32_t dimension, RandomSource& random,
                                               const HeightMapParams& params);

    Grid<float> values_;
};

}  // namespace terratile::worldgen
