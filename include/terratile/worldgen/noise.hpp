/**
 * @file noise.hpp
 * @brief Gradient noise for the FBM heightmap algorithm
 *
 * Noise sources take their permutation from the generation RandomSource, so
 * a map's noise is fixed by the map seed like every other random decision.
 * Output range is approximately [-1, 1].
 */

#pragma once

#include "terratile/core/random_source.hpp"

#include <array>
#include <cstdint>
#include <memory>

namespace terratile::worldgen {

/// Abstract 2D noise evaluator
class Noise2D {
public:
    virtual ~Noise2D() = default;

    /// Evaluate noise at (x, y). Returns approximately [-1, 1].
    [[nodiscard]] virtual float evaluate(float x, float y) const = 0;
};

/// Classic Perlin gradient noise (improved, 2002)
class PerlinNoise2D : public Noise2D {
public:
    /// Draws 255 values from random to shuffle the permutation table
    explicit PerlinNoise2D(RandomSource& random);

    [[nodiscard]] float evaluate(float x, float y) const override;

private:
    std::array<uint8_t, 512> perm_;

    [[nodiscard]] static float grad(int hash, float x, float y);
};

/// Fractal Brownian Motion: stacks octaves of a base noise
class FBMNoise2D : public Noise2D {
public:
    /// @param base Base noise source (takes ownership)
    /// @param octaves Number of octaves to stack
    /// @param lacunarity Frequency multiplier per octave
    /// @param persistence Amplitude multiplier per octave
    FBMNoise2D(std::unique_ptr<Noise2D> base, int octaves = 6,
               float lacunarity = 2.0f, float persistence = 0.5f);

    [[nodiscard]] float evaluate(float x, float y) const override;

private:
    std::unique_ptr<Noise2D> base_;
    int octaves_;
    float lacunarity_;
    float persistence_;
};

}  // namespace terratile::worldgen
