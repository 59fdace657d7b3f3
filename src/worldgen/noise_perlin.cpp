/**
 * @file noise_perlin.cpp
 * @brief Perlin gradient noise and FBM octave stacking
 *
 * Based on Ken Perlin's improved noise (2002). The permutation table is
 * shuffled with the map's RandomSource.
 */

#include "terratile/worldgen/noise.hpp"

#include <cmath>
#include <utility>

namespace terratile::worldgen {

namespace {

/// Improved Perlin fade curve: 6t^5 - 15t^4 + 10t^3
inline float fade(float t) {
    return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f);
}

inline float lerp(float t, float a, float b) {
    return a + t * (b - a);
}

}  // namespace

// ============================================================================
// PerlinNoise2D
// ============================================================================

PerlinNoise2D::PerlinNoise2D(RandomSource& random) {
    for (int i = 0; i < 256; ++i) {
        perm_[static_cast<size_t>(i)] = static_cast<uint8_t>(i);
    }

    // Fisher-Yates over the first half
    for (int i = 255; i > 0; --i) {
        int j = random.nextInt(0, i);
        std::swap(perm_[static_cast<size_t>(i)], perm_[static_cast<size_t>(j)]);
    }

    // Duplicate to avoid index wrapping
    for (int i = 0; i < 256; ++i) {
        perm_[static_cast<size_t>(i + 256)] = perm_[static_cast<size_t>(i)];
    }
}

float PerlinNoise2D::grad(int hash, float x, float y) {
    // Low 2 bits select one of four diagonal gradients
    int h = hash & 3;
    float u = (h & 2) == 0 ? x : -x;
    float v = (h & 1) == 0 ? y : -y;
    return u + v;
}

float PerlinNoise2D::evaluate(float x, float y) const {
    int xi = static_cast<int>(std::floor(x));
    int yi = static_cast<int>(std::floor(y));

    float xf = x - static_cast<float>(xi);
    float yf = y - static_cast<float>(yi);

    xi &= 255;
    yi &= 255;

    float u = fade(xf);
    float v = fade(yf);

    int aa = perm_[static_cast<size_t>(perm_[static_cast<size_t>(xi)] + yi)];
    int ab = perm_[static_cast<size_t>(perm_[static_cast<size_t>(xi)] + yi + 1)];
    int ba = perm_[static_cast<size_t>(perm_[static_cast<size_t>(xi + 1)] + yi)];
    int bb = perm_[static_cast<size_t>(perm_[static_cast<size_t>(xi + 1)] + yi + 1)];

    float x1 = lerp(u, grad(aa, xf, yf), grad(ba, xf - 1.0f, yf));
    float x2 = lerp(u, grad(ab, xf, yf - 1.0f), grad(bb, xf - 1.0f, yf - 1.0f));

    return lerp(v, x1, x2);
}

// ============================================================================
// FBMNoise2D
// ============================================================================

FBMNoise2D::FBMNoise2D(std::unique_ptr<Noise2D> base, int octaves,
                       float lacunarity, float persistence)
    : base_(std::move(base)), octaves_(octaves),
      lacunarity_(lacunarity), persistence_(persistence) {
}

float FBMNoise2D::evaluate(float x, float y) const {
    float value = 0.0f;
    float amplitude = 1.0f;
    float frequency = 1.0f;
    float maxAmplitude = 0.0f;

    for (int i = 0; i < octaves_; ++i) {
        value += base_->evaluate(x * frequency, y * frequency) * amplitude;
        maxAmplitude += amplitude;
        amplitude *= persistence_;
        frequency *= lacunarity_;
    }

    return maxAmplitude > 0.0f ? value / maxAmplitude : 0.0f;
}

}  // namespace terratile::worldgen
