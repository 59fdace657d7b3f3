/**
 * @file generation_config.hpp
 * @brief Tunable constants for every generation stage
 *
 * Elevation thresholds are on the normalized [0, 1] scale; threshold tests
 * include the threshold itself ("at or above", "at or below").
 *
 * A config file overrides any subset of the keys:
 * ```
 * sea.threshold: 0.4
 * river.min_sources: 6
 * heightmap.algorithm: perlin_fbm
 * ```
 */

#pragma once

#include "terratile/core/config_parser.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace terratile::worldgen {

enum class HeightAlgorithm : uint8_t {
    DiamondSquare,
    PerlinFBM,
};

[[nodiscard]] std::string_view heightAlgorithmName(HeightAlgorithm algorithm);
[[nodiscard]] std::optional<HeightAlgorithm> parseHeightAlgorithm(std::string_view name);

struct HeightMapParams {
    HeightAlgorithm algorithm = HeightAlgorithm::DiamondSquare;

    // Diamond-square, on the 0..255 level scale
    int32_t initialMin = 0x40;          ///< Corner seed range
    int32_t initialMax = 0xBF;
    int32_t perturbRange = 256;         ///< Perturbation range at the coarsest level
    float perturbDecrease = 0.35f;      ///< Fraction removed from the range per level

    // Perlin FBM
    int32_t fbmOctaves = 5;
    float fbmFeatureScale = 4.0f;       ///< Base-octave noise periods across the map
    float fbmPersistence = 0.5f;
};

struct SeaParams {
    float threshold = 96.0f / 255.0f;
    int32_t minSize = 32;               ///< Smaller border-connected bodies become land
};

struct RiverParams {
    float mountainThreshold = 192.0f / 255.0f;
    float density = 0.025f;             ///< Sources per mountain cell
    int32_t minSources = 4;
};

struct BiomeParams {
    float beachBand = 15.0f / 255.0f;   ///< Height above sea level still counted as beach
    int32_t forestDistance = 3;         ///< Max distance to water for forest
    int32_t desertDistance = 8;         ///< Min distance to water for desert
    int32_t minSegment = 32;            ///< Smaller forest/desert segments become plains
};

struct CityParams {
    float density = 0.005f;             ///< Target sites per eligible cell
    int32_t minCount = 2;
    int32_t minLandSegment = 12;        ///< Land mass size needed to support a city
    float maxSlope = 0.08f;             ///< Gradient magnitude limit ("flat")
    int32_t closenessFactor = 20;       ///< dimension / factor = spacing
    int32_t minDistance = 3;            ///< Spacing lower clamp
    int32_t maxDistance = 40;           ///< Spacing upper clamp
    float riverBonus = 3.0f;
    float seaBonus = 3.0f;
    float desertPenalty = 0.9f;
};

struct RoadParams {
    float baseCost = 1.0f;
    float desertCost = -0.2f;           ///< Added to base
    float forestCost = 0.5f;
    float mountainCost = 1.0f;
    float bridgeCost = 5.0f;            ///< Crossing a straight river section
    float roadCost = 0.2f;              ///< Reusing an existing road
    float elevationCost = 0.08f;        ///< Per level of height difference (0..255 scale)
};

/// Ceiling for terrain.max_dimension. Keeps dimension^2 cell counts and the
/// diamond-square lattice size well inside int32_t.
inline constexpr int32_t HARD_MAX_DIMENSION = 16384;

struct GenerationConfig {
    int32_t maxDimension = 4096;        ///< At most HARD_MAX_DIMENSION

    HeightMapParams heightmap;
    SeaParams sea;
    RiverParams river;
    BiomeParams biome;
    CityParams city;
    RoadParams road;

    /// Build from defaults overridden by a parsed document.
    /// Throws std::invalid_argument on malformed or out-of-range values.
    [[nodiscard]] static GenerationConfig fromDocument(const ConfigDocument& doc);

    /// Load a config file; throws std::runtime_error if it cannot be read
    [[nodiscard]] static GenerationConfig loadFile(const std::string& path);

    /// Parse config text (as written by toConfigText)
    [[nodiscard]] static GenerationConfig fromText(std::string_view text);

    /// Serialize every key. Floats are written in shortest round-trip form so
    /// fromText(toConfigText()) reproduces identical values.
    [[nodiscard]] std::string toConfigText() const;

    /// Throws std::invalid_argument describing the first bad value
    void validate() const;

    [[nodiscard]] bool operator==(const GenerationConfig& other) const;
};

}  // namespace terratile::worldgen
