#include "terratile/worldgen/generation_config.hpp"
#include "terratile/core/log.hpp"

#include <charconv>
#include <set>
#include <stdexcept>

namespace terratile::worldgen {

namespace {

/// Calls visitor(key, field) for every configurable field. Works for both
/// const and mutable configs so reading and writing share one key table.
template<typename Config, typename Visitor>
void forEachField(Config& cfg, Visitor&& visit) {
    visit("terrain.max_dimension", cfg.maxDimension);

    visit("heightmap.algorithm", cfg.heightmap.algorithm);
    visit("heightmap.initial_min", cfg.heightmap.initialMin);
    visit("heightmap.initial_max", cfg.heightmap.initialMax);
    visit("heightmap.perturb_range", cfg.heightmap.perturbRange);
    visit("heightmap.perturb_decrease", cfg.heightmap.perturbDecrease);
    visit("heightmap.fbm_octaves", cfg.heightmap.fbmOctaves);
    visit("heightmap.fbm_feature_scale", cfg.heightmap.fbmFeatureScale);
    visit("heightmap.fbm_persistence", cfg.heightmap.fbmPersistence);

    visit("sea.threshold", cfg.sea.threshold);
    visit("sea.min_size", cfg.sea.minSize);

    visit("river.mountain_threshold", cfg.river.mountainThreshold);
    visit("river.density", cfg.river.density);
    visit("river.min_sources", cfg.river.minSources);

    visit("biome.beach_band", cfg.biome.beachBand);
    visit("biome.forest_distance", cfg.biome.forestDistance);
    visit("biome.desert_distance", cfg.biome.desertDistance);
    visit("biome.min_segment", cfg.biome.minSegment);

    visit("city.density", cfg.city.density);
    visit("city.min_count", cfg.city.minCount);
    visit("city.min_land_segment", cfg.city.minLandSegment);
    visit("city.max_slope", cfg.city.maxSlope);
    visit("city.closeness_factor", cfg.city.closenessFactor);
    visit("city.min_distance", cfg.city.minDistance);
    visit("city.max_distance", cfg.city.maxDistance);
    visit("city.river_bonus", cfg.city.riverBonus);
    visit("city.sea_bonus", cfg.city.seaBonus);
    visit("city.desert_penalty", cfg.city.desertPenalty);

    visit("road.base_cost", cfg.road.baseCost);
    visit("road.desert_cost", cfg.road.desertCost);
    visit("road.forest_cost", cfg.road.forestCost);
    visit("road.mountain_cost", cfg.road.mountainCost);
    visit("road.bridge_cost", cfg.road.bridgeCost);
    visit("road.road_cost", cfg.road.roadCost);
    visit("road.elevation_cost", cfg.road.elevationCost);
}

[[noreturn]] void badValue(const ConfigEntry& entry, const char* expected) {
    throw std::invalid_argument("Config line " + std::to_string(entry.line) + ": '" + entry.key +
                                "' expects " + expected + ", got '" +
                                std::string(entry.value.asString()) + "'");
}

/// Applies a document entry to a field of the matching type
struct FieldReader {
    const ConfigDocument& doc;
    std::set<std::string>& known;

    void operator()(const char* key, int32_t& field) const {
        known.insert(key);
        const ConfigEntry* entry = doc.get(key);
        if (!entry) return;
        auto val = entry->value.tryInt();
        if (!val || *val < INT32_MIN || *val > INT32_MAX) badValue(*entry, "an integer");
        field = static_cast<int32_t>(*val);
    }

    void operator()(const char* key, float& field) const {
        known.insert(key);
        const ConfigEntry* entry = doc.get(key);
        if (!entry) return;
        auto val = entry->value.tryFloat();
        if (!val) badValue(*entry, "a number");
        field = *val;
    }

    void operator()(const char* key, HeightAlgorithm& field) const {
        known.insert(key);
        const ConfigEntry* entry = doc.get(key);
        if (!entry) return;
        auto val = parseHeightAlgorithm(entry->value.asString());
        if (!val) badValue(*entry, "diamond_square or perlin_fbm");
        field = *val;
    }
};

/// Appends "key: value" lines
struct FieldWriter {
    std::string& out;

    void operator()(const char* key, int32_t field) const {
        out += key;
        out += ": ";
        out += std::to_string(field);
        out += '\n';
    }

    void operator()(const char* key, float field) const {
        // Shortest representation that parses back to the same float
        char buffer[32];
        auto result = std::to_chars(buffer, buffer + sizeof(buffer), field);
        out += key;
        out += ": ";
        out.append(buffer, result.ptr);
        out += '\n';
    }

    void operator()(const char* key, HeightAlgorithm field) const {
        out += key;
        out += ": ";
        out += heightAlgorithmName(field);
        out += '\n';
    }
};

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument("Invalid generation config: " + message);
    }
}

bool unitRange(float value) {
    return value >= 0.0f && value <= 1.0f;
}

}  // namespace

std::string_view heightAlgorithmName(HeightAlgorithm algorithm) {
    switch (algorithm) {
        case HeightAlgorithm::DiamondSquare: return "diamond_square";
        case HeightAlgorithm::PerlinFBM: return "perlin_fbm";
    }
    return "diamond_square";
}

std::optional<HeightAlgorithm> parseHeightAlgorithm(std::string_view name) {
    if (name == "diamond_square") return HeightAlgorithm::DiamondSquare;
    if (name == "perlin_fbm") return HeightAlgorithm::PerlinFBM;
    return std::nullopt;
}

// ============================================================================
// Loading
// ============================================================================

GenerationConfig GenerationConfig::fromDocument(const ConfigDocument& doc) {
    GenerationConfig config;
    std::set<std::string> known;
    forEachField(config, FieldReader{doc, known});

    for (const auto& entry : doc) {
        if (known.find(entry.key) == known.end()) {
            Log::warn("GenerationConfig", "Unknown key '" + entry.key + "' at line " +
                                              std::to_string(entry.line) + " ignored");
        }
    }

    config.validate();
    return config;
}

GenerationConfig GenerationConfig::loadFile(const std::string& path) {
    ConfigParser parser;
    auto doc = parser.parseFile(path);
    if (!doc) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    return fromDocument(*doc);
}

GenerationConfig GenerationConfig::fromText(std::string_view text) {
    ConfigParser parser;
    return fromDocument(parser.parseString(text));
}

std::string GenerationConfig::toConfigText() const {
    std::string out;
    forEachField(*this, FieldWriter{out});
    return out;
}

// ============================================================================
// Validation
// ============================================================================

void GenerationConfig::validate() const {
    require(maxDimension > 0 && maxDimension <= HARD_MAX_DIMENSION,
            "terrain.max_dimension must be in [1, " + std::to_string(HARD_MAX_DIMENSION) + "]");

    require(heightmap.initialMin >= 0 && heightmap.initialMax <= 255 &&
                heightmap.initialMin <= heightmap.initialMax,
            "heightmap.initial_min/max must satisfy 0 <= min <= max <= 255");
    require(heightmap.perturbRange >= 0, "heightmap.perturb_range must be non-negative");
    require(unitRange(heightmap.perturbDecrease), "heightmap.perturb_decrease must be in [0, 1]");
    require(heightmap.fbmOctaves >= 1 && heightmap.fbmOctaves <= 16,
            "heightmap.fbm_octaves must be in [1, 16]");
    require(heightmap.fbmFeatureScale > 0.0f, "heightmap.fbm_feature_scale must be positive");
    require(heightmap.fbmPersistence > 0.0f && heightmap.fbmPersistence <= 1.0f,
            "heightmap.fbm_persistence must be in (0, 1]");

    require(unitRange(sea.threshold), "sea.threshold must be in [0, 1]");
    require(sea.minSize >= 0, "sea.min_size must be non-negative");

    require(unitRange(river.mountainThreshold), "river.mountain_threshold must be in [0, 1]");
    require(sea.threshold < river.mountainThreshold,
            "sea.threshold must be below river.mountain_threshold");
    require(unitRange(river.density), "river.density must be in [0, 1]");
    require(river.minSources >= 0, "river.min_sources must be non-negative");

    require(unitRange(biome.beachBand), "biome.beach_band must be in [0, 1]");
    require(biome.forestDistance >= 0, "biome.forest_distance must be non-negative");
    require(biome.desertDistance > biome.forestDistance,
            "biome.desert_distance must exceed biome.forest_distance");
    require(biome.minSegment >= 0, "biome.min_segment must be non-negative");

    require(unitRange(city.density), "city.density must be in [0, 1]");
    require(city.minCount >= 0, "city.min_count must be non-negative");
    require(city.minLandSegment >= 0, "city.min_land_segment must be non-negative");
    require(city.maxSlope >= 0.0f, "city.max_slope must be non-negative");
    require(city.closenessFactor > 0, "city.closeness_factor must be positive");
    require(city.minDistance >= 0 && city.minDistance <= city.maxDistance,
            "city.min_distance must be in [0, city.max_distance]");
    require(city.riverBonus >= 0.0f && city.seaBonus >= 0.0f,
            "city.river_bonus and city.sea_bonus must be non-negative");
    require(city.desertPenalty >= 0.0f && city.desertPenalty < 1.0f,
            "city.desert_penalty must be in [0, 1)");

    require(road.baseCost > 0.0f, "road.base_cost must be positive");
    require(road.baseCost + road.desertCost > 0.0f, "road.desert_cost makes desert cost non-positive");
    require(road.forestCost >= 0.0f && road.mountainCost >= 0.0f,
            "road.forest_cost and road.mountain_cost must be non-negative");
    require(road.bridgeCost > 0.0f, "road.bridge_cost must be positive");
    require(road.roadCost > 0.0f, "road.road_cost must be positive");
    require(road.elevationCost >= 0.0f, "road.elevation_cost must be non-negative");
}

bool GenerationConfig::operator==(const GenerationConfig& other) const {
    return toConfigText() == other.toConfigText();
}

}  // namespace terratile::worldgen
