/**
 * @file test_generation_config.cpp
 * @brief GenerationConfig loading, serialization and validation
 */

#include "terratile/worldgen/generation_config.hpp"
#include "terratile/core/log.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace terratile;
using namespace terratile::worldgen;

TEST(GenerationConfigTest, Defaults) {
    GenerationConfig config;
    EXPECT_EQ(config.maxDimension, 4096);
    EXPECT_EQ(config.heightmap.algorithm, HeightAlgorithm::DiamondSquare);
    EXPECT_EQ(config.heightmap.initialMin, 0x40);
    EXPECT_EQ(config.heightmap.initialMax, 0xBF);
    EXPECT_FLOAT_EQ(config.sea.threshold, 96.0f / 255.0f);
    EXPECT_FLOAT_EQ(config.river.mountainThreshold, 192.0f / 255.0f);
    EXPECT_EQ(config.biome.forestDistance, 3);
    EXPECT_EQ(config.biome.desertDistance, 8);
    EXPECT_EQ(config.city.closenessFactor, 20);
    EXPECT_FLOAT_EQ(config.road.bridgeCost, 5.0f);
    EXPECT_NO_THROW(config.validate());
}

TEST(GenerationConfigTest, TextOverridesSubset) {
    auto config = GenerationConfig::fromText(
        "# coastal preset\n"
        "sea.threshold: 0.45\n"
        "river.min_sources: 6\n"
        "heightmap.algorithm: perlin_fbm\n");

    EXPECT_FLOAT_EQ(config.sea.threshold, 0.45f);
    EXPECT_EQ(config.river.minSources, 6);
    EXPECT_EQ(config.heightmap.algorithm, HeightAlgorithm::PerlinFBM);
    // Untouched keys keep their defaults
    EXPECT_EQ(config.city.minCount, 2);
    EXPECT_FLOAT_EQ(config.road.roadCost, 0.2f);
}

TEST(GenerationConfigTest, MalformedValueThrows) {
    EXPECT_THROW((void)GenerationConfig::fromText("sea.min_size: lots\n"), std::invalid_argument);
    EXPECT_THROW((void)GenerationConfig::fromText("sea.threshold: 0.4x\n"), std::invalid_argument);
    EXPECT_THROW((void)GenerationConfig::fromText("heightmap.algorithm: voronoi\n"),
                 std::invalid_argument);
}

TEST(GenerationConfigTest, ErrorNamesLineAndKey) {
    try {
        (void)GenerationConfig::fromText("sea.threshold: 0.3\ncity.min_count: two\n");
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("line 2"), std::string::npos) << message;
        EXPECT_NE(message.find("city.min_count"), std::string::npos) << message;
    }
}

TEST(GenerationConfigTest, UnknownKeyWarns) {
    std::vector<std::string> warnings;
    Log::setSink([&](LogLevel level, std::string_view, std::string_view message) {
        if (level == LogLevel::Warning) warnings.emplace_back(message);
    });

    auto config = GenerationConfig::fromText("sea.treshold: 0.2\n");
    Log::setSink({});

    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("sea.treshold"), std::string::npos);
    EXPECT_EQ(config, GenerationConfig{});
}

TEST(GenerationConfigTest, TextRoundTripIsExact) {
    GenerationConfig config;
    config.sea.threshold = 0.3791f;
    config.river.density = 1.0f / 3.0f;
    config.road.desertCost = -0.123456789f;
    config.heightmap.algorithm = HeightAlgorithm::PerlinFBM;
    config.city.maxDistance = 55;

    auto restored = GenerationConfig::fromText(config.toConfigText());
    EXPECT_EQ(restored, config);
    EXPECT_EQ(restored.river.density, config.river.density);
    EXPECT_EQ(restored.road.desertCost, config.road.desertCost);
}

TEST(GenerationConfigTest, ConfigTextListsEveryKey) {
    std::string text = GenerationConfig{}.toConfigText();
    for (const char* key : {"terrain.max_dimension", "heightmap.perturb_decrease", "sea.min_size",
                            "river.mountain_threshold", "biome.min_segment", "city.desert_penalty",
                            "road.elevation_cost"}) {
        EXPECT_NE(text.find(std::string(key) + ": "), std::string::npos) << key;
    }
}

TEST(GenerationConfigTest, EqualityComparesValues) {
    GenerationConfig a;
    GenerationConfig b;
    EXPECT_EQ(a, b);
    b.city.seaBonus = 2.5f;
    EXPECT_FALSE(a == b);
}

TEST(GenerationConfigTest, ValidationRejectsInconsistentThresholds) {
    GenerationConfig config;
    config.sea.threshold = 0.8f;
    config.river.mountainThreshold = 0.7f;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(GenerationConfigTest, ValidationRejectsBadRanges) {
    {
        GenerationConfig config;
        config.biome.desertDistance = config.biome.forestDistance;
        EXPECT_THROW(config.validate(), std::invalid_argument);
    }
    {
        GenerationConfig config;
        config.city.desertPenalty = 1.0f;
        EXPECT_THROW(config.validate(), std::invalid_argument);
    }
    {
        GenerationConfig config;
        config.road.desertCost = -1.0f;
        EXPECT_THROW(config.validate(), std::invalid_argument);
    }
    {
        GenerationConfig config;
        config.heightmap.fbmOctaves = 0;
        EXPECT_THROW(config.validate(), std::invalid_argument);
    }
    {
        GenerationConfig config;
        config.heightmap.initialMax = 300;
        EXPECT_THROW(config.validate(), std::invalid_argument);
    }
    {
        GenerationConfig config;
        config.city.minDistance = 50;
        EXPECT_THROW(config.validate(), std::invalid_argument);
    }
}

TEST(GenerationConfigTest, MaxDimensionHasHardCeiling) {
    GenerationConfig config;
    config.maxDimension = HARD_MAX_DIMENSION;
    EXPECT_NO_THROW(config.validate());

    config.maxDimension = HARD_MAX_DIMENSION + 1;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    EXPECT_THROW((void)GenerationConfig::fromText("terrain.max_dimension: 2147483647\n"),
                 std::invalid_argument);
}

TEST(GenerationConfigTest, FromTextValidates) {
    EXPECT_THROW((void)GenerationConfig::fromText("terrain.max_dimension: 0\n"),
                 std::invalid_argument);
}

TEST(GenerationConfigTest, LoadFile) {
    auto path = std::filesystem::temp_directory_path() / "terratile_config_test.cfg";
    {
        std::ofstream out(path);
        out << "biome.min_segment: 10\n";
        out << "road.bridge_cost: 7.5\n";
    }

    auto config = GenerationConfig::loadFile(path.string());
    EXPECT_EQ(config.biome.minSegment, 10);
    EXPECT_FLOAT_EQ(config.road.bridgeCost, 7.5f);

    std::filesystem::remove(path);
}

TEST(GenerationConfigTest, LoadMissingFileThrows) {
    EXPECT_THROW((void)GenerationConfig::loadFile("/nonexistent/terratile.cfg"), std::runtime_error);
}

TEST(GenerationConfigTest, AlgorithmNames) {
    EXPECT_EQ(heightAlgorithmName(HeightAlgorithm::PerlinFBM), "perlin_fbm");
    EXPECT_EQ(parseHeightAlgorithm("diamond_square"), HeightAlgorithm::DiamondSquare);
    EXPECT_FALSE(parseHeightAlgorithm("simplex").has_value());
}
