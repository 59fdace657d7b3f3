/**
 * @file test_terrain.cpp
 * @brief Full generation pipeline
 */

#include "terratile/worldgen/terrain.hpp"
#include "terratile/worldgen/layer_builders.hpp"
#include "terratile/worldgen/terrain_dump.hpp"
#include "terratile/core/errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <queue>
#include <sstream>
#include <string>
#include <vector>

using namespace terratile;
using namespace terratile::worldgen;

namespace {

LayerInputs inputsOf(const Terrain& terrain) {
    LayerInputs inputs{terrain.heightmap(), terrain.config()};
    for (LayerKind kind : GENERATION_ORDER) {
        inputs.built[layerIndex(kind)] = &terrain.layer(kind);
    }
    return inputs;
}

/// Sea cells reachable from a border sea cell through 4-connected sea
Grid<uint8_t> seaReachableFromBorder(const TerrainLayer& sea) {
    const int32_t dim = sea.dimension();
    Grid<uint8_t> reached(dim, 0);
    std::queue<CellPos> frontier;

    for (int32_t y = 0; y < dim; ++y) {
        for (int32_t x = 0; x < dim; ++x) {
            if (sea.categories().onBorder(x, y) && sea.is(x, y, SeaCategory::Water)) {
                reached(x, y) = 1;
                frontier.push(CellPos(x, y));
            }
        }
    }
    while (!frontier.empty()) {
        CellPos pos = frontier.front();
        frontier.pop();
        for (const auto& offset : NEIGHBORS_4) {
            int32_t nx = pos.x + offset.dx;
            int32_t ny = pos.y + offset.dy;
            if (reached.contains(nx, ny) && !reached(nx, ny) && sea.is(nx, ny, SeaCategory::Water)) {
                reached(nx, ny) = 1;
                frontier.push(CellPos(nx, ny));
            }
        }
    }
    return reached;
}

Terrain::LayerSet copyLayers(const Terrain& terrain) {
    Terrain::LayerSet layers;
    for (LayerKind kind : GENERATION_ORDER) {
        layers[layerIndex(kind)] = terrain.layer(kind);
    }
    return layers;
}

}  // namespace

// ============================================================================
// Determinism
// ============================================================================

TEST(TerrainTest, SameSeedSameTerrain) {
    auto a = Terrain::generate(42, 64);
    auto b = Terrain::generate(42, 64);
    EXPECT_FALSE(a.firstDifference(b).has_value());
    EXPECT_EQ(dumpTerrain(a), dumpTerrain(b));
}

TEST(TerrainTest, DifferentSeedsDiffer) {
    auto a = Terrain::generate(1, 64);
    auto b = Terrain::generate(2, 64);
    auto difference = a.firstDifference(b);
    ASSERT_TRUE(difference.has_value());
    EXPECT_EQ(*difference, "heightmap");
}

TEST(TerrainTest, VerifyDeterminismPasses) {
    EXPECT_NO_THROW(Terrain::verifyDeterminism(7, 48));
}

TEST(TerrainTest, GoldenSeed42Dimension16) {
    const std::filesystem::path golden =
        std::filesystem::path(TERRATILE_TEST_DATA_DIR) / "golden_seed42_dim16.txt";
    const std::string dump = dumpTerrain(Terrain::generate(42, 16));

    std::ifstream in(golden, std::ios::binary);
    ASSERT_TRUE(in.is_open()) << "Missing golden map " << golden;
    std::stringstream expected;
    expected << in.rdbuf();
    EXPECT_EQ(dump, expected.str());
}

// ============================================================================
// Completeness
// ============================================================================

TEST(TerrainTest, EveryLayerBuiltAndNormalized) {
    auto terrain = Terrain::generate(42, 64);
    EXPECT_FALSE(terrain.empty());
    EXPECT_EQ(terrain.seed(), 42u);
    EXPECT_EQ(terrain.dimension(), 64);

    for (LayerKind kind : GENERATION_ORDER) {
        const TerrainLayer& layer = terrain.layer(kind);
        EXPECT_EQ(layer.kind(), kind);
        EXPECT_EQ(layer.dimension(), 64);
        ASSERT_TRUE(layer.normalized()) << layerKindName(kind);
        EXPECT_EQ(layer.tiles(), TileNormalizer::normalize(layer.categories())) << layerKindName(kind);
    }

    for (float v : terrain.heightmap().values().cells()) {
        ASSERT_GE(v, 0.0f);
        ASSERT_LE(v, 1.0f);
    }
}

TEST(TerrainTest, TimingsPerStage) {
    auto terrain = Terrain::generate(3, 32);
    const auto& timings = terrain.timings();
    ASSERT_EQ(timings.size(), 1 + LAYER_KIND_COUNT);
    EXPECT_EQ(timings[0].stage, "heightmap");
    for (size_t i = 0; i < LAYER_KIND_COUNT; ++i) {
        EXPECT_EQ(timings[i + 1].stage, layerKindName(GENERATION_ORDER[i]));
        EXPECT_GE(timings[i + 1].milliseconds, 0.0);
    }
}

TEST(TerrainTest, CrossLayerConsistency) {
    for (uint64_t seed : {1u, 2u, 3u, 4u}) {
        auto terrain = Terrain::generate(seed, 48);
        const auto& sea = terrain.layer(LayerKind::Sea);
        const auto& river = terrain.layer(LayerKind::River);
        const auto& biome = terrain.layer(LayerKind::Biome);
        const auto& city = terrain.layer(LayerKind::City);
        const auto& road = terrain.layer(LayerKind::Road);
        const int32_t dim = terrain.dimension();

        Grid<float> costs(dim, 0.0f);
        if (!city.sites().empty()) {
            costs = roadCostMap(inputsOf(terrain));
        }

        for (int32_t y = 0; y < dim; ++y) {
            for (int32_t x = 0; x < dim; ++x) {
                const bool water = sea.is(x, y, SeaCategory::Water) || river.is(x, y, RiverCategory::Water);
                EXPECT_EQ(biome.is(x, y, BiomeCategory::Water), water);
                EXPECT_FALSE(sea.is(x, y, SeaCategory::Water) && river.is(x, y, RiverCategory::Water));

                if (city.is(x, y, CityCategory::Site)) {
                    EXPECT_FALSE(water);
                    EXPECT_FALSE(biome.is(x, y, BiomeCategory::Forest));
                    EXPECT_FALSE(biome.is(x, y, BiomeCategory::Mountain));
                }
                if (road.is(x, y, RoadCategory::Road)) {
                    EXPECT_FALSE(sea.is(x, y, SeaCategory::Water));
                    EXPECT_TRUE(std::isfinite(costs(x, y)));
                }
            }
        }

        const int32_t spacing = citySpacing(dim, terrain.config().city);
        const auto& sites = city.sites();
        EXPECT_EQ(sites.size(), city.count(CityCategory::Site));
        for (size_t i = 0; i < sites.size(); ++i) {
            for (size_t j = i + 1; j < sites.size(); ++j) {
                glm::ivec2 d = sites[i] - sites[j];
                EXPECT_GE(d.x * d.x + d.y * d.y, spacing * spacing);
            }
        }

        for (const auto& path : road.roads()) {
            EXPECT_TRUE(city.is(path.from.x, path.from.y, CityCategory::Site));
            EXPECT_TRUE(city.is(path.to.x, path.to.y, CityCategory::Site));
        }
    }
}

TEST(TerrainTest, GeneratedSeaIsBorderConnected) {
    size_t totalWater = 0;
    for (uint64_t seed : {1u, 2u, 3u, 4u, 42u}) {
        auto terrain = Terrain::generate(seed, 48);
        const auto& sea = terrain.layer(LayerKind::Sea);
        const auto& config = terrain.config().sea;
        const Grid<uint8_t> reached = seaReachableFromBorder(sea);

        Grid<uint8_t> water(terrain.dimension(), 0);
        for (size_t i = 0; i < water.cellCount(); ++i) {
            water[i] = sea.categories()[i] == SeaCategory::Water ? 1 : 0;
            if (water[i]) {
                EXPECT_TRUE(reached[i]) << "seed " << seed << " cell " << i;
                EXPECT_LE(terrain.heightmap().values()[i], config.threshold);
            }
        }

        std::vector<size_t> sizes;
        (void)labelComponents(water, sizes);
        for (size_t size : sizes) {
            EXPECT_GE(size, static_cast<size_t>(config.minSize)) << "seed " << seed;
        }
        totalWater += sea.count(SeaCategory::Water);
    }
    EXPECT_GT(totalWater, 0u);
}

TEST(TerrainTest, SingleCellMap) {
    auto terrain = Terrain::generate(0, 1);
    EXPECT_EQ(terrain.dimension(), 1);
    EXPECT_FLOAT_EQ(terrain.elevation(0, 0), 0.0f);

    for (LayerKind kind : GENERATION_ORDER) {
        EXPECT_EQ(terrain.tileCode(kind, 0, 0), TileCode::Solid) << layerKindName(kind);
    }
    EXPECT_EQ(terrain.category(LayerKind::Sea, 0, 0), SeaCategory::Land);
    EXPECT_EQ(terrain.category(LayerKind::Biome, 0, 0), BiomeCategory::Beach);

    // River, city and road cannot be placed on one cell
    EXPECT_EQ(terrain.warnings().size(), 3u);
}

TEST(TerrainTest, UnsatisfiableLayerBecomesEmptyWithWarning) {
    GenerationConfig config;
    config.city.minLandSegment = 1000000;

    auto terrain = Terrain::generate(42, 64, config);

    ASSERT_EQ(terrain.warnings().size(), 2u);
    EXPECT_EQ(terrain.warnings()[0].rfind("city layer left empty", 0), 0u);
    EXPECT_EQ(terrain.warnings()[1].rfind("road layer left empty", 0), 0u);

    const auto& city = terrain.layer(LayerKind::City);
    EXPECT_EQ(city.count(CityCategory::Site), 0u);
    EXPECT_TRUE(city.sites().empty());
    EXPECT_EQ(terrain.tileCode(LayerKind::City, 10, 10), TileCode::Solid);
    EXPECT_EQ(terrain.layer(LayerKind::Road).count(RoadCategory::Road), 0u);
}

// ============================================================================
// Dimension and config checks
// ============================================================================

TEST(TerrainTest, InvalidDimensions) {
    for (int64_t dim : {int64_t{0}, int64_t{-1}, int64_t{4097}}) {
        try {
            (void)Terrain::generate(1, dim);
            FAIL() << "dimension " << dim << " accepted";
        } catch (const InvalidDimension& e) {
            EXPECT_EQ(e.dimension(), dim);
        }
    }
}

TEST(TerrainTest, MaxDimensionFromConfig) {
    GenerationConfig config;
    config.maxDimension = 32;
    EXPECT_THROW((void)Terrain::generate(1, 33, config), InvalidDimension);
    EXPECT_NO_THROW((void)Terrain::generate(1, 32, config));
}

TEST(TerrainTest, InvalidConfigRejected) {
    GenerationConfig config;
    config.sea.threshold = 0.9f;
    try {
        (void)Terrain::generate(1, 16, config);
        FAIL() << "invalid config accepted";
    } catch (const InvalidDimension&) {
        FAIL() << "reported as a dimension error";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("sea.threshold"), std::string::npos) << e.what();
    }
}

// ============================================================================
// Assembly from stored parts
// ============================================================================

TEST(TerrainTest, FromPartsMatchesGenerated) {
    auto generated = Terrain::generate(11, 40);
    auto assembled = Terrain::fromParts(generated.seed(), generated.config(), generated.heightmap(),
                                        copyLayers(generated));

    EXPECT_FALSE(generated.firstDifference(assembled).has_value());
    EXPECT_EQ(assembled.layer(LayerKind::City).sites(), generated.layer(LayerKind::City).sites());
    EXPECT_TRUE(assembled.timings().empty());
}

TEST(TerrainTest, FromPartsRejectsMisplacedLayer) {
    auto generated = Terrain::generate(11, 24);
    auto layers = copyLayers(generated);
    std::swap(layers[layerIndex(LayerKind::Sea)], layers[layerIndex(LayerKind::River)]);

    EXPECT_THROW((void)Terrain::fromParts(11, generated.config(), generated.heightmap(), layers),
                 std::invalid_argument);
}

TEST(TerrainTest, FromPartsRejectsDimensionMismatch) {
    auto generated = Terrain::generate(11, 24);
    auto layers = copyLayers(generated);
    layers[layerIndex(LayerKind::Road)] = TerrainLayer::empty(LayerKind::Road, 12);

    EXPECT_THROW((void)Terrain::fromParts(11, generated.config(), generated.heightmap(), layers),
                 std::invalid_argument);
}

TEST(TerrainTest, FirstDifferenceNamesGrid) {
    auto generated = Terrain::generate(5, 24);
    auto layers = copyLayers(generated);
    auto& road = layers[layerIndex(LayerKind::Road)];
    road.setCategory(0, 0, road.category(0, 0) == RoadCategory::Road ? RoadCategory::None
                                                                      : RoadCategory::Road);

    auto changed = Terrain::fromParts(5, generated.config(), generated.heightmap(), layers);
    auto difference = generated.firstDifference(changed);
    ASSERT_TRUE(difference.has_value());
    EXPECT_EQ(*difference, "road.categories");
}

// ============================================================================
// Text renderings
// ============================================================================

TEST(TerrainDumpTest, LayoutOfDump) {
    auto terrain = Terrain::generate(42, 8);
    std::string dump = dumpTerrain(terrain);

    EXPECT_EQ(dump.rfind("terrain seed=42 dimension=8\nheightmap\n", 0), 0u);
    for (LayerKind kind : GENERATION_ORDER) {
        std::string name(layerKindName(kind));
        EXPECT_NE(dump.find("\n" + name + " categories\n"), std::string::npos) << name;
        EXPECT_NE(dump.find("\n" + name + " tiles\n"), std::string::npos) << name;
    }
}

TEST(TerrainDumpTest, OverviewIsSquare) {
    auto terrain = Terrain::generate(42, 20);
    std::string overview = renderOverview(terrain);

    std::istringstream lines(overview);
    std::string line;
    int rows = 0;
    while (std::getline(lines, line)) {
        EXPECT_EQ(line.size(), 20u);
        ++rows;
    }
    EXPECT_EQ(rows, 20);

    // Cities are drawn on top of everything
    for (const auto& site : terrain.layer(LayerKind::City).sites()) {
        EXPECT_EQ(overview[static_cast<size_t>(site.y) * 21 + static_cast<size_t>(site.x)], '@');
    }
}
