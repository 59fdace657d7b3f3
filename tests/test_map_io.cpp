/**
 * @file test_map_io.cpp
 * @brief Map save/load in seed and full modes, and rejection of bad files
 */

#include "terratile/worldgen/map_io.hpp"
#include "terratile/core/cbor.hpp"
#include "terratile/core/errors.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace terratile;
using namespace terratile::worldgen;

namespace {

class MapIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "terratile_map_io_test";
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;
};

/// Payload fields a test may want to change before encoding
struct PayloadSpec {
    int64_t version = 1;
    std::string mode = "full";
    float heightFill = 0.5f;
    bool corruptTiles = false;
    bool omitSeed = false;
    int64_t declaredDimension = 0;  ///< Header dimension; 0 means the real one
    std::string configText;         ///< Empty means the default config
};

/// Hand-written full-mode payload: flat heights, every layer at its default
/// category with matching tiles
std::vector<uint8_t> handPayload(int32_t dim, const PayloadSpec& spec) {
    std::vector<uint8_t> out;
    cbor::encodeMapHeader(out, spec.omitSeed ? 6 : 7);

    cbor::encodeString(out, "version");
    cbor::encodeInt(out, spec.version);
    if (!spec.omitSeed) {
        cbor::encodeString(out, "seed");
        cbor::encodeUnsigned(out, 99);
    }
    cbor::encodeString(out, "dimension");
    cbor::encodeInt(out, spec.declaredDimension != 0 ? spec.declaredDimension : dim);
    cbor::encodeString(out, "config");
    cbor::encodeString(out, spec.configText.empty() ? GenerationConfig{}.toConfigText() : spec.configText);
    cbor::encodeString(out, "mode");
    cbor::encodeString(out, spec.mode);

    std::vector<uint8_t> heights;
    uint32_t bits = 0;
    std::memcpy(&bits, &spec.heightFill, sizeof(bits));
    for (int32_t i = 0; i < dim * dim; ++i) {
        for (int b = 3; b >= 0; --b) {
            heights.push_back(static_cast<uint8_t>(bits >> (b * 8)));
        }
    }
    cbor::encodeString(out, "heights");
    cbor::encodeBytes(out, heights);

    cbor::encodeString(out, "layers");
    cbor::encodeArrayHeader(out, LAYER_KIND_COUNT);
    for (LayerKind kind : GENERATION_ORDER) {
        auto layer = TerrainLayer::empty(kind, dim);
        std::vector<uint8_t> categories(layer.categories().cells().begin(), layer.categories().cells().end());
        std::vector<uint8_t> tiles;
        for (TileCode code : layer.tiles().cells()) {
            tiles.push_back(static_cast<uint8_t>(code));
        }
        if (spec.corruptTiles && kind == LayerKind::Biome) {
            tiles[0] = static_cast<uint8_t>(TileCode::ConcaveSW);
        }

        cbor::encodeMapHeader(out, 3);
        cbor::encodeString(out, "kind");
        cbor::encodeString(out, layerKindName(kind));
        cbor::encodeString(out, "categories");
        cbor::encodeBytes(out, categories);
        cbor::encodeString(out, "tiles");
        cbor::encodeBytes(out, tiles);
    }
    return out;
}

}  // namespace

// ============================================================================
// Round trips
// ============================================================================

TEST_F(MapIOTest, SeedModeRegenerates) {
    GenerationConfig config;
    config.sea.threshold = 0.33f;
    config.city.density = 0.01f;
    auto original = Terrain::generate(1234, 48, config);

    auto path = tempDir_ / "seed.ttmap";
    saveMap(original, path, MapSaveMode::Seed);
    auto loaded = loadMap(path);

    EXPECT_EQ(loaded.seed(), 1234u);
    EXPECT_EQ(loaded.dimension(), 48);
    EXPECT_EQ(loaded.config(), config);
    EXPECT_FALSE(original.firstDifference(loaded).has_value());
}

TEST_F(MapIOTest, FullModeRestoresGrids) {
    auto original = Terrain::generate(77, 40);

    auto path = tempDir_ / "full.ttmap";
    saveMap(original, path, MapSaveMode::Full);
    auto loaded = loadMap(path);

    EXPECT_EQ(loaded.seed(), 77u);
    EXPECT_FALSE(original.firstDifference(loaded).has_value());
    EXPECT_EQ(loaded.layer(LayerKind::City).sites(), original.layer(LayerKind::City).sites());
}

TEST_F(MapIOTest, SeedModeIsSmaller) {
    auto terrain = Terrain::generate(5, 64);
    auto seedImage = encodeMapFile(terrain, MapSaveMode::Seed);
    auto fullImage = encodeMapFile(terrain, MapSaveMode::Full);
    EXPECT_LT(seedImage.size(), fullImage.size());
}

TEST_F(MapIOTest, FullModeDoesNotRegenerate) {
    auto terrain = deserializeMap(handPayload(6, {}));

    EXPECT_EQ(terrain.seed(), 99u);
    EXPECT_EQ(terrain.dimension(), 6);
    for (float v : terrain.heightmap().values().cells()) {
        EXPECT_FLOAT_EQ(v, 0.5f);
    }
    EXPECT_EQ(terrain.layer(LayerKind::Sea).count(SeaCategory::Land), 36u);
    EXPECT_TRUE(terrain.layer(LayerKind::City).sites().empty());
}

TEST_F(MapIOTest, FileImageHeader) {
    auto image = encodeMapFile(Terrain::generate(1, 8), MapSaveMode::Seed);
    ASSERT_GE(image.size(), 12u);
    EXPECT_EQ(std::memcmp(image.data(), "TTMP", 4), 0);

    uint32_t compressed = static_cast<uint32_t>(image[8]) | (static_cast<uint32_t>(image[9]) << 8) |
                          (static_cast<uint32_t>(image[10]) << 16) | (static_cast<uint32_t>(image[11]) << 24);
    EXPECT_EQ(compressed, image.size() - 12);
}

TEST_F(MapIOTest, SaveModeNames) {
    EXPECT_EQ(mapSaveModeName(MapSaveMode::Full), "full");
    EXPECT_EQ(parseMapSaveMode("seed"), MapSaveMode::Seed);
    EXPECT_FALSE(parseMapSaveMode("partial").has_value());
}

// ============================================================================
// Rejection
// ============================================================================

TEST_F(MapIOTest, EmptyTerrainCannotBeSaved) {
    EXPECT_THROW((void)serializeMap(Terrain{}, MapSaveMode::Seed), std::invalid_argument);
}

TEST_F(MapIOTest, BadMagic) {
    auto image = encodeMapFile(Terrain::generate(1, 8), MapSaveMode::Seed);
    image[0] = 'X';
    EXPECT_THROW((void)decodeMapFile(image), MapFormatError);
}

TEST_F(MapIOTest, TooSmall) {
    std::vector<uint8_t> image = {'T', 'T', 'M', 'P', 1, 0};
    EXPECT_THROW((void)decodeMapFile(image), MapFormatError);
}

TEST_F(MapIOTest, Truncated) {
    auto image = encodeMapFile(Terrain::generate(1, 8), MapSaveMode::Full);
    image.resize(image.size() - 10);
    EXPECT_THROW((void)decodeMapFile(image), MapFormatError);
}

TEST_F(MapIOTest, CorruptCompressedData) {
    auto image = encodeMapFile(Terrain::generate(1, 8), MapSaveMode::Full);
    // Claim a larger payload than the block decompresses to
    image[4] = static_cast<uint8_t>(image[4] + 1);
    EXPECT_THROW((void)decodeMapFile(image), MapFormatError);
}

TEST_F(MapIOTest, UnsupportedVersion) {
    PayloadSpec spec;
    spec.version = 2;
    EXPECT_THROW((void)deserializeMap(handPayload(4, spec)), MapFormatError);
}

TEST_F(MapIOTest, UnknownMode) {
    PayloadSpec spec;
    spec.mode = "partial";
    EXPECT_THROW((void)deserializeMap(handPayload(4, spec)), MapFormatError);
}

TEST_F(MapIOTest, MissingField) {
    PayloadSpec spec;
    spec.omitSeed = true;
    EXPECT_THROW((void)deserializeMap(handPayload(4, spec)), MapFormatError);
}

TEST_F(MapIOTest, TilesMustMatchCategories) {
    PayloadSpec spec;
    spec.corruptTiles = true;
    EXPECT_THROW((void)deserializeMap(handPayload(4, spec)), MapFormatError);
}

TEST_F(MapIOTest, HeightsOutOfRange) {
    PayloadSpec spec;
    spec.heightFill = 2.0f;
    EXPECT_THROW((void)deserializeMap(handPayload(4, spec)), MapFormatError);
}

TEST_F(MapIOTest, HeaderCannotRaiseDimensionCap) {
    PayloadSpec spec;
    spec.configText = "terrain.max_dimension: 2147483647\n";
    spec.declaredDimension = 2147483647;
    EXPECT_THROW((void)deserializeMap(handPayload(4, spec)), MapFormatError);

    spec.mode = "seed";
    EXPECT_THROW((void)deserializeMap(handPayload(4, spec)), MapFormatError);
}

TEST_F(MapIOTest, OversizedDimensionRejectedBeforeAllocation) {
    // Largest accepted dimension, but the grids only hold 4x4 cells
    PayloadSpec spec;
    spec.configText = "terrain.max_dimension: " + std::to_string(HARD_MAX_DIMENSION) + "\n";
    spec.declaredDimension = HARD_MAX_DIMENSION;
    EXPECT_THROW((void)deserializeMap(handPayload(4, spec)), MapFormatError);
}

TEST_F(MapIOTest, TruncatedPayload) {
    auto payload = handPayload(4, {});
    payload.resize(payload.size() / 2);
    EXPECT_THROW((void)deserializeMap(payload), MapFormatError);
}

TEST_F(MapIOTest, MissingFileIsRuntimeError) {
    EXPECT_THROW((void)loadMap(tempDir_ / "absent.ttmap"), std::runtime_error);
}

TEST_F(MapIOTest, UnwritablePathIsRuntimeError) {
    auto terrain = Terrain::generate(1, 8);
    EXPECT_THROW(saveMap(terrain, tempDir_ / "no_such_dir" / "map.ttmap", MapSaveMode::Seed),
                 std::runtime_error);
}
