/**
 * @file map_io.cpp
 * @brief Map CBOR serialization and LZ4-compressed file I/O
 */

#include "terratile/worldgen/map_io.hpp"
#include "terratile/core/cbor.hpp"
#include "terratile/core/errors.hpp"
#include "terratile/core/log.hpp"

#include <lz4.h>

#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace terratile::worldgen {

namespace {

constexpr uint8_t MAP_MAGIC[4] = {'T', 'T', 'M', 'P'};
constexpr int64_t FORMAT_VERSION = 1;
constexpr size_t HEADER_SIZE = 12;

// Largest payload a valid file can hold (4096^2 heights plus all layers)
constexpr uint32_t MAX_PAYLOAD_SIZE = 512u * 1024u * 1024u;

void writeU32LE(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

uint32_t readU32LE(std::span<const uint8_t> bytes, size_t offset) {
    uint32_t value = 0;
    for (int i = 3; i >= 0; --i) {
        value = (value << 8) | bytes[offset + static_cast<size_t>(i)];
    }
    return value;
}

std::vector<uint8_t> encodeHeights(const Grid<float>& heights) {
    std::vector<uint8_t> bytes;
    bytes.reserve(heights.cellCount() * 4);
    for (float value : heights.cells()) {
        uint32_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        for (int i = 3; i >= 0; --i) {
            bytes.push_back(static_cast<uint8_t>(bits >> (i * 8)));
        }
    }
    return bytes;
}

/// Cells in a dimension x dimension grid
size_t squareCells(int32_t dimension) {
    return static_cast<size_t>(dimension) * static_cast<size_t>(dimension);
}

Grid<float> decodeHeights(const std::vector<uint8_t>& bytes, int32_t dimension) {
    // Size check before allocating, so a bogus dimension cannot exhaust memory
    if (bytes.size() != squareCells(dimension) * 4) {
        throw MapFormatError("Map heights hold " + std::to_string(bytes.size()) + " bytes, expected " +
                             std::to_string(squareCells(dimension) * 4));
    }
    Grid<float> heights(dimension, 0.0f);
    for (size_t i = 0; i < heights.cellCount(); ++i) {
        uint32_t bits = 0;
        for (size_t b = 0; b < 4; ++b) {
            bits = (bits << 8) | bytes[i * 4 + b];
        }
        float value = 0.0f;
        std::memcpy(&value, &bits, sizeof(value));
        heights[i] = value;
    }
    return heights;
}

template<typename T>
std::vector<uint8_t> gridBytes(const Grid<T>& grid) {
    std::vector<uint8_t> bytes;
    bytes.reserve(grid.cellCount());
    for (T value : grid.cells()) {
        bytes.push_back(static_cast<uint8_t>(value));
    }
    return bytes;
}

/// Stored layer, before it is checked and assembled
struct StoredLayer {
    std::string kind;
    std::vector<uint8_t> categories;
    std::vector<uint8_t> tiles;
};

StoredLayer readLayer(cbor::Decoder& decoder) {
    StoredLayer stored;
    uint64_t fields = decoder.expect(cbor::MAP, "layer");
    for (uint64_t i = 0; i < fields; ++i) {
        std::string key = decoder.readString();
        if (key == "kind") {
            stored.kind = decoder.readString();
        } else if (key == "categories") {
            stored.categories = decoder.readBytes();
        } else if (key == "tiles") {
            stored.tiles = decoder.readBytes();
        } else {
            decoder.skipValue();
        }
    }
    return stored;
}

TerrainLayer restoreLayer(const StoredLayer& stored, int32_t dimension) {
    auto kind = parseLayerKind(stored.kind);
    if (!kind) {
        throw MapFormatError("Unknown layer kind '" + stored.kind + "'");
    }

    if (stored.categories.size() != squareCells(dimension)) {
        throw MapFormatError("Layer '" + stored.kind + "' has the wrong number of cells");
    }
    Grid<Category> categories(dimension, 0);
    for (size_t i = 0; i < categories.cellCount(); ++i) {
        categories[i] = stored.categories[i];
    }

    TerrainLayer layer;
    try {
        layer = TerrainLayer(*kind, std::move(categories));
    } catch (const std::invalid_argument& e) {
        throw MapFormatError(e.what());
    }
    layer.normalize();

    if (stored.tiles != gridBytes(layer.tiles())) {
        throw MapFormatError("Layer '" + stored.kind + "' tile codes do not match its categories");
    }
    return layer;
}

}  // namespace

std::string_view mapSaveModeName(MapSaveMode mode) {
    switch (mode) {
        case MapSaveMode::Seed: return "seed";
        case MapSaveMode::Full: return "full";
    }
    return "seed";
}

std::optional<MapSaveMode> parseMapSaveMode(std::string_view name) {
    if (name == "seed") return MapSaveMode::Seed;
    if (name == "full") return MapSaveMode::Full;
    return std::nullopt;
}

// ============================================================================
// Serialization
// ============================================================================

std::vector<uint8_t> serializeMap(const Terrain& terrain, MapSaveMode mode) {
    if (terrain.empty()) {
        throw std::invalid_argument("Cannot serialize an empty terrain");
    }

    std::vector<uint8_t> out;
    out.reserve(mode == MapSaveMode::Full ? terrain.heightmap().values().cellCount() * 15 + 1024 : 2048);

    cbor::encodeMapHeader(out, mode == MapSaveMode::Full ? 7 : 5);

    cbor::encodeString(out, "version");
    cbor::encodeInt(out, FORMAT_VERSION);

    cbor::encodeString(out, "seed");
    cbor::encodeUnsigned(out, terrain.seed());

    cbor::encodeString(out, "dimension");
    cbor::encodeInt(out, terrain.dimension());

    cbor::encodeString(out, "config");
    cbor::encodeString(out, terrain.config().toConfigText());

    cbor::encodeString(out, "mode");
    cbor::encodeString(out, mapSaveModeName(mode));

    if (mode == MapSaveMode::Full) {
        cbor::encodeString(out, "heights");
        cbor::encodeBytes(out, encodeHeights(terrain.heightmap().values()));

        cbor::encodeString(out, "layers");
        cbor::encodeArrayHeader(out, LAYER_KIND_COUNT);
        for (LayerKind kind : GENERATION_ORDER) {
            const TerrainLayer& layer = terrain.layer(kind);
            cbor::encodeMapHeader(out, 3);
            cbor::encodeString(out, "kind");
            cbor::encodeString(out, layerKindName(kind));
            cbor::encodeString(out, "categories");
            cbor::encodeBytes(out, gridBytes(layer.categories()));
            cbor::encodeString(out, "tiles");
            cbor::encodeBytes(out, gridBytes(layer.tiles()));
        }
    }

    return out;
}

// ============================================================================
// Deserialization
// ============================================================================

Terrain deserializeMap(std::span<const uint8_t> data) {
    cbor::Decoder decoder(data);
    uint64_t fields = decoder.expect(cbor::MAP, "map payload");

    std::optional<int64_t> version;
    std::optional<uint64_t> seed;
    std::optional<int64_t> dimension;
    std::optional<std::string> configText;
    std::optional<std::string> modeName;
    std::vector<uint8_t> heightBytes;
    std::vector<StoredLayer> storedLayers;

    for (uint64_t i = 0; i < fields; ++i) {
        std::string key = decoder.readString();
        if (key == "version") {
            version = decoder.readInt();
        } else if (key == "seed") {
            seed = decoder.expect(cbor::UNSIGNED_INT, "seed");
        } else if (key == "dimension") {
            dimension = decoder.readInt();
        } else if (key == "config") {
            configText = decoder.readString();
        } else if (key == "mode") {
            modeName = decoder.readString();
        } else if (key == "heights") {
            heightBytes = decoder.readBytes();
        } else if (key == "layers") {
            uint64_t count = decoder.expect(cbor::ARRAY, "layers");
            if (count != LAYER_KIND_COUNT) {
                throw MapFormatError("Map holds " + std::to_string(count) + " layers, expected " +
                                     std::to_string(LAYER_KIND_COUNT));
            }
            for (uint64_t l = 0; l < count; ++l) {
                storedLayers.push_back(readLayer(decoder));
            }
        } else {
            decoder.skipValue();
        }
    }

    if (!version || !seed || !dimension || !configText || !modeName) {
        throw MapFormatError("Map payload is missing a required field");
    }
    if (*version != FORMAT_VERSION) {
        throw MapFormatError("Unsupported map format version " + std::to_string(*version));
    }

    auto mode = parseMapSaveMode(*modeName);
    if (!mode) {
        throw MapFormatError("Unknown map save mode '" + *modeName + "'");
    }

    GenerationConfig config;
    try {
        config = GenerationConfig::fromText(*configText);
        Terrain::validateDimension(*dimension, config);
    } catch (const std::invalid_argument& e) {
        throw MapFormatError(std::string("Map header rejected: ") + e.what());
    }

    if (*mode == MapSaveMode::Seed) {
        return Terrain::generate(*seed, *dimension, config);
    }

    const auto dim = static_cast<int32_t>(*dimension);
    if (storedLayers.empty()) {
        throw MapFormatError("Full map has no layers");
    }

    Terrain::LayerSet layers;
    for (const auto& stored : storedLayers) {
        TerrainLayer layer = restoreLayer(stored, dim);
        const LayerKind kind = layer.kind();
        layers[layerIndex(kind)] = std::move(layer);
    }

    try {
        HeightMap heightmap(decodeHeights(heightBytes, dim));
        return Terrain::fromParts(*seed, config, std::move(heightmap), std::move(layers));
    } catch (const std::invalid_argument& e) {
        throw MapFormatError(std::string("Map grids rejected: ") + e.what());
    }
}

// ============================================================================
// File image
// ============================================================================

std::vector<uint8_t> encodeMapFile(const Terrain& terrain, MapSaveMode mode) {
    auto cborData = serializeMap(terrain, mode);

    int maxCompressed = LZ4_compressBound(static_cast<int>(cborData.size()));
    std::vector<uint8_t> compressed(static_cast<size_t>(maxCompressed));

    int compressedSize = LZ4_compress_default(
        reinterpret_cast<const char*>(cborData.data()),
        reinterpret_cast<char*>(compressed.data()),
        static_cast<int>(cborData.size()),
        maxCompressed);

    if (compressedSize <= 0) {
        throw std::runtime_error("LZ4 compression failed");
    }

    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + static_cast<size_t>(compressedSize));
    out.insert(out.end(), std::begin(MAP_MAGIC), std::end(MAP_MAGIC));
    writeU32LE(out, static_cast<uint32_t>(cborData.size()));
    writeU32LE(out, static_cast<uint32_t>(compressedSize));
    out.insert(out.end(), compressed.begin(), compressed.begin() + compressedSize);
    return out;
}

Terrain decodeMapFile(std::span<const uint8_t> bytes) {
    if (bytes.size() < HEADER_SIZE) {
        throw MapFormatError("Map file too small");
    }
    if (std::memcmp(bytes.data(), MAP_MAGIC, sizeof(MAP_MAGIC)) != 0) {
        throw MapFormatError("Invalid map file magic");
    }

    uint32_t uncompressedSize = readU32LE(bytes, 4);
    uint32_t compressedSize = readU32LE(bytes, 8);

    if (uncompressedSize == 0 || uncompressedSize > MAX_PAYLOAD_SIZE) {
        throw MapFormatError("Map payload size " + std::to_string(uncompressedSize) + " is out of range");
    }
    if (compressedSize > bytes.size() - HEADER_SIZE) {
        throw MapFormatError("Map file truncated: expected " + std::to_string(compressedSize) +
                             " compressed bytes, found " + std::to_string(bytes.size() - HEADER_SIZE));
    }

    std::vector<uint8_t> cborData(uncompressedSize);
    int result = LZ4_decompress_safe(
        reinterpret_cast<const char*>(bytes.data() + HEADER_SIZE),
        reinterpret_cast<char*>(cborData.data()),
        static_cast<int>(compressedSize),
        static_cast<int>(uncompressedSize));

    if (result < 0 || static_cast<uint32_t>(result) != uncompressedSize) {
        throw MapFormatError("LZ4 decompression failed");
    }

    return deserializeMap(cborData);
}

// ============================================================================
// File I/O
// ============================================================================

void saveMap(const Terrain& terrain, const std::filesystem::path& path, MapSaveMode mode) {
    auto image = encodeMapFile(terrain, mode);

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    file.write(reinterpret_cast<const char*>(image.data()), static_cast<std::streamsize>(image.size()));
    if (!file) {
        throw std::runtime_error("Failed to write map file: " + path.string());
    }

    Log::info("MapIO", "Saved " + std::string(mapSaveModeName(mode)) + " map to " + path.string() +
                           " (" + std::to_string(image.size()) + " bytes)");
}

Terrain loadMap(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open map file: " + path.string());
    }

    std::vector<uint8_t> image((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    Terrain terrain = decodeMapFile(image);

    Log::info("MapIO", "Loaded " + std::to_string(terrain.dimension()) + "x" +
                           std::to_string(terrain.dimension()) + " map from " + path.string());
    return terrain;
}

}  // namespace terratile::worldgen
