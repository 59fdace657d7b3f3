/**
 * @file map_io.hpp
 * @brief Map serialization (CBOR) and LZ4-compressed file I/O
 *
 * File format: magic "TTMP" (4 bytes) + uncompressed size (4 bytes LE)
 * + compressed size (4 bytes LE) + LZ4-compressed CBOR payload.
 *
 * Payload (CBOR map):
 *   version    int
 *   seed       uint
 *   dimension  int
 *   config     text (GenerationConfig::toConfigText)
 *   mode       "seed" | "full"
 *   heights    bytes, float32 big-endian, row-major     (full only)
 *   layers     [{kind, categories, tiles}, ...]          (full only)
 *
 * A seed-mode map reloads by regenerating, which relies on generation being
 * bit-reproducible. A full-mode map restores the grids as stored; tile codes
 * are checked against their categories.
 *
 * Corrupt, truncated or unsupported data throws MapFormatError; failure to
 * open or write a file throws std::runtime_error.
 */

#pragma once

#include "terratile/worldgen/terrain.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace terratile::worldgen {

enum class MapSaveMode : uint8_t {
    Seed,   ///< Seed, dimension and config only
    Full,   ///< Every grid materialized
};

[[nodiscard]] std::string_view mapSaveModeName(MapSaveMode mode);
[[nodiscard]] std::optional<MapSaveMode> parseMapSaveMode(std::string_view name);

/// CBOR payload only (no magic or compression)
[[nodiscard]] std::vector<uint8_t> serializeMap(const Terrain& terrain, MapSaveMode mode);
[[nodiscard]] Terrain deserializeMap(std::span<const uint8_t> data);

/// Complete file image: header plus compressed payload
[[nodiscard]] std::vector<uint8_t> encodeMapFile(const Terrain& terrain, MapSaveMode mode);
[[nodiscard]] Terrain decodeMapFile(std::span<const uint8_t> bytes);

void saveMap(const Terrain& terrain, const std::filesystem::path& path, MapSaveMode mode);
[[nodiscard]] Terrain loadMap(const std::filesystem::path& path);

}  // namespace terratile::worldgen
