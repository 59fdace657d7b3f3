/**
 * @file tile_normalizer.hpp
 * @brief Autotile classification of categorical grids
 *
 * Each cell is compared with its four straight neighbors; a neighbor that is
 * out of bounds or has a different category "differs". The 4-bit differing
 * pattern selects a tile shape:
 *
 *   vertical edge   = first differing of (N, S)
 *   horizontal edge = first differing of (E, W)
 *   both            -> convex corner (e.g. N + E -> ConvexNE)
 *   one             -> straight edge
 *   none            -> solid, unless a diagonal differs (concave corner,
 *                      first of NE, SE, SW, NW)
 *
 * All four differing (an isolated cell) is Solid.
 */

#pragma once

#include "terratile/core/grid.hpp"

#include <array>
#include <cstdint>
#include <string_view>

namespace terratile::worldgen {

/// Layer-specific membership value (see terrain_layer.hpp for each layer's values)
using Category = uint8_t;

enum class TileCode : uint8_t {
    Solid = 0,
    EdgeN,
    EdgeE,
    EdgeS,
    EdgeW,
    ConvexNE,
    ConvexNW,
    ConvexSE,
    ConvexSW,
    ConcaveNE,
    ConcaveNW,
    ConcaveSE,
    ConcaveSW,
};

constexpr size_t TILE_CODE_COUNT = 13;

/// Bits of the differing-neighbor pattern
namespace NeighborBit {
constexpr uint8_t North = 1 << 0;
constexpr uint8_t East = 1 << 1;
constexpr uint8_t South = 1 << 2;
constexpr uint8_t West = 1 << 3;
}  // namespace NeighborBit

[[nodiscard]] std::string_view tileCodeName(TileCode code);

/// Single-character form used by text dumps ('.' solid, n/e/s/w edges,
/// A-D convex, a-d concave)
[[nodiscard]] char tileCodeSymbol(TileCode code);

class TileNormalizer {
public:
    /// Tile for a 4-bit differing pattern (NeighborBit flags), before the
    /// concave check. Defined for all 16 patterns.
    [[nodiscard]] static TileCode classifyPattern(uint8_t differing);

    /// Differing pattern of cell (x, y) against its own category
    [[nodiscard]] static uint8_t differingPattern(const Grid<Category>& categories,
                                                  int32_t x, int32_t y);

    /// Full classification of one cell, including concave corners
    [[nodiscard]] static TileCode classifyCell(const Grid<Category>& categories,
                                               int32_t x, int32_t y);

    /// Tile code for every cell
    [[nodiscard]] static Grid<TileCode> normalize(const Grid<Category>& categories);

private:
    static const std::array<TileCode, 16> PATTERN_TABLE;
};

}  // namespace terratile::worldgen
