/**
 * @file terrain_dump.hpp
 * @brief Text renderings of a terrain
 */

#pragma once

#include "terratile/worldgen/terrain.hpp"

#include <string>

namespace terratile::worldgen {

/// Every grid in a stable line-oriented form: elevations in shortest
/// round-trip decimal, categories as digits, tile codes as tileCodeSymbol().
/// Two terrains dump identically exactly when their grids are identical.
[[nodiscard]] std::string dumpTerrain(const Terrain& terrain);

/// One character per cell, top layer in draw order wins:
///   '@' city  '#' road  '~' sea  '=' river
///   '^' mountain  'T' forest  ':' desert  ',' beach  '.' plains
[[nodiscard]] std::string renderOverview(const Terrain& terrain);

}  // namespace terratile::worldgen
