#include "terratile/worldgen/tile_normalizer.hpp"

namespace terratile::worldgen {

// Indexed by the differing pattern (N=1, E=2, S=4, W=8)
const std::array<TileCode, 16> TileNormalizer::PATTERN_TABLE = {{
    TileCode::Solid,      // none
    TileCode::EdgeN,      // N
    TileCode::EdgeE,      // E
    TileCode::ConvexNE,   // N E
    TileCode::EdgeS,      // S
    TileCode::EdgeN,      // N S      (N before S)
    TileCode::ConvexSE,   // E S
    TileCode::ConvexNE,   // N E S
    TileCode::EdgeW,      // W
    TileCode::ConvexNW,   // N W
    TileCode::EdgeE,      // E W      (E before W)
    TileCode::ConvexNE,   // N E W
    TileCode::ConvexSW,   // S W
    TileCode::ConvexNW,   // N S W
    TileCode::ConvexSE,   // E S W
    TileCode::Solid,      // N E S W  (isolated)
}};

std::string_view tileCodeName(TileCode code) {
    switch (code) {
        case TileCode::Solid: return "solid";
        case TileCode::EdgeN: return "edge-N";
        case TileCode::EdgeE: return "edge-E";
        case TileCode::EdgeS: return "edge-S";
        case TileCode::EdgeW: return "edge-W";
        case TileCode::ConvexNE: return "convex-NE";
        case TileCode::ConvexNW: return "convex-NW";
        case TileCode::ConvexSE: return "convex-SE";
        case TileCode::ConvexSW: return "convex-SW";
        case TileCode::ConcaveNE: return "concave-NE";
        case TileCode::ConcaveNW: return "concave-NW";
        case TileCode::ConcaveSE: return "concave-SE";
        case TileCode::ConcaveSW: return "concave-SW";
    }
    return "unknown";
}

char tileCodeSymbol(TileCode code) {
    switch (code) {
        case TileCode::Solid: return '.';
        case TileCode::EdgeN: return 'n';
        case TileCode::EdgeE: return 'e';
        case TileCode::EdgeS: return 's';
        case TileCode::EdgeW: return 'w';
        case TileCode::ConvexNE: return 'A';
        case TileCode::ConvexNW: return 'B';
        case TileCode::ConvexSE: return 'C';
        case TileCode::ConvexSW: return 'D';
        case TileCode::ConcaveNE: return 'a';
        case TileCode::ConcaveNW: return 'b';
        case TileCode::ConcaveSE: return 'c';
        case TileCode::ConcaveSW: return 'd';
    }
    return '?';
}

TileCode TileNormalizer::classifyPattern(uint8_t differing) {
    return PATTERN_TABLE[differing & 0x0F];
}

uint8_t TileNormalizer::differingPattern(const Grid<Category>& categories, int32_t x, int32_t y) {
    const Category own = categories.at(x, y);
    uint8_t pattern = 0;
    for (size_t i = 0; i < NEIGHBORS_4.size(); ++i) {
        int32_t nx = x + NEIGHBORS_4[i].dx;
        int32_t ny = y + NEIGHBORS_4[i].dy;
        if (!categories.contains(nx, ny) || categories(nx, ny) != own) {
            pattern |= static_cast<uint8_t>(1u << i);
        }
    }
    return pattern;
}

TileCode TileNormalizer::classifyCell(const Grid<Category>& categories, int32_t x, int32_t y) {
    uint8_t pattern = differingPattern(categories, x, y);
    if (pattern != 0) {
        return classifyPattern(pattern);
    }

    // All straight neighbors share, so the cell is interior and every
    // diagonal is in bounds
    struct Diagonal {
        int32_t dx;
        int32_t dy;
        TileCode code;
    };
    static constexpr Diagonal DIAGONALS[] = {
        {1, -1, TileCode::ConcaveNE},
        {1, 1, TileCode::ConcaveSE},
        {-1, 1, TileCode::ConcaveSW},
        {-1, -1, TileCode::ConcaveNW},
    };

    const Category own = categories(x, y);
    for (const auto& diagonal : DIAGONALS) {
        if (categories(x + diagonal.dx, y + diagonal.dy) != own) {
            return diagonal.code;
        }
    }
    return TileCode::Solid;
}

Grid<TileCode> TileNormalizer::normalize(const Grid<Category>& categories) {
    if (categories.empty()) {
        return {};
    }

    Grid<TileCode> tiles(categories.dimension(), TileCode::Solid);
    for (int32_t y = 0; y < categories.dimension(); ++y) {
        for (int32_t x = 0; x < categories.dimension(); ++x) {
            tiles(x, y) = classifyCell(categories, x, y);
        }
    }
    return tiles;
}

}  // namespace terratile::worldgen
