#include "terratile/worldgen/terrain_dump.hpp"

#include <charconv>

namespace terratile::worldgen {

namespace {

void appendFloat(std::string& out, float value) {
    char buffer[32];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    out.append(buffer, result.ptr);
}

char biomeSymbol(Category biome) {
    switch (biome) {
        case BiomeCategory::Water: return '~';
        case BiomeCategory::Beach: return ',';
        case BiomeCategory::Plains: return '.';
        case BiomeCategory::Forest: return 'T';
        case BiomeCategory::Desert: return ':';
        case BiomeCategory::Mountain: return '^';
        default: return '?';
    }
}

}  // namespace

std::string dumpTerrain(const Terrain& terrain) {
    const int32_t dim = terrain.dimension();
    std::string out;

    out += "terrain seed=" + std::to_string(terrain.seed()) + " dimension=" + std::to_string(dim) + "\n";

    out += "heightmap\n";
    const Grid<float>& heights = terrain.heightmap().values();
    for (int32_t y = 0; y < dim; ++y) {
        for (int32_t x = 0; x < dim; ++x) {
            if (x > 0) out += ' ';
            appendFloat(out, heights(x, y));
        }
        out += '\n';
    }

    for (LayerKind kind : GENERATION_ORDER) {
        const TerrainLayer& layer = terrain.layer(kind);
        const std::string name(layerKindName(kind));

        out += name + " categories\n";
        for (int32_t y = 0; y < dim; ++y) {
            for (int32_t x = 0; x < dim; ++x) {
                out += static_cast<char>('0' + layer.categories()(x, y));
            }
            out += '\n';
        }

        out += name + " tiles\n";
        for (int32_t y = 0; y < dim; ++y) {
            for (int32_t x = 0; x < dim; ++x) {
                out += tileCodeSymbol(layer.tiles()(x, y));
            }
            out += '\n';
        }
    }
    return out;
}

std::string renderOverview(const Terrain& terrain) {
    const int32_t dim = terrain.dimension();
    std::string out;
    out.reserve(static_cast<size_t>(dim) * static_cast<size_t>(dim + 1));

    for (int32_t y = 0; y < dim; ++y) {
        for (int32_t x = 0; x < dim; ++x) {
            char symbol = biomeSymbol(terrain.category(LayerKind::Biome, x, y));
            if (terrain.category(LayerKind::Sea, x, y) == SeaCategory::Water) symbol = '~';
            if (terrain.category(LayerKind::River, x, y) == RiverCategory::Water) symbol = '=';
            if (terrain.category(LayerKind::Road, x, y) == RoadCategory::Road) symbol = '#';
            if (terrain.category(LayerKind::City, x, y) == CityCategory::Site) symbol = '@';
            out += symbol;
        }
        out += '\n';
    }
    return out;
}

}  // namespace terratile::worldgen
