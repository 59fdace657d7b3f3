#include "terratile/worldgen/terrain_layer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace terratile::worldgen {

std::string_view layerKindName(LayerKind kind) {
    switch (kind) {
        case LayerKind::Sea: return "sea";
        case LayerKind::River: return "river";
        case LayerKind::Biome: return "biome";
        case LayerKind::Road: return "road";
        case LayerKind::City: return "city";
    }
    return "unknown";
}

std::optional<LayerKind> parseLayerKind(std::string_view name) {
    for (LayerKind kind : GENERATION_ORDER) {
        if (layerKindName(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

std::string_view riverTerminationName(RiverTermination termination) {
    switch (termination) {
        case RiverTermination::MapEdge: return "map-edge";
        case RiverTermination::Sea: return "sea";
        case RiverTermination::Confluence: return "confluence";
        case RiverTermination::LocalMinimum: return "local-minimum";
    }
    return "unknown";
}

// ============================================================================
// TerrainLayer
// ============================================================================

TerrainLayer::TerrainLayer(LayerKind kind, Grid<Category> categories)
    : kind_(kind), categories_(std::move(categories)) {
    const Category limit = categoryCount(kind);
    for (Category value : categories_.cells()) {
        if (value >= limit) {
            throw std::invalid_argument("Category " + std::to_string(value) + " is not valid for the " +
                                        std::string(layerKindName(kind)) + " layer");
        }
    }
}

TerrainLayer TerrainLayer::empty(LayerKind kind, int32_t dimension) {
    TerrainLayer layer(kind, Grid<Category>(dimension, 0));
    layer.normalize();
    return layer;
}

void TerrainLayer::normalize() {
    tiles_ = TileNormalizer::normalize(categories_);
    normalized_ = true;
}

void TerrainLayer::setCategory(int32_t x, int32_t y, Category value) {
    if (value >= categoryCount(kind_)) {
        throw std::invalid_argument("Category " + std::to_string(value) + " is not valid for the " +
                                    std::string(layerKindName(kind_)) + " layer");
    }
    categories_.at(x, y) = value;
    normalized_ = false;
}

TileCode TerrainLayer::tileCode(int32_t x, int32_t y) const {
    if (!normalized_) {
        throw std::logic_error("Layer '" + std::string(layerKindName(kind_)) + "' is not normalized");
    }
    return tiles_.at(x, y);
}

size_t TerrainLayer::count(Category value) const {
    return static_cast<size_t>(std::count(categories_.cells().begin(), categories_.cells().end(), value));
}

bool TerrainLayer::adjacentTo(int32_t x, int32_t y, Category value, bool diagonals) const {
    auto check = [&](const auto& offsets) {
        for (const auto& offset : offsets) {
            int32_t nx = x + offset.dx;
            int32_t ny = y + offset.dy;
            if (categories_.contains(nx, ny) && categories_(nx, ny) == value) {
                return true;
            }
        }
        return false;
    };
    return diagonals ? check(NEIGHBORS_8) : check(NEIGHBORS_4);
}

}  // namespace terratile::worldgen
