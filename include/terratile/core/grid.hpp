/**
 * @file grid.hpp
 * @brief Dense fixed-size square grid addressed by (x, y)
 *
 * Every map grid (elevation, categories, tile codes, scratch buffers used by
 * the layer builders) is a Grid. Storage is row-major: index = y * dim + x.
 */

#pragma once

#include <glm/glm.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace terratile {

/// Cell coordinate on a map grid
using CellPos = glm::ivec2;

/// Step between neighboring cells. North is -y (row 0 is the top edge).
struct CellOffset {
    int32_t dx;
    int32_t dy;
};

/// 4-connected neighbors in N, E, S, W order
inline constexpr std::array<CellOffset, 4> NEIGHBORS_4 = {{
    {0, -1}, {1, 0}, {0, 1}, {-1, 0},
}};

/// 8-connected neighbors in N, NE, E, SE, S, SW, W, NW order
inline constexpr std::array<CellOffset, 8> NEIGHBORS_8 = {{
    {0, -1}, {1, -1}, {1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1},
}};

template<typename T>
class Grid {
public:
    Grid() = default;

    Grid(int32_t dimension, const T& fill)
        : dimension_(dimension) {
        if (dimension <= 0) {
            throw std::invalid_argument("Grid dimension must be positive");
        }
        cells_.assign(static_cast<size_t>(dimension) * static_cast<size_t>(dimension), fill);
    }

    explicit Grid(int32_t dimension) : Grid(dimension, T{}) {}

    // ---- Dimensions ----

    [[nodiscard]] int32_t dimension() const { return dimension_; }
    [[nodiscard]] size_t cellCount() const { return cells_.size(); }
    [[nodiscard]] bool empty() const { return cells_.empty(); }

    [[nodiscard]] bool contains(int32_t x, int32_t y) const {
        return x >= 0 && x < dimension_ && y >= 0 && y < dimension_;
    }
    [[nodiscard]] bool contains(CellPos pos) const { return contains(pos.x, pos.y); }

    [[nodiscard]] bool onBorder(int32_t x, int32_t y) const {
        return x == 0 || y == 0 || x == dimension_ - 1 || y == dimension_ - 1;
    }

    // ---- Checked access ----

    [[nodiscard]] T& at(int32_t x, int32_t y) {
        if (!contains(x, y)) {
            throw std::out_of_range("Grid::at out of bounds");
        }
        return cells_[index(x, y)];
    }

    [[nodiscard]] const T& at(int32_t x, int32_t y) const {
        if (!contains(x, y)) {
            throw std::out_of_range("Grid::at out of bounds");
        }
        return cells_[index(x, y)];
    }

    [[nodiscard]] T& at(CellPos pos) { return at(pos.x, pos.y); }
    [[nodiscard]] const T& at(CellPos pos) const { return at(pos.x, pos.y); }

    // ---- Unchecked access (callers guarantee bounds) ----

    [[nodiscard]] T& operator()(int32_t x, int32_t y) { return cells_[index(x, y)]; }
    [[nodiscard]] const T& operator()(int32_t x, int32_t y) const { return cells_[index(x, y)]; }

    [[nodiscard]] T& operator[](size_t i) { return cells_[i]; }
    [[nodiscard]] const T& operator[](size_t i) const { return cells_[i]; }

    [[nodiscard]] size_t index(int32_t x, int32_t y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(dimension_) + static_cast<size_t>(x);
    }
    [[nodiscard]] CellPos position(size_t i) const {
        return {static_cast<int32_t>(i % static_cast<size_t>(dimension_)),
                static_cast<int32_t>(i / static_cast<size_t>(dimension_))};
    }

    void fill(const T& value) { cells_.assign(cells_.size(), value); }

    [[nodiscard]] const std::vector<T>& cells() const { return cells_; }

    /// Iterate all cells in row-major order. func(int32_t x, int32_t y, const T& value)
    template<typename Func>
    void forEach(Func&& func) const {
        for (int32_t y = 0; y < dimension_; ++y) {
            for (int32_t x = 0; x < dimension_; ++x) {
                func(x, y, cells_[index(x, y)]);
            }
        }
    }

    [[nodiscard]] bool operator==(const Grid& other) const {
        return dimension_ == other.dimension_ && cells_ == other.cells_;
    }
    [[nodiscard]] bool operator!=(const Grid& other) const { return !(*this == other); }

private:
    int32_t dimension_ = 0;
    std::vector<T> cells_;
};

}  // namespace terratile
