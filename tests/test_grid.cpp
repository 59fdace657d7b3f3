#include <gtest/gtest.h>
#include "terratile/core/grid.hpp"

#include <stdexcept>
#include <vector>

using namespace terratile;

TEST(GridTest, ConstructFilled) {
    Grid<int> grid(4, 7);
    EXPECT_EQ(grid.dimension(), 4);
    EXPECT_EQ(grid.cellCount(), 16u);
    EXPECT_FALSE(grid.empty());
    for (int v : grid.cells()) {
        EXPECT_EQ(v, 7);
    }
}

TEST(GridTest, DefaultIsEmpty) {
    Grid<float> grid;
    EXPECT_TRUE(grid.empty());
    EXPECT_EQ(grid.dimension(), 0);
}

TEST(GridTest, RejectsNonPositiveDimension) {
    EXPECT_THROW(Grid<int>(0, 0), std::invalid_argument);
    EXPECT_THROW(Grid<int>(-3, 0), std::invalid_argument);
}

TEST(GridTest, RowMajorIndexing) {
    Grid<int> grid(3, 0);
    EXPECT_EQ(grid.index(0, 0), 0u);
    EXPECT_EQ(grid.index(2, 0), 2u);
    EXPECT_EQ(grid.index(0, 1), 3u);
    EXPECT_EQ(grid.index(2, 2), 8u);

    EXPECT_EQ(grid.position(5), CellPos(2, 1));

    grid(1, 2) = 9;
    EXPECT_EQ(grid[grid.index(1, 2)], 9);
}

TEST(GridTest, CheckedAccessThrowsOutOfRange) {
    Grid<int> grid(3, 0);
    EXPECT_NO_THROW((void)grid.at(2, 2));
    EXPECT_THROW((void)grid.at(3, 0), std::out_of_range);
    EXPECT_THROW((void)grid.at(0, -1), std::out_of_range);
    EXPECT_THROW((void)grid.at(CellPos(-1, 1)), std::out_of_range);
}

TEST(GridTest, ContainsAndBorder) {
    Grid<int> grid(4, 0);
    EXPECT_TRUE(grid.contains(0, 0));
    EXPECT_TRUE(grid.contains(3, 3));
    EXPECT_FALSE(grid.contains(4, 0));
    EXPECT_FALSE(grid.contains(CellPos(0, -1)));

    EXPECT_TRUE(grid.onBorder(0, 2));
    EXPECT_TRUE(grid.onBorder(3, 1));
    EXPECT_TRUE(grid.onBorder(2, 3));
    EXPECT_FALSE(grid.onBorder(1, 2));
}

TEST(GridTest, ForEachVisitsRowMajor) {
    Grid<int> grid(2, 0);
    grid(1, 0) = 1;
    grid(0, 1) = 2;
    grid(1, 1) = 3;

    std::vector<int> seen;
    grid.forEach([&](int32_t, int32_t, int value) { seen.push_back(value); });
    EXPECT_EQ(seen, (std::vector<int>{0, 1, 2, 3}));
}

TEST(GridTest, Equality) {
    Grid<int> a(2, 1);
    Grid<int> b(2, 1);
    EXPECT_EQ(a, b);
    b(0, 1) = 5;
    EXPECT_NE(a, b);
    EXPECT_NE(a, Grid<int>(3, 1));
}

TEST(GridTest, NeighborOffsetOrder) {
    // N, E, S, W with north toward row 0
    EXPECT_EQ(NEIGHBORS_4[0].dx, 0);
    EXPECT_EQ(NEIGHBORS_4[0].dy, -1);
    EXPECT_EQ(NEIGHBORS_4[1].dx, 1);
    EXPECT_EQ(NEIGHBORS_4[2].dy, 1);
    EXPECT_EQ(NEIGHBORS_4[3].dx, -1);

    // Every 4-neighbor appears at an even position of the 8-neighbor ring
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(NEIGHBORS_8[i * 2].dx, NEIGHBORS_4[i].dx);
        EXPECT_EQ(NEIGHBORS_8[i * 2].dy, NEIGHBORS_4[i].dy);
    }
}
