#include <catch2/catch_test_macros.hpp>

#include "core/Grid.hpp"
#include "core/GridEngine.hpp"
#include "input/DropTargeting.hpp"

#include "TestBlocks.hpp"

using namespace blockblast::core;
using namespace blockblast::input;
using blockblast::testing::fillRow;
using blockblast::testing::makeBlock;

namespace {

// 40px cells, grid drawn at (100, 50)
const BoardGeometry board{100.0f, 50.0f, 40.0f};

float cellX(float col) { return board.x + col * board.cellSize; }
float cellY(float row) { return board.y + row * board.cellSize; }

} // namespace

TEST_CASE("DropTargeting: pointer to grid cell", "[input]")
{
    REQUIRE(*touchToGridPosition(board, 100.0f, 50.0f) == Position{0, 0});
    REQUIRE(*touchToGridPosition(board, 419.9f, 369.9f) == Position{7, 7});
    REQUIRE(*touchToGridPosition(board, cellX(2.5f), cellY(5.1f)) == Position{5, 2});

    REQUIRE_FALSE(touchToGridPosition(board, 99.0f, 60.0f).has_value());
    REQUIRE_FALSE(touchToGridPosition(board, 420.0f, 60.0f).has_value());
    REQUIRE_FALSE(touchToGridPosition(board, 150.0f, 10.0f).has_value());

    const BoardGeometry degenerate{0.0f, 0.0f, 0.0f};
    REQUIRE_FALSE(touchToGridPosition(degenerate, 1.0f, 1.0f).has_value());
}

TEST_CASE("DropTargeting: rounded anchor snaps to the nearest cell", "[input]")
{
    const Block square = makeBlock("square2");

    REQUIRE(*roundedAnchor(board, cellX(2.4f), cellY(3.6f), square.shape) == Position{4, 2});

    // Partly over the grid: still reported, the caller finds it does not fit
    const auto hanging = roundedAnchor(board, cellX(-1.0f), cellY(0.0f), square.shape);
    REQUIRE(hanging.has_value());
    REQUIRE(*hanging == Position{0, -1});
    REQUIRE_FALSE(canPlaceBlock(Grid{}, square, *hanging));

    REQUIRE_FALSE(roundedAnchor(board, cellX(-3.0f), cellY(0.0f), square.shape).has_value());
    REQUIRE_FALSE(roundedAnchor(board, cellX(0.0f), cellY(8.2f), square.shape).has_value());
}

TEST_CASE("DropTargeting: best overlap picks the closest fitting anchor", "[input]")
{
    const Block square = makeBlock("square2");
    Grid grid;

    SECTION("exactly over a cell")
    {
        REQUIRE(*bestOverlapAnchor(board, cellX(3.0f), cellY(2.0f), square, grid) == Position{2, 3});
    }

    SECTION("slightly off a cell")
    {
        REQUIRE(*bestOverlapAnchor(board, cellX(3.3f), cellY(2.2f), square, grid) == Position{2, 3});
    }

    SECTION("hanging over the right edge snaps back inside")
    {
        const float left = cellX(6.6f);
        const float top = cellY(2.0f);
        REQUIRE(*roundedAnchor(board, left, top, square.shape) == Position{2, 7});
        REQUIRE(*bestOverlapAnchor(board, left, top, square, grid) == Position{2, 6});
    }

    SECTION("occupied target moves to the next fitting anchor")
    {
        grid.setCell(2, 3, BlockColor::Red);
        REQUIRE(*bestOverlapAnchor(board, cellX(3.4f), cellY(2.0f), square, grid) == Position{2, 4});
    }

    SECTION("far from the grid")
    {
        REQUIRE_FALSE(bestOverlapAnchor(board, -1000.0f, -1000.0f, square, grid).has_value());
    }

    SECTION("nowhere to go")
    {
        for (int r = 0; r < GridSize; ++r) {
            fillRow(grid, r);
        }
        REQUIRE_FALSE(bestOverlapAnchor(board, cellX(3.0f), cellY(2.0f), square, grid).has_value());
    }
}
