#include <catch2/catch_test_macros.hpp>

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/Shape.hpp"
#include "core/ShapeCatalog.hpp"
#include "core/Types.hpp"

using namespace blockblast::core;

TEST_CASE("ShapeCatalog: catalog holds every tier with unique names", "[catalog]")
{
    const auto& shapes = allShapes();
    REQUIRE(shapes.size() == 31);

    REQUIRE(shapesInTier(ShapeTier::Simple).size() == 8);
    REQUIRE(shapesInTier(ShapeTier::Medium).size() == 14);
    REQUIRE(shapesInTier(ShapeTier::Complex).size() == 9);

    std::set<std::string> names;
    for (const auto& entry : shapes) {
        names.insert(entry.name);
    }
    REQUIRE(names.size() == shapes.size());
}

TEST_CASE("ShapeCatalog: rare shapes carry reduced weights", "[catalog]")
{
    REQUIRE(findShape("single")->weight == 0.3);
    REQUIRE(findShape("square3")->weight == 0.1);

    for (const auto& entry : allShapes()) {
        if (entry.name != "single" && entry.name != "square3") {
            CHECK(entry.weight == 1.0);
        }
    }
}

TEST_CASE("ShapeCatalog: every shape fits on the grid", "[catalog]")
{
    for (const auto& entry : allShapes()) {
        const auto dims = getShapeDimensions(entry.shape);
        CHECK(dims.rows >= 1);
        CHECK(dims.cols >= 1);
        CHECK(dims.rows <= 5);
        CHECK(dims.cols <= 5);
        CHECK(entry.shape.cellCount() >= 1);
    }

    const auto dims = getShapeDimensions(findShape("square3")->shape);
    REQUIRE(dims.rows == 3);
    REQUIRE(dims.cols == 3);
}

TEST_CASE("ShapeCatalog: findShape returns nullptr for unknown names", "[catalog]")
{
    REQUIRE(findShape("line5H") != nullptr);
    REQUIRE(findShape("hexagon") == nullptr);
}

TEST_CASE("ShapeCatalog: shape cells are listed row-major", "[catalog][shape]")
{
    // #.
    // ##
    const auto cells = getShapeCells(findShape("smallL1")->shape);
    REQUIRE(cells.size() == 3);
    REQUIRE(cells[0] == Position{0, 0});
    REQUIRE(cells[1] == Position{1, 0});
    REQUIRE(cells[2] == Position{1, 1});

    // ###
    // #..
    const auto& l2 = findShape("lShape2")->shape;
    REQUIRE(l2.rows() == 2);
    REQUIRE(l2.cols() == 3);
    REQUIRE(l2.filled(1, 0));
    REQUIRE_FALSE(l2.filled(1, 1));
    REQUIRE_FALSE(l2.filled(5, 5));
}

TEST_CASE("ShapeCatalog: perimeter skips fully enclosed cells", "[catalog][shape]")
{
    const auto perimeter = getPerimeterCells(findShape("square3")->shape);
    REQUIRE(perimeter.size() == 8);
    for (const auto& p : perimeter) {
        CHECK_FALSE(p == Position{1, 1});
    }

    REQUIRE(getPerimeterCells(findShape("line4H")->shape).size() == 4);
}

TEST_CASE("Shape: rejects malformed matrices", "[shape]")
{
    REQUIRE_THROWS_AS(Shape(Shape::Matrix{}), std::invalid_argument);
    REQUIRE_THROWS_AS(Shape(Shape::Matrix{{}}), std::invalid_argument);
    REQUIRE_THROWS_AS(Shape(Shape::Matrix{{true, true}, {true}}), std::invalid_argument);
    REQUIRE_THROWS_AS(Shape(Shape::Matrix{{false, false}}), std::invalid_argument);

    const Shape ok{Shape::Matrix{{false, true}}};
    REQUIRE(ok.cellCount() == 1);
    REQUIRE(ok.cells().front() == Position{0, 1});
}

TEST_CASE("ShapeCatalog: pools follow the difficulty thresholds", "[catalog][difficulty]")
{
    auto countTier = [](const std::vector<const CatalogEntry*>& pool, ShapeTier tier) {
        int n = 0;
        for (const auto* e : pool) {
            if (e->tier == tier) ++n;
        }
        return n;
    };

    SECTION("below 500: simple shapes twice plus four medium ones")
    {
        for (std::uint64_t score : {0ull, 250ull, 499ull}) {
            const auto pool = shapePoolForScore(score);
            REQUIRE(pool.size() == 20);
            REQUIRE(countTier(pool, ShapeTier::Simple) == 16);
            REQUIRE(countTier(pool, ShapeTier::Medium) == 4);
            REQUIRE(countTier(pool, ShapeTier::Complex) == 0);
        }
    }

    SECTION("500 to 1499: simple and medium")
    {
        const auto pool = shapePoolForScore(500);
        REQUIRE(pool.size() == 22);
        REQUIRE(countTier(pool, ShapeTier::Complex) == 0);
        REQUIRE(shapePoolForScore(1499).size() == 22);
    }

    SECTION("1500 to 2999: medium and complex")
    {
        const auto pool = shapePoolForScore(1500);
        REQUIRE(pool.size() == 23);
        REQUIRE(countTier(pool, ShapeTier::Simple) == 0);
        REQUIRE(shapePoolForScore(2999).size() == 23);
    }

    SECTION("3000 and above: everything, complex twice")
    {
        const auto pool = shapePoolForScore(3000);
        REQUIRE(pool.size() == 40);
        REQUIRE(countTier(pool, ShapeTier::Complex) == 18);
        REQUIRE(shapePoolForScore(1000000).size() == 40);
    }
}
