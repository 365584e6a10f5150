#include "core/ShapeCatalog.hpp"

#include <initializer_list>
#include <utility>

namespace blockblast::core {

namespace {

// Builds a shape from rows drawn with '#' (occupied) and '.' (empty)
Shape draw(std::initializer_list<const char*> lines) {
    Shape::Matrix matrix;
    for (const char* line : lines) {
        std::vector<bool> row;
        for (const char* c = line; *c != '\0'; ++c) {
            row.push_back(*c == '#');
        }
        matrix.push_back(std::move(row));
    }
    return Shape{std::move(matrix)};
}

std::vector<CatalogEntry> buildCatalog() {
    using T = ShapeTier;

    std::vector<CatalogEntry> c;
    c.reserve(31);

    // ---- simple ----
    c.push_back({"single",  T::Simple, 0.3, draw({"#"})});
    c.push_back({"line2H",  T::Simple, 1.0, draw({"##"})});
    c.push_back({"line2V",  T::Simple, 1.0, draw({"#", "#"})});
    c.push_back({"square2", T::Simple, 1.0, draw({"##", "##"})});
    c.push_back({"smallL1", T::Simple, 1.0, draw({"#.", "##"})});
    c.push_back({"smallL2", T::Simple, 1.0, draw({"##", "#."})});
    c.push_back({"smallL3", T::Simple, 1.0, draw({"##", ".#"})});
    c.push_back({"smallL4", T::Simple, 1.0, draw({".#", "##"})});

    // ---- medium ----
    c.push_back({"line3H",   T::Medium, 1.0, draw({"###"})});
    c.push_back({"line3V",   T::Medium, 1.0, draw({"#", "#", "#"})});
    c.push_back({"lShape1",  T::Medium, 1.0, draw({"#.", "#.", "##"})});
    c.push_back({"lShape2",  T::Medium, 1.0, draw({"###", "#.."})});
    c.push_back({"lShape3",  T::Medium, 1.0, draw({"##", ".#", ".#"})});
    c.push_back({"lShape4",  T::Medium, 1.0, draw({"..#", "###"})});
    c.push_back({"lShapeR1", T::Medium, 1.0, draw({".#", ".#", "##"})});
    c.push_back({"lShapeR2", T::Medium, 1.0, draw({"#..", "###"})});
    c.push_back({"lShapeR3", T::Medium, 1.0, draw({"##", "#.", "#."})});
    c.push_back({"lShapeR4", T::Medium, 1.0, draw({"###", "..#"})});
    c.push_back({"tShape1",  T::Medium, 1.0, draw({"###", ".#."})});
    c.push_back({"tShape2",  T::Medium, 1.0, draw({".#", "##", ".#"})});
    c.push_back({"tShape3",  T::Medium, 1.0, draw({".#.", "###"})});
    c.push_back({"tShape4",  T::Medium, 1.0, draw({"#.", "##", "#."})});

    // ---- complex ----
    c.push_back({"line4H",  T::Complex, 1.0, draw({"####"})});
    c.push_back({"line4V",  T::Complex, 1.0, draw({"#", "#", "#", "#"})});
    c.push_back({"line5H",  T::Complex, 1.0, draw({"#####"})});
    c.push_back({"line5V",  T::Complex, 1.0, draw({"#", "#", "#", "#", "#"})});
    c.push_back({"square3", T::Complex, 0.1, draw({"###", "###", "###"})});
    c.push_back({"zShape1", T::Complex, 1.0, draw({"##.", ".##"})});
    c.push_back({"zShape2", T::Complex, 1.0, draw({".#", "##", "#."})});
    c.push_back({"sShape1", T::Complex, 1.0, draw({".##", "##."})});
    c.push_back({"sShape2", T::Complex, 1.0, draw({"#.", "##", ".#"})});

    return c;
}

void append(std::vector<const CatalogEntry*>& pool,
            const std::vector<const CatalogEntry*>& entries,
            std::size_t limit = static_cast<std::size_t>(-1))
{
    for (std::size_t i = 0; i < entries.size() && i < limit; ++i) {
        pool.push_back(entries[i]);
    }
}

} // namespace

const std::vector<CatalogEntry>& allShapes() {
    static const std::vector<CatalogEntry> catalog = buildCatalog();
    return catalog;
}

const CatalogEntry* findShape(const std::string& name) {
    for (const auto& entry : allShapes()) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

std::vector<const CatalogEntry*> shapesInTier(ShapeTier tier) {
    std::vector<const CatalogEntry*> out;
    for (const auto& entry : allShapes()) {
        if (entry.tier == tier) {
            out.push_back(&entry);
        }
    }
    return out;
}

std::vector<const CatalogEntry*> shapePoolForScore(std::uint64_t score) {
    const auto simple  = shapesInTier(ShapeTier::Simple);
    const auto medium  = shapesInTier(ShapeTier::Medium);
    const auto complex = shapesInTier(ShapeTier::Complex);

    std::vector<const CatalogEntry*> pool;

    if (score < MediumDifficultyScore) {
        // Easy: simple shapes twice, plus a few medium ones
        append(pool, simple);
        append(pool, simple);
        append(pool, medium, 4);
    } else if (score < HardDifficultyScore) {
        append(pool, simple);
        append(pool, medium);
    } else if (score < ExpertDifficultyScore) {
        append(pool, medium);
        append(pool, complex);
    } else {
        // Everything, complex shapes twice as likely
        append(pool, simple);
        append(pool, medium);
        append(pool, complex);
        append(pool, complex);
    }

    return pool;
}

std::vector<Position> getShapeCells(const Shape& shape) {
    return shape.cells();
}

ShapeDimensions getShapeDimensions(const Shape& shape) {
    return shape.dimensions();
}

std::vector<Position> getPerimeterCells(const Shape& shape) {
    return shape.perimeterCells();
}

} // namespace blockblast::core
