#pragma once

#include "Types.hpp"
#include "Shape.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace blockblast::core {

// Difficulty tier a shape belongs to
enum class ShapeTier : std::uint8_t {
    Simple,
    Medium,
    Complex
};

struct CatalogEntry {
    std::string name;
    ShapeTier tier;
    double weight; // relative selection weight, 1.0 unless rarer
    Shape shape;
};

// Score thresholds for the difficulty curve
inline constexpr std::uint64_t MediumDifficultyScore = 500;
inline constexpr std::uint64_t HardDifficultyScore   = 1500;
inline constexpr std::uint64_t ExpertDifficultyScore = 3000;

/// Every shape of the game, grouped by tier in catalog order.
const std::vector<CatalogEntry>& allShapes();

/// Returns nullptr if no shape has that name.
const CatalogEntry* findShape(const std::string& name);

/// All entries of one tier, in catalog order.
std::vector<const CatalogEntry*> shapesInTier(ShapeTier tier);

/// Candidate pool used by the generator at a given score. An entry may
/// appear more than once; each occurrence contributes its weight.
std::vector<const CatalogEntry*> shapePoolForScore(std::uint64_t score);

// Occupied offsets of a shape, row-major
std::vector<Position> getShapeCells(const Shape& shape);

ShapeDimensions getShapeDimensions(const Shape& shape);

// Occupied cells on the outline of a shape
std::vector<Position> getPerimeterCells(const Shape& shape);

} // namespace blockblast::core
