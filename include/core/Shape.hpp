#pragma once // Include guard

#include "Types.hpp" // For Position
#include <vector>

// Namespace for Block Blast core types
namespace blockblast::core {

// Dimensions of a shape's bounding rectangle
struct ShapeDimensions {
    int rows{};
    int cols{};
};

// Rectangular occupancy matrix describing the cells of a block,
// relative to its top-left corner (0,0)
class Shape {
public:
    using Matrix = std::vector<std::vector<bool>>;

    // Throws std::invalid_argument if the matrix is empty, ragged,
    // or has no occupied cell.
    explicit Shape(Matrix matrix);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }
    ShapeDimensions dimensions() const noexcept { return {rows_, cols_}; }

    // False for coordinates outside the bounding rectangle
    bool filled(int row, int col) const noexcept;

    // Occupied offsets in row-major order
    const std::vector<Position>& cells() const noexcept { return cells_; }
    int cellCount() const noexcept { return static_cast<int>(cells_.size()); }

    // Occupied cells with at least one empty 4-neighbour
    // (a neighbour outside the rectangle counts as empty)
    std::vector<Position> perimeterCells() const;

    bool operator==(const Shape& other) const noexcept {
        return rows_ == other.rows_ && cols_ == other.cols_ && occupancy_ == other.occupancy_;
    }
    bool operator!=(const Shape& other) const noexcept { return !(*this == other); }

private:
    int rows_;
    int cols_;
    std::vector<bool> occupancy_;   // rows_ * cols_
    std::vector<Position> cells_;   // cached, row-major

    int index(int row, int col) const noexcept {
        return row * cols_ + col;
    }
};

} // namespace blockblast::core
