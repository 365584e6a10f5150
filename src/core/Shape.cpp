#include "core/Shape.hpp"
#include <stdexcept>

namespace blockblast::core {

Shape::Shape(Matrix matrix)
    : rows_{static_cast<int>(matrix.size())}
    , cols_{matrix.empty() ? 0 : static_cast<int>(matrix.front().size())}
{
    if (rows_ == 0 || cols_ == 0) {
        throw std::invalid_argument("Shape must have at least one row and one column");
    }

    occupancy_.reserve(static_cast<std::size_t>(rows_ * cols_));
    for (const auto& line : matrix) {
        if (static_cast<int>(line.size()) != cols_) {
            throw std::invalid_argument("Shape rows must all have the same length");
        }
        occupancy_.insert(occupancy_.end(), line.begin(), line.end());
    }

    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < cols_; ++c) {
            if (occupancy_[index(r, c)]) {
                cells_.push_back(Position{r, c});
            }
        }
    }

    if (cells_.empty()) {
        throw std::invalid_argument("Shape must have at least one occupied cell");
    }
}

bool Shape::filled(int row, int col) const noexcept {
    if (row < 0 || row >= rows_ || col < 0 || col >= cols_) {
        return false;
    }
    return occupancy_[index(row, col)];
}

std::vector<Position> Shape::perimeterCells() const {
    std::vector<Position> perimeter;
    for (const auto& p : cells_) {
        const bool hasEmptyNeighbour =
            !filled(p.row - 1, p.col) ||
            !filled(p.row + 1, p.col) ||
            !filled(p.row, p.col - 1) ||
            !filled(p.row, p.col + 1);
        if (hasEmptyNeighbour) {
            perimeter.push_back(p);
        }
    }
    return perimeter;
}

} // namespace blockblast::core
