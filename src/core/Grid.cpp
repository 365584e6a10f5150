#include "core/Grid.hpp"
#include <stdexcept>

namespace blockblast::core {

GridCell Grid::cell(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Grid::cell out of range");
    }
    return cells_[index(row, col)];
}

void Grid::setCell(int row, int col, GridCell value) {
    if (!isInside(row, col)) {
        throw std::out_of_range("Grid::setCell out of range");
    }
    cells_[index(row, col)] = value;
}

bool Grid::isRowFull(int row) const {
    if (row < 0 || row >= GridSize) {
        throw std::out_of_range("Grid::isRowFull out of range");
    }
    for (int col = 0; col < GridSize; ++col) {
        if (!cells_[index(row, col)]) {
            return false;
        }
    }
    return true;
}

bool Grid::isColumnFull(int col) const {
    if (col < 0 || col >= GridSize) {
        throw std::out_of_range("Grid::isColumnFull out of range");
    }
    for (int row = 0; row < GridSize; ++row) {
        if (!cells_[index(row, col)]) {
            return false;
        }
    }
    return true;
}

int Grid::filledCount() const noexcept {
    int count = 0;
    for (const auto& c : cells_) {
        if (c) ++count;
    }
    return count;
}

} // namespace blockblast::core
