#pragma once

#include "Types.hpp"
#include <array>
#include <optional>

namespace blockblast::core {

// A cell is either empty or painted with the color of the block that filled it
using GridCell = std::optional<BlockColor>;

// Fixed 8x8 play field. Value type: copies are independent.
class Grid {
public:
    Grid() = default; // all cells empty

    static constexpr int rows() noexcept { return GridSize; }
    static constexpr int cols() noexcept { return GridSize; }

    GridCell cell(int row, int col) const;
    void setCell(int row, int col, GridCell value);

    bool isEmpty(int row, int col) const { return !cell(row, col).has_value(); }

    bool isRowFull(int row) const;
    bool isColumnFull(int col) const;

    // Number of occupied cells
    int filledCount() const noexcept;

    bool operator==(const Grid& other) const noexcept { return cells_ == other.cells_; }
    bool operator!=(const Grid& other) const noexcept { return !(*this == other); }

private:
    std::array<GridCell, GridSize * GridSize> cells_{};

    static int index(int row, int col) noexcept {
        return row * GridSize + col;
    }

    static bool isInside(int row, int col) noexcept {
        return row >= 0 && row < GridSize && col >= 0 && col < GridSize;
    }
};

} // namespace blockblast::core
