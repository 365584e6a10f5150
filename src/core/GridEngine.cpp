#include "core/GridEngine.hpp"
#include "core/ShapeCatalog.hpp"

#include <array>

namespace blockblast::core {

Grid createEmptyGrid() {
    return Grid{};
}

bool isWithinBounds(int row, int col) noexcept {
    return row >= 0 && row < GridSize && col >= 0 && col < GridSize;
}

bool canPlaceBlock(const Grid& grid, const Block& block, Position position) {
    for (const auto& offset : getShapeCells(block.shape)) {
        const int row = position.row + offset.row;
        const int col = position.col + offset.col;

        if (!isWithinBounds(row, col)) {
            return false; // out of grid
        }
        if (!grid.isEmpty(row, col)) {
            return false; // collision
        }
    }
    return true;
}

std::vector<Position> getBlockCellsOnGrid(const Block& block, Position position) {
    std::vector<Position> cells;
    for (const auto& offset : getShapeCells(block.shape)) {
        cells.push_back(Position{position.row + offset.row, position.col + offset.col});
    }
    return cells;
}

Grid placeBlock(const Grid& grid, const Block& block, Position position) {
    Grid placed = grid;
    for (const auto& p : getBlockCellsOnGrid(block, position)) {
        if (isWithinBounds(p.row, p.col)) {
            placed.setCell(p.row, p.col, block.color);
        }
    }
    return placed;
}

LineClearResult checkLineClears(const Grid& grid) {
    LineClearResult result;

    for (int row = 0; row < GridSize; ++row) {
        if (grid.isRowFull(row)) {
            result.rows.push_back(row);
        }
    }
    for (int col = 0; col < GridSize; ++col) {
        if (grid.isColumnFull(col)) {
            result.cols.push_back(col);
        }
    }

    result.totalLines = static_cast<int>(result.rows.size() + result.cols.size());
    return result;
}

std::vector<Position> getCellsToClear(const LineClearResult& lineClear) {
    std::vector<Position> cells;
    std::array<bool, GridSize * GridSize> seen{};

    auto add = [&](int row, int col) {
        if (!isWithinBounds(row, col)) return;
        auto& mark = seen[static_cast<std::size_t>(row * GridSize + col)];
        if (!mark) {
            mark = true;
            cells.push_back(Position{row, col});
        }
    };

    for (int row : lineClear.rows) {
        for (int col = 0; col < GridSize; ++col) {
            add(row, col);
        }
    }
    for (int col : lineClear.cols) {
        for (int row = 0; row < GridSize; ++row) {
            add(row, col);
        }
    }

    return cells;
}

Grid clearLines(const Grid& grid, const LineClearResult& lineClear) {
    Grid cleared = grid;
    for (const auto& p : getCellsToClear(lineClear)) {
        cleared.setCell(p.row, p.col, std::nullopt);
    }
    return cleared;
}

LineClearResult predictLineClearsAfterPlacement(const Grid& grid,
                                                const Block& block,
                                                Position position)
{
    if (!canPlaceBlock(grid, block, position)) {
        return LineClearResult{};
    }
    return checkLineClears(placeBlock(grid, block, position));
}

bool canPlaceAnyBlock(const Grid& grid, const Inventory& inventory) {
    for (const auto& slot : inventory) {
        if (!slot) continue;

        // Try every anchor on the grid
        for (int row = 0; row < GridSize; ++row) {
            for (int col = 0; col < GridSize; ++col) {
                if (canPlaceBlock(grid, *slot, Position{row, col})) {
                    return true;
                }
            }
        }
    }
    return false;
}

bool checkGameOver(const Grid& grid, const Inventory& inventory) {
    for (const auto& slot : inventory) {
        if (!slot) {
            return false; // refill pending
        }
    }
    return !canPlaceAnyBlock(grid, inventory);
}

} // namespace blockblast::core
