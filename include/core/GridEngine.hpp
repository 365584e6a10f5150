#pragma once

#include "Types.hpp"
#include "Grid.hpp"
#include "Block.hpp"
#include <vector>

namespace blockblast::core {

// New 8x8 grid, all cells empty
Grid createEmptyGrid();

bool isWithinBounds(int row, int col) noexcept;

// True iff every occupied cell of the block, anchored at `position`,
// lands inside the grid on an empty cell.
bool canPlaceBlock(const Grid& grid, const Block& block, Position position);

// Absolute cells the block would cover when anchored at `position`
std::vector<Position> getBlockCellsOnGrid(const Block& block, Position position);

// Returns a copy of `grid` with the block painted in. Callers check
// canPlaceBlock first; cells falling outside the grid are skipped.
Grid placeBlock(const Grid& grid, const Block& block, Position position);

// Full rows and full columns, scanned independently
LineClearResult checkLineClears(const Grid& grid);

// Union of the cells of every listed row and column, without duplicates
std::vector<Position> getCellsToClear(const LineClearResult& lineClear);

// Returns a copy of `grid` with the listed rows and columns emptied
Grid clearLines(const Grid& grid, const LineClearResult& lineClear);

// Preview only: the clears that placing the block would trigger.
// Empty result if the block does not fit there.
LineClearResult predictLineClearsAfterPlacement(const Grid& grid,
                                                const Block& block,
                                                Position position);

// First fit search over every non-empty slot and all 64 anchors
bool canPlaceAnyBlock(const Grid& grid, const Inventory& inventory);

// False while a slot is empty (a refill may open moves)
bool checkGameOver(const Grid& grid, const Inventory& inventory);

} // namespace blockblast::core
