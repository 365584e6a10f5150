#include "input/DropTargeting.hpp"

#include <algorithm>
#include <cmath>

#include "core/GridEngine.hpp"
#include "core/ShapeCatalog.hpp"

namespace blockblast::input {

namespace {
    float overlap1D(float a0, float a1, float b0, float b1) {
        return std::max(0.0f, std::min(a1, b1) - std::max(a0, b0));
    }
}

std::optional<core::Position> touchToGridPosition(const BoardGeometry& board, float px, float py)
{
    if (board.cellSize <= 0.0f) return std::nullopt;

    const int col = static_cast<int>(std::floor((px - board.x) / board.cellSize));
    const int row = static_cast<int>(std::floor((py - board.y) / board.cellSize));
    if (!core::isWithinBounds(row, col)) {
        return std::nullopt;
    }
    return core::Position{row, col};
}

std::optional<core::Position> roundedAnchor(const BoardGeometry& board,
                                            float blockLeft, float blockTop,
                                            const core::Shape& shape)
{
    if (board.cellSize <= 0.0f) return std::nullopt;

    const int col = static_cast<int>(std::lround((blockLeft - board.x) / board.cellSize));
    const int row = static_cast<int>(std::lround((blockTop - board.y) / board.cellSize));

    // Some part of the bounding box must still be over the grid
    if (row + shape.rows() <= 0 || row >= core::GridSize ||
        col + shape.cols() <= 0 || col >= core::GridSize) {
        return std::nullopt;
    }
    return core::Position{row, col};
}

std::optional<core::Position> bestOverlapAnchor(const BoardGeometry& board,
                                                float blockLeft, float blockTop,
                                                const core::Block& block,
                                                const core::Grid& grid)
{
    const float cs = board.cellSize;
    if (cs <= 0.0f) return std::nullopt;

    const auto perimeter = core::getPerimeterCells(block.shape);

    std::optional<core::Position> best;
    float bestArea = 0.0f;

    for (int row = 0; row < core::GridSize; ++row) {
        for (int col = 0; col < core::GridSize; ++col) {
            const core::Position anchor{row, col};
            if (!core::canPlaceBlock(grid, block, anchor)) continue;

            // Dragged and candidate copies share offsets, so compare cell by cell
            float area = 0.0f;
            for (const auto& c : perimeter) {
                const float dx0 = blockLeft + c.col * cs;
                const float dy0 = blockTop  + c.row * cs;
                const float gx0 = board.x + (col + c.col) * cs;
                const float gy0 = board.y + (row + c.row) * cs;
                area += overlap1D(dx0, dx0 + cs, gx0, gx0 + cs)
                      * overlap1D(dy0, dy0 + cs, gy0, gy0 + cs);
            }

            if (area > bestArea) {
                bestArea = area;
                best = anchor;
            }
        }
    }

    return best;
}

} // namespace blockblast::input
