#pragma once

#include <optional>

#include "core/Block.hpp"
#include "core/Grid.hpp"
#include "core/Types.hpp"

namespace blockblast::input {

// Where the grid is drawn, in pointer coordinates
struct BoardGeometry {
    float x{0.0f};
    float y{0.0f};
    float cellSize{1.0f};
};

/// Grid cell under a pointer, std::nullopt outside the grid.
std::optional<core::Position> touchToGridPosition(const BoardGeometry& board, float px, float py);

/// Anchor obtained by rounding the dragged block's top-left corner to the
/// nearest cell. std::nullopt when no cell of the block would be over the grid.
std::optional<core::Position> roundedAnchor(const BoardGeometry& board,
                                            float blockLeft, float blockTop,
                                            const core::Shape& shape);

/// Among the anchors where the block fits, the one whose perimeter cells
/// overlap the dragged block's perimeter cells the most (in pixel area).
/// std::nullopt if no fitting anchor overlaps at all.
std::optional<core::Position> bestOverlapAnchor(const BoardGeometry& board,
                                                float blockLeft, float blockTop,
                                                const core::Block& block,
                                                const core::Grid& grid);

} // namespace blockblast::input
