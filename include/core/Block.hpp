#pragma once

#include "Types.hpp"
#include "Shape.hpp"
#include <array>
#include <optional>
#include <string>

namespace blockblast::core {

using BlockId = std::string;

// A piece offered in the inventory: a shape painted in one color
struct Block {
    BlockId id;
    Shape shape;
    BlockColor color{BlockColor::Red};

    int cellCount() const noexcept { return shape.cellCount(); }
};

// Inventory slots; an empty slot means the block was already placed
using Inventory = std::array<std::optional<Block>, InventorySize>;

inline bool isInventoryEmpty(const Inventory& inventory) noexcept {
    for (const auto& slot : inventory) {
        if (slot) return false;
    }
    return true;
}

} // namespace blockblast::core
