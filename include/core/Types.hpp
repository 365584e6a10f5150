#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <array>   // For std::array
#include <vector>

// Namespace for Block Blast core types
namespace blockblast::core {

// The play field is always 8x8
inline constexpr int GridSize = 8;

// Number of inventory slots offered to the player
inline constexpr int InventorySize = 3;

// Position structure representing a cell (or an anchor) on the grid
struct Position {
    int row{};
    int col{};
};

inline bool operator==(const Position& a, const Position& b) noexcept {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Position& a, const Position& b) noexcept {
    return !(a == b);
}

// Block colors available in the game
enum class BlockColor : std::uint8_t {
    Red,
    Blue,
    Green,
    Yellow,
    Purple,
    Orange
};

inline constexpr int BlockColorCount = 6;

inline constexpr std::array<BlockColor, BlockColorCount> AllBlockColors{{
    BlockColor::Red, BlockColor::Blue, BlockColor::Green,
    BlockColor::Yellow, BlockColor::Purple, BlockColor::Orange
}};

// Lower-case name of a color ("red", "blue", ...)
inline const char* colorName(BlockColor color) noexcept {
    switch (color) {
    case BlockColor::Red:    return "red";
    case BlockColor::Blue:   return "blue";
    case BlockColor::Green:  return "green";
    case BlockColor::Yellow: return "yellow";
    case BlockColor::Purple: return "purple";
    case BlockColor::Orange: return "orange";
    }
    return "unknown";
}

// Result of scanning a grid for complete rows and columns
struct LineClearResult {
    std::vector<int> rows;
    std::vector<int> cols;
    int totalLines{0};
};

} // namespace blockblast::core
