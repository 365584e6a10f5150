#pragma once

#include "Types.hpp"
#include "Grid.hpp"
#include "Block.hpp"
#include <cstdint>
#include <optional>

namespace blockblast::core {

enum class GamePhase : std::uint8_t {
    Idle,
    Dragging,
    Placing,
    Clearing,
    CheckingGameOver,
    GameOver
};

const char* phaseName(GamePhase phase) noexcept;

// Block currently held by the player
struct DragState {
    int blockIndex{0};
    std::optional<Position> position; // hovered anchor, if over the grid
    bool isValid{false};              // as reported by the input layer
};

// Everything that changes during a game. Only the state machine writes it.
struct GameContext {
    Grid grid;
    Inventory inventory;
    std::uint64_t score{0};
    std::uint64_t highScore{0};
    int combo{0};

    // Present only while dragging
    std::optional<DragState> currentDrag;

    // Present between a placement that completed lines and the clear step
    std::optional<LineClearResult> pendingClear;

    // Lines removed on entry to Clearing, kept until the presentation
    // layer reports CLEAR_COMPLETE
    std::optional<LineClearResult> lastClear;
};

} // namespace blockblast::core
