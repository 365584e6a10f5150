#pragma once

#include "core/GameContext.hpp"
#include <cstdint>
#include <optional>

namespace blockblast::controller {

/// Read-only copy of the game published after every accepted event.
/// Renderers, audio and persistence only ever see this.
struct GameSnapshot {
    core::GamePhase phase{core::GamePhase::Idle};

    core::Grid grid;
    core::Inventory inventory;
    std::uint64_t score{0};
    std::uint64_t highScore{0};
    int combo{0};

    std::optional<core::DragState> currentDrag;
    std::optional<core::LineClearResult> pendingClear;

    /// Lines being animated while in Clearing
    std::optional<core::LineClearResult> lastClear;

    bool isDragging{false};
    bool isClearing{false};
    bool isGameOver{false};

    static GameSnapshot from(core::GamePhase phase, const core::GameContext& ctx);
};

inline GameSnapshot GameSnapshot::from(core::GamePhase phase, const core::GameContext& ctx) {
    GameSnapshot s;
    s.phase        = phase;
    s.grid         = ctx.grid;
    s.inventory    = ctx.inventory;
    s.score        = ctx.score;
    s.highScore    = ctx.highScore;
    s.combo        = ctx.combo;
    s.currentDrag  = ctx.currentDrag;
    s.pendingClear = ctx.pendingClear;
    s.lastClear    = ctx.lastClear;
    s.isDragging   = phase == core::GamePhase::Dragging;
    s.isClearing   = phase == core::GamePhase::Clearing;
    s.isGameOver   = phase == core::GamePhase::GameOver;
    return s;
}

} // namespace blockblast::controller
