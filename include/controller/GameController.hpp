#pragma once

#include "core/GameMachine.hpp"
#include "core/BlockFactory.hpp"
#include "core/GameEvent.hpp"
#include "controller/GameSnapshot.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace blockblast::controller {

/// Non-authoritative answer to "what if I dropped here?"
struct PlacementPreview {
    bool valid{false};
    std::vector<core::Position> cells;         // cells the block would cover
    std::vector<core::Position> clearedCells;  // cells of lines it would complete
};

/// Owns the game context and drives the state machine: every delivered
/// event is reduced, then zero-input transitions run until nothing changes.
class GameController {
public:
    using HighScoreListener = std::function<void(std::uint64_t)>;
    using SnapshotListener  = std::function<void(const GameSnapshot&)>;

    /// Random seed, fresh game.
    explicit GameController(std::uint64_t highScore = 0);

    /// Fresh game generated by `factory`.
    explicit GameController(core::BlockFactory factory, std::uint64_t highScore = 0);

    /// Resume from an explicit context (puzzles, tests).
    GameController(core::BlockFactory factory, core::GameContext context,
                   core::GamePhase phase = core::GamePhase::Idle);

    /// Process one event to completion. Returns false if the current
    /// phase ignores it (state and context are then unchanged).
    bool dispatch(const core::GameEvent& event);

    // Shorthands for the input and presentation layers
    bool dragStart(int blockIndex) { return dispatch(core::DragStart{blockIndex}); }
    bool dragUpdate(std::optional<core::Position> position, bool isValid) {
        return dispatch(core::DragUpdate{position, isValid});
    }
    bool dragCancel() { return dispatch(core::DragCancel{}); }
    bool dropBlock(core::Position position) { return dispatch(core::DropBlock{position}); }
    bool clearComplete() { return dispatch(core::ClearComplete{}); }
    bool restart() { return dispatch(core::Restart{}); }
    bool loadHighScore(std::int64_t value) { return dispatch(core::LoadHighScore{value}); }

    core::GamePhase phase() const noexcept { return state_.phase; }
    const core::GameContext& context() const noexcept { return state_.context; }
    GameSnapshot snapshot() const { return GameSnapshot::from(state_.phase, state_.context); }

    /// Phases visited while handling the last accepted event, first entry
    /// being the phase the event was delivered in.
    const std::vector<core::GamePhase>& lastPath() const noexcept { return lastPath_; }

    // ---- pure queries, safe to call repeatedly during a drag ----

    bool canPlaceBlockAt(const core::Block& block, core::Position position) const;

    /// False for an out-of-range or empty slot
    bool canPlaceSlotAt(int slot, core::Position position) const;

    PlacementPreview previewPlacement(int slot, core::Position position) const;

    static std::vector<core::Position> getCellsToClear(const core::LineClearResult& lineClear);

    // ---- observers ----

    /// Called with the new value each time the high score increases
    void setHighScoreListener(HighScoreListener listener) { onHighScore_ = std::move(listener); }

    /// Called after every accepted event
    void setSnapshotListener(SnapshotListener listener) { onSnapshot_ = std::move(listener); }

private:
    core::BlockFactory factory_;
    core::MachineState state_;
    std::vector<core::GamePhase> lastPath_;

    HighScoreListener onHighScore_;
    SnapshotListener onSnapshot_;

    void settle();
    const core::Block* slotBlock(int slot) const;
};

} // namespace blockblast::controller
