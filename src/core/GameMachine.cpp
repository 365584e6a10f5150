#include "core/GameMachine.hpp"
#include "core/GridEngine.hpp"
#include "core/ScoringEngine.hpp"

#include <algorithm>
#include <utility>
#include <variant>

namespace blockblast::core {

const char* phaseName(GamePhase phase) noexcept {
    switch (phase) {
    case GamePhase::Idle:             return "idle";
    case GamePhase::Dragging:         return "dragging";
    case GamePhase::Placing:          return "placing";
    case GamePhase::Clearing:         return "clearing";
    case GamePhase::CheckingGameOver: return "checkingGameOver";
    case GamePhase::GameOver:         return "gameOver";
    }
    return "unknown";
}

namespace {

struct EventNamer {
    const char* operator()(const DragStart&) const noexcept { return "DRAG_START"; }
    const char* operator()(const DragUpdate&) const noexcept { return "DRAG_UPDATE"; }
    const char* operator()(const DragCancel&) const noexcept { return "DRAG_CANCEL"; }
    const char* operator()(const DropBlock&) const noexcept { return "DROP_BLOCK"; }
    const char* operator()(const ClearComplete&) const noexcept { return "CLEAR_COMPLETE"; }
    const char* operator()(const Restart&) const noexcept { return "RESTART"; }
    const char* operator()(const LoadHighScore&) const noexcept { return "LOAD_HIGH_SCORE"; }
};

} // namespace

const char* eventName(const GameEvent& event) noexcept {
    if (event.valueless_by_exception()) {
        return "UNKNOWN";
    }
    return std::visit(EventNamer{}, event);
}

GameContext createInitialContext(BlockFactory& factory, std::uint64_t highScore) {
    GameContext ctx;
    ctx.grid = createEmptyGrid();
    ctx.inventory = factory.generateInitialInventory();
    ctx.highScore = highScore;
    return ctx;
}

bool isStablePhase(GamePhase phase) noexcept {
    return phase != GamePhase::Placing && phase != GamePhase::CheckingGameOver;
}

namespace {

const Block* draggedBlock(const GameContext& ctx) {
    if (!ctx.currentDrag) return nullptr;
    const int index = ctx.currentDrag->blockIndex;
    if (index < 0 || index >= InventorySize) return nullptr;
    const auto& slot = ctx.inventory[static_cast<std::size_t>(index)];
    return slot ? &*slot : nullptr;
}

MachineState restarted(const MachineState& state, BlockFactory& factory) {
    return MachineState{GamePhase::Idle,
                        createInitialContext(factory, state.context.highScore)};
}

MachineState withHighScore(const MachineState& state, const LoadHighScore& e) {
    MachineState next = state;
    next.context.highScore = static_cast<std::uint64_t>(std::max<std::int64_t>(e.highScore, 0));
    return next;
}

// Commits a validated drop: paint the grid, consume the slot, score the cells
MachineState placeDragged(const MachineState& state, const Block& block, Position position) {
    MachineState next = state;
    GameContext& ctx = next.context;

    ctx.grid = placeBlock(state.context.grid, block, position);
    ctx.score += getPlacementPoints(block.cellCount());

    auto lineClear = checkLineClears(ctx.grid);
    if (lineClear.totalLines > 0) {
        ctx.pendingClear = std::move(lineClear);
    } else {
        ctx.pendingClear.reset();
    }

    ctx.inventory[static_cast<std::size_t>(ctx.currentDrag->blockIndex)].reset();
    ctx.currentDrag.reset();
    next.phase = GamePhase::Placing;
    return next;
}

// Entry action of Clearing; scores with the combo value after this clear
void enterClearing(GameContext& ctx) {
    const LineClearResult lines = *ctx.pendingClear;
    const int newCombo = ctx.combo + 1;

    ctx.grid = clearLines(ctx.grid, lines);
    ctx.score += calculateScore(lines, newCombo).points;
    ctx.combo = newCombo;
    ctx.lastClear = lines;
    ctx.pendingClear.reset();
}

std::optional<MachineState> reduceIdle(const MachineState& state,
                                       const GameEvent& event,
                                       BlockFactory& factory)
{
    if (const auto* e = std::get_if<DragStart>(&event)) {
        MachineState next = state;
        next.phase = GamePhase::Dragging;
        next.context.currentDrag = DragState{e->blockIndex, std::nullopt, false};
        return next;
    }
    if (const auto* e = std::get_if<LoadHighScore>(&event)) {
        return withHighScore(state, *e);
    }
    if (std::holds_alternative<Restart>(event)) {
        return restarted(state, factory);
    }
    return std::nullopt;
}

std::optional<MachineState> reduceDragging(const MachineState& state, const GameEvent& event) {
    if (const auto* e = std::get_if<DragUpdate>(&event)) {
        MachineState next = state;
        if (next.context.currentDrag) {
            next.context.currentDrag->position = e->position;
            next.context.currentDrag->isValid = e->isValid;
        }
        return next;
    }
    if (std::holds_alternative<DragCancel>(event)) {
        MachineState next = state;
        next.phase = GamePhase::Idle;
        next.context.currentDrag.reset();
        return next;
    }
    if (const auto* e = std::get_if<DropBlock>(&event)) {
        const Block* block = draggedBlock(state.context);
        if (block && canPlaceBlock(state.context.grid, *block, e->position)) {
            return placeDragged(state, *block, e->position);
        }
        // Rejected drop: back to idle, nothing else changes
        MachineState next = state;
        next.phase = GamePhase::Idle;
        next.context.currentDrag.reset();
        return next;
    }
    return std::nullopt;
}

std::optional<MachineState> reduceClearing(const MachineState& state, const GameEvent& event) {
    if (std::holds_alternative<ClearComplete>(event)) {
        MachineState next = state;
        next.phase = GamePhase::CheckingGameOver;
        next.context.lastClear.reset();
        return next;
    }
    return std::nullopt;
}

std::optional<MachineState> reduceGameOver(const MachineState& state,
                                           const GameEvent& event,
                                           BlockFactory& factory)
{
    if (std::holds_alternative<Restart>(event)) {
        return restarted(state, factory);
    }
    if (const auto* e = std::get_if<LoadHighScore>(&event)) {
        return withHighScore(state, *e);
    }
    return std::nullopt;
}

} // namespace

std::optional<MachineState> reduce(const MachineState& state,
                                   const GameEvent& event,
                                   BlockFactory& factory)
{
    switch (state.phase) {
    case GamePhase::Idle:
        return reduceIdle(state, event, factory);
    case GamePhase::Dragging:
        return reduceDragging(state, event);
    case GamePhase::Clearing:
        return reduceClearing(state, event);
    case GamePhase::GameOver:
        return reduceGameOver(state, event, factory);
    case GamePhase::Placing:
    case GamePhase::CheckingGameOver:
        // Transient phases never wait for input
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<MachineState> step(const MachineState& state, BlockFactory& factory) {
    const GameContext& ctx = state.context;

    switch (state.phase) {
    case GamePhase::Idle:
        if (isInventoryEmpty(ctx.inventory)) {
            MachineState next = state;
            next.context.inventory = factory.generateInventory(ctx.score);
            return next;
        }
        return std::nullopt;

    case GamePhase::Placing: {
        MachineState next = state;
        if (ctx.pendingClear) {
            next.phase = GamePhase::Clearing;
            enterClearing(next.context);
        } else {
            next.phase = GamePhase::CheckingGameOver;
            next.context.combo = 0;
            next.context.pendingClear.reset();
        }
        return next;
    }

    case GamePhase::CheckingGameOver: {
        MachineState next = state;
        if (isInventoryEmpty(ctx.inventory)) {
            // Refill, then evaluate again on the next step
            next.context.inventory = factory.generateInventory(ctx.score);
        } else if (canPlaceAnyBlock(ctx.grid, ctx.inventory)) {
            next.phase = GamePhase::Idle;
        } else {
            next.phase = GamePhase::GameOver;
            next.context.highScore = std::max(ctx.score, ctx.highScore);
        }
        return next;
    }

    case GamePhase::Dragging:
    case GamePhase::Clearing:
    case GamePhase::GameOver:
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace blockblast::core
