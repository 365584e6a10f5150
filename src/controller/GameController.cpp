#include "controller/GameController.hpp"
#include "core/GridEngine.hpp"

#include <utility>

namespace blockblast::controller {

GameController::GameController(std::uint64_t highScore)
    : GameController(core::BlockFactory{}, highScore)
{
}

GameController::GameController(core::BlockFactory factory, std::uint64_t highScore)
    : factory_{std::move(factory)}
{
    state_.phase = core::GamePhase::Idle;
    state_.context = core::createInitialContext(factory_, highScore);
    settle();
}

GameController::GameController(core::BlockFactory factory, core::GameContext context,
                               core::GamePhase phase)
    : factory_{std::move(factory)}
    , state_{phase, std::move(context)}
{
    settle();
}

bool GameController::dispatch(const core::GameEvent& event) {
    auto next = core::reduce(state_, event, factory_);
    if (!next) {
        return false; // not handled in this phase
    }

    const std::uint64_t previousHighScore = state_.context.highScore;

    lastPath_.clear();
    lastPath_.push_back(state_.phase);

    state_ = std::move(*next);
    settle();

    if (onHighScore_ && state_.context.highScore > previousHighScore) {
        onHighScore_(state_.context.highScore);
    }
    if (onSnapshot_) {
        onSnapshot_(snapshot());
    }
    return true;
}

void GameController::settle() {
    if (lastPath_.empty() || lastPath_.back() != state_.phase) {
        lastPath_.push_back(state_.phase);
    }

    // Run zero-input transitions to a fixed point
    while (auto next = core::step(state_, factory_)) {
        state_ = std::move(*next);
        if (lastPath_.back() != state_.phase) {
            lastPath_.push_back(state_.phase);
        }
    }
}

bool GameController::canPlaceBlockAt(const core::Block& block, core::Position position) const {
    return core::canPlaceBlock(state_.context.grid, block, position);
}

bool GameController::canPlaceSlotAt(int slot, core::Position position) const {
    const core::Block* block = slotBlock(slot);
    return block != nullptr && canPlaceBlockAt(*block, position);
}

PlacementPreview GameController::previewPlacement(int slot, core::Position position) const {
    PlacementPreview preview;
    const core::Block* block = slotBlock(slot);
    if (!block) {
        return preview;
    }

    preview.cells = core::getBlockCellsOnGrid(*block, position);
    preview.valid = canPlaceBlockAt(*block, position);
    if (preview.valid) {
        const auto lines = core::predictLineClearsAfterPlacement(state_.context.grid, *block, position);
        if (lines.totalLines > 0) {
            preview.clearedCells = core::getCellsToClear(lines);
        }
    }
    return preview;
}

std::vector<core::Position> GameController::getCellsToClear(const core::LineClearResult& lineClear) {
    return core::getCellsToClear(lineClear);
}

const core::Block* GameController::slotBlock(int slot) const {
    if (slot < 0 || slot >= core::InventorySize) {
        return nullptr;
    }
    const auto& s = state_.context.inventory[static_cast<std::size_t>(slot)];
    return s ? &*s : nullptr;
}

} // namespace blockblast::controller
