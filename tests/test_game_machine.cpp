#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "core/BlockFactory.hpp"
#include "core/GameEvent.hpp"
#include "core/GameMachine.hpp"
#include "core/GridEngine.hpp"
#include "core/ScoringEngine.hpp"

#include "TestBlocks.hpp"

using namespace blockblast::core;
using blockblast::testing::checkerboard;
using blockblast::testing::contextWith;
using blockblast::testing::fillRow;
using blockblast::testing::makeBlock;

namespace {

Inventory threeSquares()
{
    Inventory inv{};
    inv[0] = makeBlock("square2", BlockColor::Red, "s0");
    inv[1] = makeBlock("square2", BlockColor::Blue, "s1");
    inv[2] = makeBlock("square2", BlockColor::Green, "s2");
    return inv;
}

MachineState dragging(GameContext ctx, int index)
{
    ctx.currentDrag = DragState{index, std::nullopt, false};
    return MachineState{GamePhase::Dragging, std::move(ctx)};
}

} // namespace

TEST_CASE("GameMachine: initial context", "[machine]")
{
    BlockFactory factory{11};
    const GameContext ctx = createInitialContext(factory, 420);

    REQUIRE(ctx.grid == createEmptyGrid());
    REQUIRE(ctx.score == 0);
    REQUIRE(ctx.highScore == 420);
    REQUIRE(ctx.combo == 0);
    REQUIRE_FALSE(ctx.currentDrag.has_value());
    REQUIRE_FALSE(ctx.pendingClear.has_value());
    for (const auto& slot : ctx.inventory) {
        REQUIRE(slot.has_value());
    }
}

TEST_CASE("GameMachine: drag start, update and cancel", "[machine][drag]")
{
    BlockFactory factory{1};
    const MachineState idle{GamePhase::Idle, contextWith(Grid{}, threeSquares())};

    const auto started = reduce(idle, DragStart{1}, factory);
    REQUIRE(started.has_value());
    REQUIRE(started->phase == GamePhase::Dragging);
    REQUIRE(started->context.currentDrag->blockIndex == 1);
    REQUIRE_FALSE(started->context.currentDrag->position.has_value());
    REQUIRE_FALSE(started->context.currentDrag->isValid);

    const auto hovered = reduce(*started, DragUpdate{Position{2, 2}, true}, factory);
    REQUIRE(hovered->phase == GamePhase::Dragging);
    REQUIRE(*hovered->context.currentDrag->position == Position{2, 2});
    REQUIRE(hovered->context.currentDrag->isValid);
    REQUIRE(hovered->context.grid == idle.context.grid);

    const auto left = reduce(*hovered, DragUpdate{std::nullopt, false}, factory);
    REQUIRE_FALSE(left->context.currentDrag->position.has_value());

    const auto cancelled = reduce(*left, DragCancel{}, factory);
    REQUIRE(cancelled->phase == GamePhase::Idle);
    REQUIRE_FALSE(cancelled->context.currentDrag.has_value());
}

TEST_CASE("GameMachine: rejected drop returns to idle without mutation", "[machine][drop]")
{
    BlockFactory factory{1};
    Grid grid;
    grid.setCell(0, 0, BlockColor::Orange);
    const MachineState state = dragging(contextWith(grid, threeSquares(), 30), 0);

    SECTION("collision")
    {
        const auto next = reduce(state, DropBlock{{0, 0}}, factory);
        REQUIRE(next->phase == GamePhase::Idle);
        REQUIRE(next->context.grid == grid);
        REQUIRE(next->context.score == 30);
        REQUIRE(next->context.inventory[0].has_value());
        REQUIRE_FALSE(next->context.currentDrag.has_value());
    }

    SECTION("off the grid")
    {
        const auto next = reduce(state, DropBlock{{7, 7}}, factory);
        REQUIRE(next->phase == GamePhase::Idle);
        REQUIRE(next->context.grid == grid);
    }

    SECTION("dragged slot is empty")
    {
        MachineState emptySlot = state;
        emptySlot.context.inventory[0].reset();
        const auto next = reduce(emptySlot, DropBlock{{4, 4}}, factory);
        REQUIRE(next->phase == GamePhase::Idle);
        REQUIRE(next->context.grid == grid);
    }
}

TEST_CASE("GameMachine: accepted drop commits the placement", "[machine][drop]")
{
    BlockFactory factory{1};
    const MachineState state = dragging(contextWith(Grid{}, threeSquares(), 10), 2);

    const auto placed = reduce(state, DropBlock{{4, 4}}, factory);
    REQUIRE(placed->phase == GamePhase::Placing);
    REQUIRE(placed->context.grid.cell(4, 4) == BlockColor::Green);
    REQUIRE(placed->context.grid.cell(5, 5) == BlockColor::Green);
    REQUIRE(placed->context.grid.filledCount() == 4);
    REQUIRE(placed->context.score == 14);
    REQUIRE_FALSE(placed->context.inventory[2].has_value());
    REQUIRE(placed->context.inventory[0].has_value());
    REQUIRE_FALSE(placed->context.currentDrag.has_value());
    REQUIRE_FALSE(placed->context.pendingClear.has_value());

    // No clear: combo resets on the way to the game over check
    MachineState withCombo = *placed;
    withCombo.context.combo = 3;
    const auto checking = step(withCombo, factory);
    REQUIRE(checking->phase == GamePhase::CheckingGameOver);
    REQUIRE(checking->context.combo == 0);

    const auto settled = step(*checking, factory);
    REQUIRE(settled->phase == GamePhase::Idle);
    REQUIRE_FALSE(step(*settled, factory).has_value());
}

TEST_CASE("GameMachine: completing a row goes through clearing", "[machine][clear]")
{
    BlockFactory factory{1};
    Grid grid;
    fillRow(grid, 3, 7);
    grid.setCell(5, 5, BlockColor::Purple);

    Inventory inv = threeSquares();
    inv[0] = makeBlock("single", BlockColor::Yellow);
    const MachineState state = dragging(contextWith(grid, inv), 0);

    const auto placed = reduce(state, DropBlock{{3, 7}}, factory);
    REQUIRE(placed->phase == GamePhase::Placing);
    REQUIRE(placed->context.pendingClear.has_value());
    REQUIRE(placed->context.pendingClear->rows == std::vector<int>{3});
    REQUIRE(placed->context.score == 1);

    const auto clearing = step(*placed, factory);
    REQUIRE(clearing->phase == GamePhase::Clearing);
    REQUIRE(clearing->context.score == 101);
    REQUIRE(clearing->context.combo == 1);
    REQUIRE_FALSE(clearing->context.pendingClear.has_value());
    REQUIRE(clearing->context.lastClear->rows == std::vector<int>{3});
    REQUIRE(clearing->context.grid.filledCount() == 1);
    REQUIRE(clearing->context.grid.cell(5, 5) == BlockColor::Purple);

    // Waits for the presentation layer
    REQUIRE_FALSE(step(*clearing, factory).has_value());
    REQUIRE_FALSE(reduce(*clearing, DragStart{1}, factory).has_value());
    REQUIRE_FALSE(reduce(*clearing, Restart{}, factory).has_value());

    const auto done = reduce(*clearing, ClearComplete{}, factory);
    REQUIRE(done->phase == GamePhase::CheckingGameOver);
    REQUIRE_FALSE(done->context.lastClear.has_value());
    REQUIRE(step(*done, factory)->phase == GamePhase::Idle);
}

TEST_CASE("GameMachine: game over check refills an empty inventory first", "[machine][refill]")
{
    BlockFactory factory{3};
    const MachineState state{GamePhase::CheckingGameOver, contextWith(Grid{}, Inventory{}, 40)};

    const auto refilled = step(state, factory);
    REQUIRE(refilled->phase == GamePhase::CheckingGameOver);
    for (const auto& slot : refilled->context.inventory) {
        REQUIRE(slot.has_value());
    }

    REQUIRE(step(*refilled, factory)->phase == GamePhase::Idle);
}

TEST_CASE("GameMachine: idle with an empty inventory refills", "[machine][refill]")
{
    BlockFactory factory{3};
    const MachineState state{GamePhase::Idle, contextWith(Grid{}, Inventory{})};

    const auto refilled = step(state, factory);
    REQUIRE(refilled->phase == GamePhase::Idle);
    REQUIRE_FALSE(isInventoryEmpty(refilled->context.inventory));
}

TEST_CASE("GameMachine: no fitting block ends the game and records the best score", "[machine][gameover]")
{
    BlockFactory factory{3};

    SECTION("score beats the stored best")
    {
        const MachineState state{GamePhase::CheckingGameOver,
                                 contextWith(checkerboard(), threeSquares(), 900, 600)};
        const auto over = step(state, factory);
        REQUIRE(over->phase == GamePhase::GameOver);
        REQUIRE(over->context.highScore == 900);
        REQUIRE_FALSE(step(*over, factory).has_value());
    }

    SECTION("stored best is kept")
    {
        const MachineState state{GamePhase::CheckingGameOver,
                                 contextWith(checkerboard(), threeSquares(), 300, 600)};
        REQUIRE(step(state, factory)->context.highScore == 600);
    }
}

TEST_CASE("GameMachine: restart keeps only the high score", "[machine][restart]")
{
    BlockFactory factory{3};
    GameContext ctx = contextWith(checkerboard(), threeSquares(), 900, 900);
    ctx.combo = 4;
    const MachineState over{GamePhase::GameOver, ctx};

    const auto fresh = reduce(over, Restart{}, factory);
    REQUIRE(fresh->phase == GamePhase::Idle);
    REQUIRE(fresh->context.grid == createEmptyGrid());
    REQUIRE(fresh->context.score == 0);
    REQUIRE(fresh->context.combo == 0);
    REQUIRE(fresh->context.highScore == 900);
    REQUIRE_FALSE(isInventoryEmpty(fresh->context.inventory));

    // Restart from idle is accepted too
    REQUIRE(reduce(MachineState{GamePhase::Idle, ctx}, Restart{}, factory)->context.score == 0);
}

TEST_CASE("GameMachine: high score seeding", "[machine][highscore]")
{
    BlockFactory factory{3};
    const MachineState idle{GamePhase::Idle, contextWith(Grid{}, threeSquares(), 0, 50)};

    const auto seeded = reduce(idle, LoadHighScore{1200}, factory);
    REQUIRE(seeded->phase == GamePhase::Idle);
    REQUIRE(seeded->context.highScore == 1200);

    REQUIRE(reduce(idle, LoadHighScore{-7}, factory)->context.highScore == 0);

    const MachineState over{GamePhase::GameOver, idle.context};
    REQUIRE(reduce(over, LoadHighScore{77}, factory)->phase == GamePhase::GameOver);

    REQUIRE_FALSE(reduce(dragging(idle.context, 0), LoadHighScore{5}, factory).has_value());
}

TEST_CASE("GameMachine: events outside their phase are ignored", "[machine]")
{
    BlockFactory factory{3};
    const GameContext ctx = contextWith(Grid{}, threeSquares());
    const MachineState idle{GamePhase::Idle, ctx};

    REQUIRE_FALSE(reduce(idle, DragUpdate{Position{1, 1}, true}, factory).has_value());
    REQUIRE_FALSE(reduce(idle, DragCancel{}, factory).has_value());
    REQUIRE_FALSE(reduce(idle, DropBlock{{0, 0}}, factory).has_value());
    REQUIRE_FALSE(reduce(idle, ClearComplete{}, factory).has_value());

    const MachineState drag = dragging(ctx, 0);
    REQUIRE_FALSE(reduce(drag, DragStart{1}, factory).has_value());
    REQUIRE_FALSE(reduce(drag, Restart{}, factory).has_value());
    REQUIRE_FALSE(reduce(drag, ClearComplete{}, factory).has_value());

    const MachineState over{GamePhase::GameOver, ctx};
    REQUIRE_FALSE(reduce(over, DragStart{0}, factory).has_value());
    REQUIRE_FALSE(reduce(over, DropBlock{{0, 0}}, factory).has_value());

    for (GamePhase transient : {GamePhase::Placing, GamePhase::CheckingGameOver}) {
        REQUIRE_FALSE(reduce(MachineState{transient, ctx}, Restart{}, factory).has_value());
        REQUIRE_FALSE(isStablePhase(transient));
    }
    REQUIRE(isStablePhase(GamePhase::Clearing));
}

TEST_CASE("GameMachine: phase and event names", "[machine]")
{
    REQUIRE(std::string(phaseName(GamePhase::CheckingGameOver)) == "checkingGameOver");
    REQUIRE(std::string(phaseName(GamePhase::GameOver)) == "gameOver");
    REQUIRE(std::string(eventName(DragStart{0})) == "DRAG_START");
    REQUIRE(std::string(eventName(DragUpdate{Position{0, 0}, true})) == "DRAG_UPDATE");
    REQUIRE(std::string(eventName(DragCancel{})) == "DRAG_CANCEL");
    REQUIRE(std::string(eventName(DropBlock{{1, 2}})) == "DROP_BLOCK");
    REQUIRE(std::string(eventName(ClearComplete{})) == "CLEAR_COMPLETE");
    REQUIRE(std::string(eventName(Restart{})) == "RESTART");
    REQUIRE(std::string(eventName(LoadHighScore{3})) == "LOAD_HIGH_SCORE");
}
