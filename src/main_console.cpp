#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "app/AppConfig.hpp"
#include "app/GameSession.hpp"
#include "controller/GameController.hpp"
#include "core/GridEngine.hpp"
#include "core/ScoringEngine.hpp"
#include "core/Types.hpp"
#include "persistence/Stores.hpp"

using namespace blockblast::core;
using blockblast::controller::GameController;
using blockblast::controller::GameSnapshot;

namespace {

char colorLetter(BlockColor color) {
    return static_cast<char>(colorName(color)[0] - 'a' + 'A');
}

// Helper: render grid + inventory as ASCII
void printGame(const GameController& controller) {
    const GameSnapshot s = controller.snapshot();

    std::vector<std::string> lines(GridSize, std::string(GridSize, '.'));
    for (int r = 0; r < GridSize; ++r) {
        for (int c = 0; c < GridSize; ++c) {
            if (const auto cell = s.grid.cell(r, c)) {
                lines[r][c] = colorLetter(*cell);
            }
        }
    }

    // Overlay the hovered drop position
    if (s.currentDrag && s.currentDrag->position) {
        const auto preview = controller.previewPlacement(s.currentDrag->blockIndex,
                                                         *s.currentDrag->position);
        for (const auto& p : preview.cells) {
            if (isWithinBounds(p.row, p.col) && lines[p.row][p.col] == '.') {
                lines[p.row][p.col] = preview.valid ? '+' : 'x';
            }
        }
        for (const auto& p : preview.clearedCells) {
            lines[p.row][p.col] = '*';
        }
    }

    std::cout << "\n==== BLOCK BLAST ====\n";
    std::cout << "Score: " << formatScore(s.score)
              << " | Best: " << formatScore(s.highScore);
    if (s.combo > 0) {
        std::cout << " | Combo " << s.combo << ' ' << formatCombo(getComboMultiplier(s.combo));
    }
    std::cout << " | State: " << phaseName(s.phase) << '\n';

    std::cout << "   01234567\n";
    std::cout << "  +" << std::string(GridSize, '-') << "+\n";
    for (int r = 0; r < GridSize; ++r) {
        std::cout << r << " |" << lines[r] << "|\n";
    }
    std::cout << "  +" << std::string(GridSize, '-') << "+\n";

    // Inventory, side by side
    int tallest = 0;
    for (const auto& slot : s.inventory) {
        if (slot) tallest = std::max(tallest, slot->shape.rows());
    }
    std::cout << "Inventory:\n";
    for (int i = 0; i < InventorySize; ++i) {
        std::cout << "  [" << i << "]   ";
    }
    std::cout << '\n';
    for (int r = 0; r < tallest; ++r) {
        for (const auto& slot : s.inventory) {
            std::string row(7, ' ');
            if (slot && r < slot->shape.rows()) {
                for (int c = 0; c < slot->shape.cols(); ++c) {
                    if (slot->shape.filled(r, c)) row[2 + c] = colorLetter(slot->color);
                }
            }
            std::cout << row << "  ";
        }
        std::cout << '\n';
    }

    std::cout << "Commands:\n"
              << "  d S = pick slot S, m R C = hover, x R C = drop, c = cancel\n"
              << "  p S R C = pick and drop in one go\n"
              << "  r = restart, q = quit\n";
}

void reportClear(const GameController& controller) {
    const GameSnapshot s = controller.snapshot();
    if (!s.isClearing || !s.lastClear) return;

    const auto cells = GameController::getCellsToClear(*s.lastClear);
    std::cout << "Cleared " << s.lastClear->totalLines << " line(s), "
              << cells.size() << " cell(s)";
    if (s.combo > 1) {
        std::cout << " - combo " << formatCombo(getComboMultiplier(s.combo));
    }
    std::cout << '\n';
}

} // namespace

int main(int argc, char** argv) {
    std::string error;
    const auto config = blockblast::app::parseCommandLine(
        std::vector<std::string>(argv + 1, argv + argc), error);
    if (!config) {
        std::cerr << "blockblast_console: " << error << '\n'
                  << "usage: blockblast_console [--seed=N] [--data-dir=PATH] [--clear-ms=N]\n";
        return 2;
    }

    blockblast::persistence::FileHighScoreStore highScores{config->highScorePath()};
    blockblast::persistence::FileSettingsStore settings{config->settingsPath()};
    blockblast::app::GameSession session{*config, highScores, settings};
    GameController& controller = session.controller();

    std::string cmd;
    printGame(controller);

    while (true) {
        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, cmd)) {
            break; // EOF
        }
        if (cmd.empty()) {
            continue;
        }

        std::istringstream in(cmd);
        char c = 0;
        in >> c;
        if (c == 'q' || c == 'Q') {
            std::cout << "Quitting.\n";
            break;
        }

        int a = 0, b = 0, d = 0;
        bool accepted = true;

        switch (c) {
        case 'd': case 'D':
            if (in >> a) accepted = controller.dragStart(a);
            break;
        case 'm': case 'M':
            if (in >> a >> b && controller.snapshot().currentDrag) {
                const int slot = controller.snapshot().currentDrag->blockIndex;
                accepted = controller.dragUpdate(Position{a, b}, controller.canPlaceSlotAt(slot, {a, b}));
            }
            break;
        case 'x': case 'X':
            if (in >> a >> b) accepted = controller.dropBlock(Position{a, b});
            break;
        case 'c': case 'C':
            accepted = controller.dragCancel();
            break;
        case 'p': case 'P':
            if (in >> a >> b >> d) {
                accepted = controller.dragStart(a) && controller.dropBlock(Position{b, d});
            }
            break;
        case 'r': case 'R':
            accepted = controller.restart();
            break;
        default:
            std::cout << "Unknown command: " << c << '\n';
            continue;
        }

        if (!accepted) {
            std::cout << "Not now (state: " << phaseName(controller.phase()) << ")\n";
        }

        // No animation here: acknowledge the clear straight away
        if (controller.snapshot().isClearing) {
            reportClear(controller);
            controller.clearComplete();
        }

        printGame(controller);

        if (controller.snapshot().isGameOver) {
            std::cout << "GAME OVER. Press 'r' to restart or 'q' to quit.\n";
        }
    }

    return 0;
}
