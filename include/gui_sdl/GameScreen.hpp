#pragma once

#include "gui_sdl/Screen.hpp"

#include <optional>
#include <vector>

#include "core/Types.hpp"
#include "input/DropTargeting.hpp"

namespace blockblast::controller {
class GameController;
struct GameSnapshot;
}

namespace blockblast::gui_sdl {

class GameScreen final : public Screen {
public:
    GameScreen() = default;

    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, float dtSeconds) override;
    void render(Application& app) override;

private:
    struct Layout {
        int cell = 48;

        int boardX = 40;
        int boardY = 40;
        int boardW = 0;
        int boardH = 0;

        // Inventory tray under the board
        int trayX = 0;
        int trayY = 0;
        int slotW = 0;
        int slotH = 0;
        int trayCell = 24;

        // HUD column on the right
        int hudX = 0;
        int hudY = 0;
        int hudW = 240;
    };

    struct Drag {
        int slot{-1};
        float grabDx{0.0f};  // pointer offset from the block's top-left, in board cells
        float grabDy{0.0f};
        float pointerX{0.0f};
        float pointerY{0.0f};
        std::optional<core::Position> anchor;
    };

private:
    Layout computeLayout(int windowW, int windowH) const;
    input::BoardGeometry boardGeometry(const Layout& L) const;

    // Input helpers
    void beginDrag(controller::GameController& controller, const Layout& L, int px, int py);
    void moveDrag(controller::GameController& controller, const Layout& L, int px, int py);
    void endDrag(controller::GameController& controller);
    int slotAt(const Layout& L, int px, int py) const;

    // Rendering helpers
    void renderBoard(SDL_Renderer* renderer, const controller::GameController& controller,
                     const Layout& L) const;
    void renderTray(SDL_Renderer* renderer, const controller::GameSnapshot& s, const Layout& L) const;
    void renderDragged(SDL_Renderer* renderer, const controller::GameSnapshot& s, const Layout& L) const;
    void renderHUD(Application& app, const controller::GameSnapshot& s, const Layout& L);
    void renderGameOver(Application& app, const controller::GameSnapshot& s, const Layout& L);

private:
    Drag drag_;

    // Clear animation; the controller waits in Clearing until it ends
    std::vector<core::Position> clearingCells_;
    float clearElapsedSec_{0.0f};
    float clearDurationSec_{0.35f};
    bool clearing_{false};

    bool showSettings_{false};
};

} // namespace blockblast::gui_sdl
