#include "gui_sdl/GameScreen.hpp"

#include <algorithm>
#include <cfloat>
#include <cstdint>

#include <imgui.h>
#include <SDL.h>

#include "gui_sdl/Application.hpp"
#include "gui_sdl/Palette.hpp"
#include "gui_sdl/SettingsPanel.hpp"
#include "gui_sdl/StartScreen.hpp"
#include "controller/GameController.hpp"
#include "core/GridEngine.hpp"
#include "core/ScoringEngine.hpp"

namespace blockblast::gui_sdl {

using blockblast::controller::GameController;
using blockblast::controller::GameSnapshot;
using blockblast::core::GridSize;
using blockblast::core::InventorySize;
using blockblast::core::Position;

namespace {

void setDrawColor(SDL_Renderer* renderer, ImU32 col)
{
    std::uint8_t r, g, b, a;
    unpackImU32(col, r, g, b, a);
    SDL_SetRenderDrawColor(renderer, r, g, b, a);
}

void fillCell(SDL_Renderer* renderer, int x, int y, int size, ImU32 col)
{
    setDrawColor(renderer, col);
    SDL_Rect rc{x + 1, y + 1, size - 2, size - 2};
    SDL_RenderFillRect(renderer, &rc);

    // darker outline for a bevelled look
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 60);
    SDL_RenderDrawRect(renderer, &rc);
}

// Top-left of a block drawn centered in its tray slot
void trayOrigin(const core::Shape& shape, int slotX, int slotY, int slotW, int slotH, int cell,
                int& ox, int& oy)
{
    ox = slotX + (slotW - shape.cols() * cell) / 2;
    oy = slotY + (slotH - shape.rows() * cell) / 2;
}

} // namespace

GameScreen::Layout GameScreen::computeLayout(int windowW, int windowH) const
{
    Layout L{};
    const int margin = 20;

    const int usableW = windowW - margin * 3 - L.hudW;
    const int usableH = windowH - margin * 3;

    // Board takes 8 cells, tray about 3.5 more
    int cell = std::min(usableW / GridSize, static_cast<int>(usableH / (GridSize + 3.5f)));
    cell = std::clamp(cell, 24, 72);

    L.cell = cell;
    L.boardW = GridSize * cell;
    L.boardH = GridSize * cell;

    const int groupW = L.boardW + margin + L.hudW;
    L.boardX = std::max(margin, (windowW - groupW) / 2);
    L.boardY = margin;

    L.trayX = L.boardX;
    L.trayY = L.boardY + L.boardH + margin;
    L.slotW = L.boardW / InventorySize;
    L.slotH = std::max(cell * 3, 72);
    L.trayCell = std::max(10, static_cast<int>(cell * 0.55f));

    L.hudX = L.boardX + L.boardW + margin;
    L.hudY = L.boardY;
    return L;
}

input::BoardGeometry GameScreen::boardGeometry(const Layout& L) const
{
    return input::BoardGeometry{float(L.boardX), float(L.boardY), float(L.cell)};
}

int GameScreen::slotAt(const Layout& L, int px, int py) const
{
    if (py < L.trayY || py >= L.trayY + L.slotH) return -1;
    if (px < L.trayX || px >= L.trayX + L.slotW * InventorySize) return -1;
    return (px - L.trayX) / L.slotW;
}

// -------------------- input --------------------

void GameScreen::handleEvent(Application& app, const SDL_Event& e)
{
    // Let ImGui windows keep their clicks
    if (ImGui::GetCurrentContext() && ImGui::GetIO().WantCaptureMouse &&
        drag_.slot < 0 && e.type == SDL_MOUSEBUTTONDOWN) {
        return;
    }

    int winW = 0, winH = 0;
    app.getWindowSize(winW, winH);
    const Layout L = computeLayout(winW, winH);
    GameController& controller = app.session().controller();

    switch (e.type) {
    case SDL_MOUSEBUTTONDOWN:
        if (e.button.button == SDL_BUTTON_LEFT) {
            beginDrag(controller, L, e.button.x, e.button.y);
        }
        break;
    case SDL_MOUSEMOTION:
        if (drag_.slot >= 0) {
            moveDrag(controller, L, e.motion.x, e.motion.y);
        }
        break;
    case SDL_MOUSEBUTTONUP:
        if (e.button.button == SDL_BUTTON_LEFT && drag_.slot >= 0) {
            moveDrag(controller, L, e.button.x, e.button.y);
            endDrag(controller);
        }
        break;
    case SDL_KEYDOWN:
        if (e.key.repeat != 0) break;
        switch (e.key.keysym.sym) {
            case SDLK_ESCAPE:
                if (drag_.slot >= 0) {
                    controller.dragCancel();
                    drag_ = Drag{};
                }
                break;
            case SDLK_r:
                if (controller.snapshot().isGameOver) {
                    controller.restart();
                }
                break;
            case SDLK_BACKSPACE:
                app.session().leaveGame();
                drag_ = Drag{};
                app.setScreen(std::make_unique<StartScreen>());
                break;
            default:
                break;
        }
        break;
    default:
        break;
    }
}

void GameScreen::beginDrag(GameController& controller, const Layout& L, int px, int py)
{
    const int slot = slotAt(L, px, py);
    if (slot < 0) return;

    const auto& item = controller.context().inventory[static_cast<std::size_t>(slot)];
    if (!item) return;

    if (!controller.dragStart(slot)) {
        return; // busy (clearing, game over)
    }

    int ox = 0, oy = 0;
    trayOrigin(item->shape, L.trayX + slot * L.slotW, L.trayY, L.slotW, L.slotH, L.trayCell, ox, oy);

    // Keep the grabbed point under the pointer once the block grows to board size
    drag_ = Drag{};
    drag_.slot = slot;
    drag_.grabDx = std::clamp((px - ox) / float(L.trayCell), 0.0f, float(item->shape.cols()));
    drag_.grabDy = std::clamp((py - oy) / float(L.trayCell), 0.0f, float(item->shape.rows()));
    drag_.pointerX = float(px);
    drag_.pointerY = float(py);
}

void GameScreen::moveDrag(GameController& controller, const Layout& L, int px, int py)
{
    drag_.pointerX = float(px);
    drag_.pointerY = float(py);

    const auto& item = controller.context().inventory[static_cast<std::size_t>(drag_.slot)];
    if (!item) return;

    const float left = px - drag_.grabDx * L.cell;
    const float top  = py - drag_.grabDy * L.cell;
    const auto geometry = boardGeometry(L);

    // Prefer the best fitting overlap; fall back to plain rounding so an
    // invalid hover still shows a red ghost
    auto anchor = input::bestOverlapAnchor(geometry, left, top, *item, controller.context().grid);
    if (!anchor) {
        anchor = input::roundedAnchor(geometry, left, top, item->shape);
    }

    const bool sameAnchor = (anchor.has_value() == drag_.anchor.has_value()) &&
                            (!anchor || *anchor == *drag_.anchor);
    if (sameAnchor) return;

    drag_.anchor = anchor;
    const bool valid = anchor && controller.canPlaceSlotAt(drag_.slot, *anchor);
    controller.dragUpdate(anchor, valid);
}

void GameScreen::endDrag(GameController& controller)
{
    if (drag_.anchor) {
        controller.dropBlock(*drag_.anchor);
    } else {
        controller.dragCancel();
    }
    drag_ = Drag{};
}

// -------------------- animation --------------------

void GameScreen::update(Application& app, float dtSeconds)
{
    GameController& controller = app.session().controller();
    const GameSnapshot s = controller.snapshot();

    if (!s.isDragging && drag_.slot >= 0) {
        drag_ = Drag{};
    }

    // A drag this screen did not start has no pointer to finish it
    if (s.isDragging && drag_.slot < 0) {
        controller.dragCancel();
    }

    if (s.isClearing && !clearing_) {
        clearing_ = true;
        clearElapsedSec_ = 0.0f;
        clearingCells_ = s.lastClear ? GameController::getCellsToClear(*s.lastClear)
                                     : std::vector<Position>{};
    }

    if (clearing_) {
        clearElapsedSec_ += dtSeconds;
        clearDurationSec_ = app.session().config().clearAnimationMs / 1000.0f;
        if (clearElapsedSec_ >= clearDurationSec_) {
            clearing_ = false;
            clearingCells_.clear();
            controller.clearComplete();
        }
    }
}

// -------------------- rendering --------------------

void GameScreen::render(Application& app)
{
    int winW = 0, winH = 0;
    app.getWindowSize(winW, winH);
    const Layout L = computeLayout(winW, winH);

    const GameController& controller = app.session().controller();
    const GameSnapshot s = controller.snapshot();
    SDL_Renderer* renderer = app.renderer();

    renderBoard(renderer, controller, L);
    renderTray(renderer, s, L);
    renderDragged(renderer, s, L);
    renderHUD(app, s, L);
    renderGameOver(app, s, L);

    renderSettingsPanel(app, &showSettings_);
}

void GameScreen::renderBoard(SDL_Renderer* renderer, const GameController& controller,
                             const Layout& L) const
{
    const GameSnapshot s = controller.snapshot();
    const int x = L.boardX;
    const int y = L.boardY;
    const int cs = L.cell;

    setDrawColor(renderer, Palette::gridBackground());
    SDL_Rect boardRect{x, y, L.boardW, L.boardH};
    SDL_RenderFillRect(renderer, &boardRect);

    for (int r = 0; r < GridSize; ++r) {
        for (int c = 0; c < GridSize; ++c) {
            const auto cell = s.grid.cell(r, c);
            fillCell(renderer, x + c * cs, y + r * cs, cs,
                     cell ? colorForBlock(*cell) : Palette::cellEmpty());
        }
    }

    setDrawColor(renderer, Palette::gridLine());
    for (int i = 0; i <= GridSize; ++i) {
        SDL_RenderDrawLine(renderer, x, y + i * cs, x + L.boardW, y + i * cs);
        SDL_RenderDrawLine(renderer, x + i * cs, y, x + i * cs, y + L.boardH);
    }

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    // Ghost preview and the lines it would complete
    const int dragIndex = s.currentDrag ? s.currentDrag->blockIndex : -1;
    if (s.currentDrag && s.currentDrag->position && dragIndex >= 0 && dragIndex < InventorySize) {
        const auto preview = controller.previewPlacement(dragIndex, *s.currentDrag->position);
        const auto& slot = s.inventory[static_cast<std::size_t>(dragIndex)];

        if (slot) {
            std::uint8_t r, g, b, a;
            unpackImU32(colorForBlock(slot->color), r, g, b, a);
            SDL_SetRenderDrawColor(renderer, r, g, b, 110);
            for (const auto& p : preview.clearedCells) {
                SDL_Rect rc{x + p.col * cs + 3, y + p.row * cs + 3, cs - 6, cs - 6};
                SDL_RenderFillRect(renderer, &rc);
            }
        }

        setDrawColor(renderer, s.currentDrag->isValid ? Palette::ghostValid() : Palette::ghostInvalid());
        for (const auto& p : preview.cells) {
            if (!core::isWithinBounds(p.row, p.col)) continue;
            SDL_Rect rc{x + p.col * cs + 1, y + p.row * cs + 1, cs - 2, cs - 2};
            SDL_RenderFillRect(renderer, &rc);
        }
    }

    // Fading flash over the cells that were just cleared
    if (clearing_ && !clearingCells_.empty()) {
        const float t = clearDurationSec_ > 0.0f
                            ? std::clamp(clearElapsedSec_ / clearDurationSec_, 0.0f, 1.0f)
                            : 1.0f;
        std::uint8_t r, g, b, a;
        unpackImU32(Palette::clearFlash(), r, g, b, a);
        SDL_SetRenderDrawColor(renderer, r, g, b, static_cast<std::uint8_t>(a * (1.0f - t)));
        for (const auto& p : clearingCells_) {
            SDL_Rect rc{x + p.col * cs + 1, y + p.row * cs + 1, cs - 2, cs - 2};
            SDL_RenderFillRect(renderer, &rc);
        }
    }

    if (s.isGameOver) {
        setDrawColor(renderer, Palette::overlay());
        SDL_RenderFillRect(renderer, &boardRect);
    }

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
}

void GameScreen::renderTray(SDL_Renderer* renderer, const GameSnapshot& s, const Layout& L) const
{
    for (int i = 0; i < InventorySize; ++i) {
        const int sx = L.trayX + i * L.slotW;

        setDrawColor(renderer, Palette::slotBackground());
        SDL_Rect slotRect{sx + 4, L.trayY, L.slotW - 8, L.slotH};
        SDL_RenderFillRect(renderer, &slotRect);

        const auto& item = s.inventory[static_cast<std::size_t>(i)];
        if (!item || i == drag_.slot) continue; // picked up or already placed

        int ox = 0, oy = 0;
        trayOrigin(item->shape, sx, L.trayY, L.slotW, L.slotH, L.trayCell, ox, oy);
        for (const auto& c : item->shape.cells()) {
            fillCell(renderer, ox + c.col * L.trayCell, oy + c.row * L.trayCell, L.trayCell,
                     colorForBlock(item->color));
        }
    }
}

void GameScreen::renderDragged(SDL_Renderer* renderer, const GameSnapshot& s, const Layout& L) const
{
    if (drag_.slot < 0 || !s.isDragging) return;

    const auto& item = s.inventory[static_cast<std::size_t>(drag_.slot)];
    if (!item) return;

    const int left = static_cast<int>(drag_.pointerX - drag_.grabDx * L.cell);
    const int top  = static_cast<int>(drag_.pointerY - drag_.grabDy * L.cell);

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    std::uint8_t r, g, b, a;
    unpackImU32(colorForBlock(item->color), r, g, b, a);
    for (const auto& c : item->shape.cells()) {
        SDL_SetRenderDrawColor(renderer, r, g, b, 200);
        SDL_Rect rc{left + c.col * L.cell + 1, top + c.row * L.cell + 1, L.cell - 2, L.cell - 2};
        SDL_RenderFillRect(renderer, &rc);
    }
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
}

void GameScreen::renderHUD(Application& app, const GameSnapshot& s, const Layout& L)
{
    ImGui::SetNextWindowPos(ImVec2((float)L.hudX, (float)L.hudY), ImGuiCond_Always);
    ImGui::SetNextWindowSizeConstraints(ImVec2((float)L.hudW, 0.0f), ImVec2((float)L.hudW, 400.0f));
    ImGui::Begin("Game", nullptr,
                 ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_AlwaysAutoResize);

    ImGui::Text("Score: %s", core::formatScore(s.score).c_str());
    ImGui::Text("Best:  %s", core::formatScore(s.highScore).c_str());

    ImGui::Separator();

    if (s.combo > 1) {
        ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.24f, 1.0f), "Combo %d  %s", s.combo,
                           core::formatCombo(core::getComboMultiplier(s.combo)).c_str());
    } else {
        ImGui::TextDisabled("No combo");
    }

    ImGui::Separator();

    if (ImGui::Button("Settings", ImVec2(-1, 0))) {
        showSettings_ = true;
    }

    if (ImGui::Button("Restart", ImVec2(-1, 0))) {
        app.session().controller().restart();
    }

    if (ImGui::Button("Back to Menu", ImVec2(-1, 0))) {
        app.session().leaveGame();
        drag_ = Drag{};
        app.setScreen(std::make_unique<StartScreen>());
    }

    ImGui::Separator();
    ImGui::TextUnformatted("Drag a block onto the grid.");
    ImGui::TextUnformatted("Esc: cancel drag");
    ImGui::TextUnformatted("Backspace: menu");

    ImGui::End();
}

void GameScreen::renderGameOver(Application& app, const GameSnapshot& s, const Layout& L)
{
    if (!s.isGameOver) return;

    ImDrawList* dl = ImGui::GetForegroundDrawList();

    const float cx = L.boardX + L.boardW * 0.5f;
    const float cy = L.boardY + L.boardH * 0.5f;

    ImGuiIO& io = ImGui::GetIO();
    ImFont* bigFont = (io.Fonts->Fonts.Size > 1) ? io.Fonts->Fonts[1] : ImGui::GetFont();
    const char* msg = "GAME OVER";
    ImVec2 tSize = bigFont->CalcTextSizeA(bigFont->FontSize, FLT_MAX, 0.0f, msg);
    dl->AddText(bigFont, bigFont->FontSize,
                ImVec2(cx - tSize.x * 0.5f, cy - 80.0f),
                IM_COL32(255, 255, 255, 255), msg);

    ImGui::SetNextWindowPos(ImVec2(cx, cy + 10.0f), ImGuiCond_Always, ImVec2(0.5f, 0.0f));
    ImGui::SetNextWindowSize(ImVec2(260, 0), ImGuiCond_Always);
    ImGui::Begin("Results", nullptr,
                 ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse |
                 ImGuiWindowFlags_NoResize | ImGuiWindowFlags_AlwaysAutoResize);

    ImGui::Text("Score: %s", core::formatScore(s.score).c_str());
    if (s.score > 0 && s.score >= s.highScore) {
        ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.24f, 1.0f), "New best!");
    } else {
        ImGui::Text("Best:  %s", core::formatScore(s.highScore).c_str());
    }

    if (ImGui::Button("Play Again", ImVec2(-1, 0))) {
        app.session().controller().restart();
    }

    ImGui::End();
}

} // namespace blockblast::gui_sdl
