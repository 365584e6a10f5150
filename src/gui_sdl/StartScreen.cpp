#include "gui_sdl/StartScreen.hpp"
#include "gui_sdl/Application.hpp"
#include "gui_sdl/GameScreen.hpp"
#include "gui_sdl/Palette.hpp"
#include "gui_sdl/SettingsPanel.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>

#include <SDL.h>
#include <imgui.h>

#include "core/GridEngine.hpp"
#include "core/ScoringEngine.hpp"

namespace blockblast::gui_sdl {

namespace {
    constexpr float DemoPlaceSec = 0.45f; // one block per tick
    constexpr float DemoFlashSec = 0.35f;
}

StartScreen::StartScreen()
    : demoFactory_{std::random_device{}()}
    , rng_{std::random_device{}()}
{
}

void StartScreen::handleEvent(Application&, const SDL_Event&) {}

void StartScreen::update(Application&, float dtSeconds)
{
    demoTimer_ += dtSeconds;

    if (!demoFlash_.empty()) {
        if (demoTimer_ >= DemoFlashSec) {
            demoGrid_ = core::clearLines(demoGrid_, demoPending_);
            demoFlash_.clear();
            demoTimer_ = 0.0f;
        }
        return;
    }

    if (demoTimer_ >= DemoPlaceSec) {
        demoTimer_ = 0.0f;
        demoStep();
    }
}

// Drops a random block on a random fitting anchor; wipes the board when stuck
void StartScreen::demoStep()
{
    const core::Block block = demoFactory_.generateRandomBlock(0);

    std::vector<core::Position> anchors;
    for (int r = 0; r < core::GridSize; ++r) {
        for (int c = 0; c < core::GridSize; ++c) {
            if (core::canPlaceBlock(demoGrid_, block, {r, c})) {
                anchors.push_back({r, c});
            }
        }
    }

    if (anchors.empty()) {
        demoGrid_ = core::createEmptyGrid();
        return;
    }

    std::uniform_int_distribution<std::size_t> pick(0, anchors.size() - 1);
    demoGrid_ = core::placeBlock(demoGrid_, block, anchors[pick(rng_)]);

    demoPending_ = core::checkLineClears(demoGrid_);
    if (demoPending_.totalLines > 0) {
        demoFlash_ = core::getCellsToClear(demoPending_);
    }
}

void StartScreen::render(Application& app)
{
    int w = 0, h = 0;
    app.getWindowSize(w, h);

    renderDemo(app.renderer(), w, h);

    ImGui::SetNextWindowPos(ImVec2(w * 0.5f, h * 0.5f), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(400, 240), ImGuiCond_Always);

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoMove;

    ImGui::Begin("Block Blast", nullptr, flags);

    const auto best = app.session().controller().context().highScore;
    ImGui::Text("Best: %s", core::formatScore(best).c_str());
    ImGui::Separator();

    if (ImGui::Button("Play", ImVec2(-1, 44))) {
        app.setScreen(std::make_unique<GameScreen>());
    }

    if (ImGui::Button("Settings", ImVec2(-1, 40))) {
        showSettings_ = true;
    }

    if (ImGui::Button("Quit", ImVec2(-1, 40))) {
        app.requestQuit();
    }

    ImGui::End();

    renderSettingsPanel(app, &showSettings_);
}

void StartScreen::renderDemo(SDL_Renderer* r, int w, int h) const
{
    const int cs = std::max(16, std::min(w, h) / (core::GridSize + 2));
    const int size = cs * core::GridSize;
    const int x0 = (w - size) / 2;
    const int y0 = (h - size) / 2;

    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_BLEND);

    std::uint8_t rr, gg, bb, aa;
    unpackImU32(Palette::gridBackground(), rr, gg, bb, aa);
    SDL_SetRenderDrawColor(r, rr, gg, bb, 160);
    SDL_Rect boardRect{x0, y0, size, size};
    SDL_RenderFillRect(r, &boardRect);

    for (int row = 0; row < core::GridSize; ++row) {
        for (int col = 0; col < core::GridSize; ++col) {
            const auto cell = demoGrid_.cell(row, col);
            if (!cell) continue;

            unpackImU32(colorForBlock(*cell), rr, gg, bb, aa);
            SDL_SetRenderDrawColor(r, rr, gg, bb, 90);
            SDL_Rect rc{x0 + col * cs + 1, y0 + row * cs + 1, cs - 2, cs - 2};
            SDL_RenderFillRect(r, &rc);
        }
    }

    if (!demoFlash_.empty()) {
        const float t = std::clamp(demoTimer_ / DemoFlashSec, 0.0f, 1.0f);
        SDL_SetRenderDrawColor(r, 255, 255, 255, static_cast<std::uint8_t>(140.0f * (1.0f - t)));
        for (const auto& p : demoFlash_) {
            SDL_Rect rc{x0 + p.col * cs + 1, y0 + p.row * cs + 1, cs - 2, cs - 2};
            SDL_RenderFillRect(r, &rc);
        }
    }

    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_NONE);
}

} // namespace blockblast::gui_sdl
