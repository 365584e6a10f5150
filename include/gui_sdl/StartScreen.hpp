#pragma once

#include "gui_sdl/Screen.hpp"

#include <random>
#include <vector>

#include "core/BlockFactory.hpp"
#include "core/Grid.hpp"
#include "core/Types.hpp"

namespace blockblast::gui_sdl {

// Menu over a self-playing demo board
class StartScreen final : public Screen {
public:
    StartScreen();
    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, float dtSeconds) override;
    void render(Application& app) override;

private:
    // demo board
    core::BlockFactory demoFactory_;
    core::Grid demoGrid_;
    core::LineClearResult demoPending_;
    std::vector<core::Position> demoFlash_;
    float demoTimer_{0.0f};

    std::mt19937 rng_;
    bool showSettings_{false};

    void demoStep();
    void renderDemo(SDL_Renderer* r, int w, int h) const;
};

} // namespace blockblast::gui_sdl
