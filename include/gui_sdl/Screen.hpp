#pragma once

#include <SDL.h>

namespace blockblast::gui_sdl {

class Application;

// One page of the SDL front-end (menu, game). The application calls
// handleEvent for each SDL event, then update and render once per frame.
class Screen {
public:
    virtual ~Screen() = default;

    virtual void handleEvent(Application& app, const SDL_Event& e) = 0;

    // dtSeconds is capped by the application
    virtual void update(Application& app, float dtSeconds) = 0;

    // SDL drawing first, then ImGui windows
    virtual void render(Application& app) = 0;
};

} // namespace blockblast::gui_sdl
