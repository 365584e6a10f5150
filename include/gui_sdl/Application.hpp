#pragma once

#include <memory>

#include <SDL.h>

#include "gui_sdl/Screen.hpp"
#include "app/GameSession.hpp"

namespace blockblast::gui_sdl {

/// SDL window, renderer and Dear ImGui context around one game session.
/// Owns the current screen; screens reach the game through session().
class Application {
public:
    /// The session must outlive the application.
    explicit Application(app::GameSession& session);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    bool init(const char* title, int width, int height);
    int run();

    void requestQuit() { m_running = false; }

    // Takes effect after the current frame
    void setScreen(std::unique_ptr<Screen> screen);

    app::GameSession& session() { return m_session; }

    SDL_Window* window() const { return m_window; }
    SDL_Renderer* renderer() const { return m_renderer; }

    void getWindowSize(int& w, int& h) const;

private:
    bool createWindow(const char* title, int width, int height);
    void initImGui();
    void shutdown();

    void pollEvents();
    void frame(float dtSeconds);

private:
    app::GameSession& m_session;

    bool m_running{false};
    bool m_imguiReady{false};

    SDL_Window* m_window{nullptr};
    SDL_Renderer* m_renderer{nullptr};

    std::unique_ptr<Screen> m_screen;
    std::unique_ptr<Screen> m_pendingScreen;
};

} // namespace blockblast::gui_sdl
