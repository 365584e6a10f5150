#include "gui_sdl/Application.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

#include "gui_sdl/Palette.hpp"

namespace blockblast::gui_sdl {

namespace {
    // A stalled frame must not swallow the whole clear animation
    constexpr float MaxFrameSeconds = 0.1f;

    constexpr int MinWindowWidth = 640;
    constexpr int MinWindowHeight = 600;
}

Application::Application(app::GameSession& session)
    : m_session{session}
{
}

Application::~Application() {
    shutdown();
}

bool Application::init(const char* title, int width, int height) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_EVENTS) != 0) {
        std::fprintf(stderr, "[sdl] SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }

    if (!createWindow(title, width, height)) {
        return false;
    }

    initImGui();

    const auto& config = m_session.config();
    std::fprintf(stderr, "[sdl] data dir '%s', seed %u, clear animation %d ms\n",
                 config.dataDir.c_str(), static_cast<unsigned>(config.seed),
                 config.clearAnimationMs);

    m_running = true;
    return true;
}

bool Application::createWindow(const char* title, int width, int height) {
    m_window = SDL_CreateWindow(
        title,
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        std::max(width, MinWindowWidth), std::max(height, MinWindowHeight),
        SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE
    );
    if (!m_window) {
        std::fprintf(stderr, "[sdl] SDL_CreateWindow failed: %s\n", SDL_GetError());
        return false;
    }
    SDL_SetWindowMinimumSize(m_window, MinWindowWidth, MinWindowHeight);

    m_renderer = SDL_CreateRenderer(
        m_window,
        -1,
        SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC
    );
    if (!m_renderer) {
        std::fprintf(stderr, "[sdl] SDL_CreateRenderer failed: %s\n", SDL_GetError());
        return false;
    }
    return true;
}

void Application::initImGui() {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();

    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 8.0f;
    style.FrameRounding = 6.0f;

    // Fonts[0] for widgets, Fonts[1] for the game over banner
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;
    io.Fonts->AddFontDefault();
    ImFontConfig big;
    big.SizePixels = 30.0f;
    io.Fonts->AddFontDefault(&big);

    ImGui_ImplSDL2_InitForSDLRenderer(m_window, m_renderer);
    ImGui_ImplSDLRenderer2_Init(m_renderer);
    m_imguiReady = true;
}

void Application::shutdown() {
    if (!SDL_WasInit(SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_EVENTS)) {
        return;
    }

    m_pendingScreen.reset();
    m_screen.reset();

    if (m_imguiReady) {
        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        m_imguiReady = false;
    }

    if (m_renderer) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }

    SDL_Quit();
}

void Application::setScreen(std::unique_ptr<Screen> screen) {
    if (!m_screen) {
        m_screen = std::move(screen);
        return;
    }
    // The caller is usually the current screen
    m_pendingScreen = std::move(screen);
}

void Application::getWindowSize(int& w, int& h) const {
    w = 0; h = 0;
    if (m_window) SDL_GetWindowSize(m_window, &w, &h);
}

void Application::pollEvents() {
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
        ImGui_ImplSDL2_ProcessEvent(&e);

        switch (e.type) {
        case SDL_QUIT:
            m_running = false;
            break;
        // Keep receiving the release of a drag that leaves the window
        case SDL_MOUSEBUTTONDOWN:
            SDL_CaptureMouse(SDL_TRUE);
            break;
        case SDL_MOUSEBUTTONUP:
            SDL_CaptureMouse(SDL_FALSE);
            break;
        default:
            break;
        }

        if (m_screen) {
            m_screen->handleEvent(*this, e);
        }
    }
}

void Application::frame(float dtSeconds) {
    if (m_screen) {
        m_screen->update(*this, dtSeconds);
    }

    // Screens draw with SDL first, ImGui goes on top
    std::uint8_t r, g, b, a;
    unpackImU32(Palette::background(), r, g, b, a);
    SDL_SetRenderDrawColor(m_renderer, r, g, b, a);
    SDL_RenderClear(m_renderer);

    ImGui_ImplSDLRenderer2_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();

    if (m_screen) {
        m_screen->render(*this);
    }

    ImGui::Render();
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), m_renderer);
    SDL_RenderPresent(m_renderer);
}

int Application::run() {
    using clock = std::chrono::steady_clock;
    auto last = clock::now();

    while (m_running) {
        pollEvents();
        if (!m_running) break;

        const auto now = clock::now();
        const float dt = std::min(std::chrono::duration<float>(now - last).count(), MaxFrameSeconds);
        last = now;

        frame(dt);

        if (m_pendingScreen) {
            m_screen = std::move(m_pendingScreen);
        }
    }

    return 0;
}

} // namespace blockblast::gui_sdl
