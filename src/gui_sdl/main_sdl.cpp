#include "app/AppConfig.hpp"
#include "app/GameSession.hpp"
#include "gui_sdl/Application.hpp"
#include "gui_sdl/StartScreen.hpp"
#include "persistence/Stores.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    using namespace blockblast;

    std::string error;
    const auto config = app::parseCommandLine(std::vector<std::string>(argv + 1, argv + argc), error);
    if (!config) {
        std::cerr << "blockblast_sdl: " << error << '\n';
        std::cerr << "usage: blockblast_sdl [--seed=N] [--data-dir=DIR] [--clear-ms=MS]\n";
        return 2;
    }

    persistence::FileHighScoreStore highScores{config->highScorePath()};
    persistence::FileSettingsStore settings{config->settingsPath()};
    app::GameSession session{*config, highScores, settings};

    gui_sdl::Application application{session};
    if (!application.init("Block Blast (SDL2 + ImGui)", 900, 760)) {
        return 1;
    }

    application.setScreen(std::make_unique<gui_sdl::StartScreen>());
    return application.run();
}
