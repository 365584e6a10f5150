#include "app/GameSession.hpp"

#include <algorithm>
#include <iostream>
#include <limits>

namespace blockblast::app {

core::BlockFactory GameSession::makeFactory(const AppConfig& config) {
    if (config.seed == 0) {
        return core::BlockFactory{};
    }
    return core::BlockFactory{config.seed};
}

GameSession::GameSession(const AppConfig& config,
                         persistence::IHighScoreStore& highScores,
                         persistence::ISettingsStore& settingsStore)
    : config_{config}
    , highScores_{highScores}
    , settingsStore_{settingsStore}
    , settings_{settingsStore.load().value_or(persistence::Settings{})}
    , controller_{makeFactory(config)}
{
    // Seed before installing the listener so loading does not write back
    if (const auto stored = highScores_.load()) {
        const auto limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        controller_.loadHighScore(static_cast<std::int64_t>(std::min(*stored, limit)));
    }

    controller_.setHighScoreListener([this](std::uint64_t value) {
        if (!highScores_.save(value)) {
            std::cerr << "[session] high score " << value << " kept in memory only\n";
        }
    });
}

bool GameSession::leaveGame() {
    if (controller_.phase() != core::GamePhase::Dragging) {
        return false;
    }
    return controller_.dragCancel();
}

void GameSession::updateSettings(const persistence::Settings& settings) {
    settings_ = settings;
    if (!settingsStore_.save(settings_)) {
        std::cerr << "[session] settings kept in memory only\n";
    }
}

} // namespace blockblast::app
