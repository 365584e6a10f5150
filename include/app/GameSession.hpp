#pragma once

#include "app/AppConfig.hpp"
#include "controller/GameController.hpp"
#include "persistence/Settings.hpp"
#include "persistence/Stores.hpp"

namespace blockblast::app {

/// Wires the controller to persistence: seeds the high score once at
/// startup and writes it back every time it increases.
/// The stores must outlive the session.
class GameSession {
public:
    GameSession(const AppConfig& config,
                persistence::IHighScoreStore& highScores,
                persistence::ISettingsStore& settingsStore);

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    controller::GameController& controller() noexcept { return controller_; }
    const controller::GameController& controller() const noexcept { return controller_; }

    const persistence::Settings& settings() const noexcept { return settings_; }
    void updateSettings(const persistence::Settings& settings);

    const AppConfig& config() const noexcept { return config_; }

    /// Puts back a block still held when the player leaves the game view.
    /// Returns true if a drag was cancelled.
    bool leaveGame();

private:
    AppConfig config_;
    persistence::IHighScoreStore& highScores_;
    persistence::ISettingsStore& settingsStore_;
    persistence::Settings settings_;
    controller::GameController controller_;

    static core::BlockFactory makeFactory(const AppConfig& config);
};

} // namespace blockblast::app
