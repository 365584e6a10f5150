#include "persistence/Stores.hpp"

#include <fstream>
#include <iostream>
#include <utility>

namespace blockblast::persistence {

namespace {
    std::optional<std::string> readFirstLine(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            return std::nullopt;
        }
        std::string line;
        if (!std::getline(in, line)) {
            return std::nullopt;
        }
        return line;
    }

    bool writeLine(const std::string& path, const std::string& line) {
        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            return false;
        }
        out << line << '\n';
        out.flush();
        return static_cast<bool>(out);
    }
}

FileHighScoreStore::FileHighScoreStore(std::string path)
    : path_{std::move(path)}
{
}

std::optional<std::uint64_t> FileHighScoreStore::load() {
    const auto line = readFirstLine(path_);
    if (!line) {
        return std::nullopt; // first run
    }

    auto value = parseHighScore(*line);
    if (!value) {
        std::cerr << "[persistence] ignoring malformed high score in " << path_ << '\n';
    }
    return value;
}

bool FileHighScoreStore::save(std::uint64_t highScore) {
    if (!writeLine(path_, std::to_string(highScore))) {
        std::cerr << "[persistence] failed to save high score to " << path_ << '\n';
        return false;
    }
    return true;
}

FileSettingsStore::FileSettingsStore(std::string path)
    : path_{std::move(path)}
{
}

std::optional<Settings> FileSettingsStore::load() {
    const auto line = readFirstLine(path_);
    if (!line) {
        return std::nullopt;
    }

    auto settings = deserializeSettings(*line);
    if (!settings) {
        std::cerr << "[persistence] ignoring malformed settings in " << path_ << '\n';
    }
    return settings;
}

bool FileSettingsStore::save(const Settings& settings) {
    if (!writeLine(path_, serializeSettings(settings))) {
        std::cerr << "[persistence] failed to save settings to " << path_ << '\n';
        return false;
    }
    return true;
}

} // namespace blockblast::persistence
