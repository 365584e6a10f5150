#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blockblast::app {

struct AppConfig {
    std::string dataDir{"."};
    std::string highScoreFile{"blockblast_highscore.txt"};
    std::string settingsFile{"blockblast_settings.txt"};

    std::uint32_t seed{0};        // 0 = seed from std::random_device
    int clearAnimationMs{350};    // how long the presentation layer flashes cleared lines

    std::string highScorePath() const { return join(highScoreFile); }
    std::string settingsPath() const { return join(settingsFile); }

private:
    std::string join(const std::string& file) const {
        if (dataDir.empty()) return file;
        const char last = dataDir.back();
        return (last == '/' || last == '\\') ? dataDir + file : dataDir + '/' + file;
    }
};

/// Accepts --seed=N, --data-dir=PATH and --clear-ms=N (program name excluded).
/// Returns std::nullopt on an unknown option or a malformed value; `error`
/// then describes the problem.
std::optional<AppConfig> parseCommandLine(const std::vector<std::string>& args, std::string& error);

} // namespace blockblast::app
