#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace blockblast::persistence {

// Player preferences; consumed by presentation only, never by the core
struct Settings {
    bool soundEnabled{true};
    bool musicEnabled{true};
    bool hapticsEnabled{true};
};

inline bool operator==(const Settings& a, const Settings& b) noexcept {
    return a.soundEnabled == b.soundEnabled
        && a.musicEnabled == b.musicEnabled
        && a.hapticsEnabled == b.hapticsEnabled;
}

/// Single line of text, e.g. "SETTINGS;1;1;0" (no trailing '\n').
std::string serializeSettings(const Settings& settings);

/// Returns std::nullopt on parse error.
std::optional<Settings> deserializeSettings(const std::string& line);

/// Decimal high score line. Returns std::nullopt unless the whole line
/// is a non-negative integer no larger than INT64_MAX.
std::optional<std::uint64_t> parseHighScore(const std::string& line);

} // namespace blockblast::persistence
