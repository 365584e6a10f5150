#include "persistence/Settings.hpp"

#include <limits>
#include <sstream>
#include <vector>

namespace blockblast::persistence {

namespace {
    std::optional<bool> parseFlag(const std::string& field) {
        if (field == "1") return true;
        if (field == "0") return false;
        return std::nullopt;
    }

    std::string trimmed(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return {};
        const auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }
}

std::string serializeSettings(const Settings& settings)
{
    std::ostringstream os;
    os << "SETTINGS;"
       << (settings.soundEnabled ? 1 : 0) << ';'
       << (settings.musicEnabled ? 1 : 0) << ';'
       << (settings.hapticsEnabled ? 1 : 0);
    return os.str();
}

std::optional<Settings> deserializeSettings(const std::string& line)
{
    std::istringstream is(trimmed(line));
    std::vector<std::string> fields;
    std::string field;
    while (std::getline(is, field, ';')) {
        fields.push_back(field);
    }

    if (fields.size() != 4 || fields[0] != "SETTINGS") {
        return std::nullopt;
    }

    const auto sound   = parseFlag(fields[1]);
    const auto music   = parseFlag(fields[2]);
    const auto haptics = parseFlag(fields[3]);
    if (!sound || !music || !haptics) {
        return std::nullopt;
    }

    return Settings{*sound, *music, *haptics};
}

std::optional<std::uint64_t> parseHighScore(const std::string& line)
{
    const std::string text = trimmed(line);
    if (text.empty() || text.size() > 19) {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }

    // LOAD_HIGH_SCORE carries a signed value
    if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::nullopt;
    }
    return value;
}

} // namespace blockblast::persistence
