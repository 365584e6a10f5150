#include "app/AppConfig.hpp"

#include <limits>

namespace blockblast::app {

namespace {
    bool startsWith(const std::string& s, const std::string& prefix) {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    std::optional<std::uint64_t> parseUnsigned(const std::string& text) {
        if (text.empty() || text.size() > 10) return std::nullopt;
        std::uint64_t value = 0;
        for (char c : text) {
            if (c < '0' || c > '9') return std::nullopt;
            value = value * 10 + static_cast<std::uint64_t>(c - '0');
        }
        return value;
    }
}

std::optional<AppConfig> parseCommandLine(const std::vector<std::string>& args, std::string& error)
{
    AppConfig config;

    for (const auto& arg : args) {
        if (startsWith(arg, "--seed=")) {
            const auto value = parseUnsigned(arg.substr(7));
            if (!value || *value > std::numeric_limits<std::uint32_t>::max()) {
                error = "invalid seed: " + arg;
                return std::nullopt;
            }
            config.seed = static_cast<std::uint32_t>(*value);
        } else if (startsWith(arg, "--data-dir=")) {
            config.dataDir = arg.substr(11);
            if (config.dataDir.empty()) {
                error = "empty data directory";
                return std::nullopt;
            }
        } else if (startsWith(arg, "--clear-ms=")) {
            const auto value = parseUnsigned(arg.substr(11));
            if (!value || *value > 10000) {
                error = "invalid clear animation duration: " + arg;
                return std::nullopt;
            }
            config.clearAnimationMs = static_cast<int>(*value);
        } else {
            error = "unknown option: " + arg;
            return std::nullopt;
        }
    }

    return config;
}

} // namespace blockblast::app
