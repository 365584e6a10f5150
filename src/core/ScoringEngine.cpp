#include "core/ScoringEngine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace blockblast::core {

std::uint64_t getBasePoints(int lineCount) noexcept {
    if (lineCount <= 0) return 0;

    switch (lineCount) {
    case 1: return 100;
    case 2: return 300;
    case 3: return 600;
    case 4: return 1000;
    default:
        // Beyond the table: linear +300 per extra line
        return 1000 + static_cast<std::uint64_t>(lineCount - 4) * 300;
    }
}

double getComboMultiplier(int comboCount) noexcept {
    const double multiplier = 1.0 + (comboCount - 1) * 0.5;
    return std::min(multiplier, MaxComboMultiplier);
}

ScoreResult calculateScore(const LineClearResult& lineClear, int comboCount) noexcept {
    ScoreResult result;
    result.basePoints = getBasePoints(lineClear.totalLines);
    result.multiplier = comboCount > 0 ? getComboMultiplier(comboCount) : 1.0;
    result.points = static_cast<std::uint64_t>(
        std::floor(static_cast<double>(result.basePoints) * result.multiplier));
    return result;
}

std::uint64_t getPlacementPoints(int cellCount) noexcept {
    return cellCount > 0 ? static_cast<std::uint64_t>(cellCount) : 0;
}

std::string formatScore(std::uint64_t score) {
    std::string digits = std::to_string(score);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);

    int sinceGroup = static_cast<int>(digits.size() % 3);
    if (sinceGroup == 0) sinceGroup = 3;

    for (char c : digits) {
        if (sinceGroup == 0) {
            out.push_back(',');
            sinceGroup = 3;
        }
        out.push_back(c);
        --sinceGroup;
    }
    return out;
}

std::string formatCombo(double multiplier) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "x%.1f", multiplier);
    return buf;
}

} // namespace blockblast::core
