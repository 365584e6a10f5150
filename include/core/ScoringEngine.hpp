#pragma once

#include "Types.hpp"
#include <cstdint>
#include <string>

namespace blockblast::core {

// Multiplier never exceeds this value (reached at combo 15)
inline constexpr double MaxComboMultiplier = 8.0;

struct ScoreResult {
    std::uint64_t points{0};
    std::uint64_t basePoints{0};
    double multiplier{1.0};
};

// 1:100, 2:300, 3:600, 4:1000, then +300 per extra line; 0 for no line
std::uint64_t getBasePoints(int lineCount) noexcept;

// 1x at combo 1, +0.5x per further combo step, capped at 8x
double getComboMultiplier(int comboCount) noexcept;

// Points for one clear. `comboCount` is the combo value after this clear;
// a non-positive combo scores with multiplier 1.
ScoreResult calculateScore(const LineClearResult& lineClear, int comboCount) noexcept;

// Every placement earns one point per occupied cell
std::uint64_t getPlacementPoints(int cellCount) noexcept;

// "1,234,567"
std::string formatScore(std::uint64_t score);

// "x1.5"
std::string formatCombo(double multiplier);

} // namespace blockblast::core
