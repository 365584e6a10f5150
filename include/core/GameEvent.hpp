#pragma once

#include "Types.hpp"
#include <cstdint>
#include <optional>
#include <variant>

namespace blockblast::core {

// Events delivered by the input and presentation layers.
// These are UI- and platform-agnostic: mouse, touch, console, tests.

struct DragStart {
    int blockIndex{0};
};

struct DragUpdate {
    std::optional<Position> position;
    bool isValid{false};
};

struct DragCancel {};

struct DropBlock {
    Position position;
};

// The clear animation has finished
struct ClearComplete {};

struct Restart {};

// Seeds the high score at startup; negative values count as 0
struct LoadHighScore {
    std::int64_t highScore{0};
};

using GameEvent = std::variant<
    DragStart,
    DragUpdate,
    DragCancel,
    DropBlock,
    ClearComplete,
    Restart,
    LoadHighScore
>;

const char* eventName(const GameEvent& event) noexcept;

} // namespace blockblast::core
