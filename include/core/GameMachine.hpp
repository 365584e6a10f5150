#pragma once

#include "GameContext.hpp"
#include "GameEvent.hpp"
#include "BlockFactory.hpp"
#include <optional>

namespace blockblast::core {

struct MachineState {
    GamePhase phase{GamePhase::Idle};
    GameContext context;
};

// Fresh game: empty grid, three blocks generated at score 0
GameContext createInitialContext(BlockFactory& factory, std::uint64_t highScore = 0);

// Applies one externally delivered event.
// Returns std::nullopt when the current phase does not handle it.
std::optional<MachineState> reduce(const MachineState& state,
                                   const GameEvent& event,
                                   BlockFactory& factory);

// Applies one transition that needs no input (entry refill, Placing,
// CheckingGameOver). Returns std::nullopt once nothing is left to do.
std::optional<MachineState> step(const MachineState& state, BlockFactory& factory);

// True if `phase` waits for external input
bool isStablePhase(GamePhase phase) noexcept;

} // namespace blockblast::core
