#pragma once

#include <string>
#include <vector>

#include "core/Types.hpp"

namespace blokus::core {

// Turn order used when the lobby does not say otherwise
std::vector<TileColor> defaultColorOrder();

struct GameConfig {
    int playerCount{4};                                  // 2..4 seats
    std::vector<TileColor> colorOrder{defaultColorOrder()}; // seat i plays colorOrder[i]

    bool keepSelectionOnFailure{true}; // a rejected placement keeps the piece selected
    bool verbose{false};               // controller diagnostics on std::cerr
};

// Throws std::invalid_argument if the config cannot seat a game
void validate(const GameConfig& config);

// Colors of the seats actually in play (first playerCount of colorOrder)
std::vector<TileColor> seatColors(const GameConfig& config);

// Parse command-line style options:
//   --players N         number of seats (2..4)
//   --order RBYG        seat colors by glyph
//   --clear-on-failure  drop the selection when a placement is rejected
//   --verbose           log controller decisions
//   demo                4 seats: Blue, Yellow, Red, Green
// Throws std::invalid_argument on unknown or malformed options.
GameConfig parseArgs(const std::vector<std::string>& args);

} // namespace blokus::core
