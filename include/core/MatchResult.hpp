#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/Player.hpp"

namespace blokus::core {

enum class MatchOutcome : std::uint8_t {
    Win,
    Lose,
    Draw
};

struct MatchResult {
    std::size_t seat{};
    TileColor color{TileColor::Empty};
    MatchOutcome outcome{MatchOutcome::Lose};
    int remainingSquares{}; // lower is better
};

// One result per player, in seat order.
// - Fewest remaining squares wins.
// - Several players tied on the best value => all of them Draw.
std::vector<MatchResult> computeResults(const std::vector<Player>& players);

} // namespace blokus::core
