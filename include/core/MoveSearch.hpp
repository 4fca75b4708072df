#pragma once

#include "core/Board.hpp"
#include "core/Player.hpp"

namespace blokus::core {

// True if `player` can legally put any remaining piece, in any of its 8
// orientations, anywhere on `board`. Read-only; stops at the first hit.
bool canMakeMove(const Board& board, const Player& player);

// Same search for a single piece
bool canPlacePiece(const Board& board, TileColor color, PieceId id);

} // namespace blokus::core
