#pragma once

#include "Types.hpp"
#include <bitset>
#include <vector>

namespace blokus::core {

// A seat at the table: a color and the pieces still in hand.
class Player {
public:
    // Starts with all 21 pieces. Throws std::invalid_argument unless `color`
    // is one of the four player colors.
    explicit Player(TileColor color);

    TileColor color() const noexcept { return color_; }

    bool hasPiece(PieceId id) const noexcept;
    // Ascending ids of the pieces still in hand
    std::vector<PieceId> remainingPieces() const;
    int remainingCount() const noexcept { return static_cast<int>(pieces_.count()); }
    bool hasPiecesLeft() const noexcept { return pieces_.any(); }

    // Sum of the cell counts of the pieces still in hand
    int remainingSquares() const;

    // Pieces only ever leave the hand.
    // Throws std::invalid_argument if the piece is not held.
    void removePiece(PieceId id);

private:
    TileColor color_;
    std::bitset<PieceCount> pieces_;
};

} // namespace blokus::core
