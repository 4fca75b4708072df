#include "core/Player.hpp"
#include "core/PieceCatalog.hpp"

#include <stdexcept>

namespace blokus::core {

Player::Player(TileColor color)
    : color_{color}
{
    if (!isPlayerColor(color)) {
        throw std::invalid_argument("Player color must be Red, Yellow, Green or Blue");
    }
    pieces_.set();
}

bool Player::hasPiece(PieceId id) const noexcept {
    return PieceCatalog::isValidId(id) && pieces_.test(static_cast<std::size_t>(id));
}

std::vector<PieceId> Player::remainingPieces() const {
    std::vector<PieceId> out;
    out.reserve(pieces_.count());
    for (PieceId id = 0; id < PieceCount; ++id) {
        if (pieces_.test(static_cast<std::size_t>(id))) {
            out.push_back(id);
        }
    }
    return out;
}

int Player::remainingSquares() const {
    int squares = 0;
    for (PieceId id : remainingPieces()) {
        squares += PieceCatalog::shapeFor(id).cellCount();
    }
    return squares;
}

void Player::removePiece(PieceId id) {
    if (!hasPiece(id)) {
        throw std::invalid_argument("Player::removePiece piece is not in hand");
    }
    pieces_.reset(static_cast<std::size_t>(id));
}

} // namespace blokus::core
