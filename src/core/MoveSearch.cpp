#include "core/MoveSearch.hpp"
#include "core/PieceCatalog.hpp"

namespace blokus::core {

namespace {

bool fitsAnywhere(const Board& board, const Shape& shape, TileColor color) {
    for (int row = 0; row < PlayAreaSize; ++row) {
        for (int col = 0; col < PlayAreaSize; ++col) {
            // Every catalog shape covers its frame center, so anchoring the
            // center on each play-area cell reaches every in-area placement.
            const auto origin = Board::placementOrigin(shape, Position{row, col});
            if (origin && board.isLegal(shape, *origin, color)) {
                return true;
            }
        }
    }
    return false;
}

} // namespace

bool canPlacePiece(const Board& board, TileColor color, PieceId id) {
    // Local copy; the caller's piece buffer is never touched.
    Shape orientation = PieceCatalog::shapeFor(id);

    for (int flips = 0; flips < 2; ++flips) {
        orientation = flip(orientation, FlipDir::Vertical);
        for (int turns = 0; turns < 4; ++turns) {
            orientation = rotate(orientation, RotateDir::Right);
            if (fitsAnywhere(board, orientation, color)) {
                return true;
            }
        }
    }
    return false;
}

bool canMakeMove(const Board& board, const Player& player) {
    for (PieceId id : player.remainingPieces()) {
        if (canPlacePiece(board, player.color(), id)) {
            return true;
        }
    }
    return false;
}

} // namespace blokus::core
