#include "controller/GameController.hpp"

#include <iostream>

namespace blokus::controller {

using core::PlacementResult;
using core::Position;

GameController::GameController(blokus::core::GameState& game, bool verbose)
    : game_{game}
    , verbose_{verbose}
{
}

int GameController::beginTurn() {
    int passes = 0;

    // Each forced pass moves to the next seat; stop once everyone has passed.
    while (!game_.isGameOver() && !game_.canMakeMove()) {
        if (verbose_) {
            std::cerr << "[CONTROLLER] "
                      << core::toString(game_.currentPlayer().color())
                      << " has no legal move, passing\n";
        }
        game_.passTurn();
        ++passes;
    }

    hint_.reset();
    return passes;
}

bool GameController::selectPiece(blokus::core::PieceId id) {
    if (game_.isGameOver() || !game_.currentPlayer().hasPiece(id)) {
        return false;
    }

    game_.selectPiece(id);
    refreshHint();
    return true;
}

void GameController::handleAction(InputAction action) {
    using core::FlipDir;
    using core::RotateDir;

    if (game_.isGameOver()) {
        return;
    }

    switch (action) {
    case InputAction::RotateLeft:
        game_.rotatePiece(RotateDir::Left);
        break;
    case InputAction::RotateRight:
        game_.rotatePiece(RotateDir::Right);
        break;
    case InputAction::FlipHorizontal:
        game_.flipPiece(FlipDir::Horizontal);
        break;
    case InputAction::FlipVertical:
        game_.flipPiece(FlipDir::Vertical);
        break;
    case InputAction::Deselect:
        game_.selectPiece(std::nullopt);
        break;
    }

    refreshHint();
}

void GameController::hover(Position anchor) {
    lastAnchor_ = anchor;
    refreshHint();
}

std::optional<PlacementResult> GameController::click(Position anchor) {
    if (game_.isGameOver() || !game_.selectedPiece()) {
        return std::nullopt;
    }

    if (verbose_) {
        const auto origin = core::Board::placementOrigin(game_.pieceBuffer(), anchor);
        std::cerr << "[CONTROLLER] Mapping (" << anchor.row << ", " << anchor.col << ") -> ";
        if (origin) {
            std::cerr << "(" << origin->row << ", " << origin->col << ")\n";
        } else {
            std::cerr << "out of bounds\n";
        }
    }

    const PlacementResult result = game_.attemptPlacement(anchor);

    if (result == PlacementResult::Placed) {
        lastAnchor_.reset();
        beginTurn();
    } else {
        if (verbose_) {
            std::cerr << "[CONTROLLER] Placement rejected\n";
        }
        refreshHint();
    }

    return result;
}

void GameController::refreshHint() {
    if (!lastAnchor_) {
        hint_.reset();
        return;
    }
    hint_ = game_.previewPlacement(*lastAnchor_);
}

} // namespace blokus::controller
