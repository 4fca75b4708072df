#pragma once

#include "core/GameState.hpp"
#include "controller/InputAction.hpp"
#include <optional>

namespace blokus::controller {

class GameController {
public:
    /// Controller does not own the GameState; caller keeps it alive.
    explicit GameController(blokus::core::GameState& game, bool verbose = false);

    /// Skip players that have no legal placement left.
    /// Returns how many forced passes were made.
    int beginTurn();

    /// Select a piece if the current player still holds it.
    bool selectPiece(blokus::core::PieceId id);

    /// Handle a single discrete action on the held piece (e.g. key press).
    void handleAction(InputAction action);

    /// Cursor moved over the play area: refresh the placement hint.
    void hover(blokus::core::Position anchor);

    /// Try to put the held piece down at `anchor`.
    /// Starts the next turn (including forced passes) on success.
    /// Returns std::nullopt when no piece is held.
    std::optional<blokus::core::PlacementResult> click(blokus::core::Position anchor);

    /// Origin the held piece would be placed at for the last hovered anchor
    const std::optional<blokus::core::Position>& hint() const noexcept { return hint_; }

private:
    blokus::core::GameState& game_;
    bool verbose_;

    std::optional<blokus::core::Position> lastAnchor_;
    std::optional<blokus::core::Position> hint_;

    void refreshHint();
};

} // namespace blokus::controller
