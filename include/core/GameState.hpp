#pragma once

#include "Board.hpp"
#include "GameConfig.hpp"
#include "Player.hpp"
#include "Shape.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace blokus::core {

enum class TurnPhase {
    AwaitingSelection, // no piece chosen
    PiecePending,      // a piece is chosen and may be re-oriented
    GameOver
};

enum class PlacementResult {
    Placed,
    OutOfBounds, // some cell would leave the play area
    Illegal      // overlap, edge contact or no corner contact
};

// Authoritative state of one game: board, seats, whose turn it is and the
// piece the current player is holding.
class GameState {
public:
    // Seats `config.playerCount` players in `config.colorOrder`.
    // Throws std::invalid_argument for an invalid config.
    explicit GameState(const GameConfig& config = GameConfig{});

    // Seats the given players in order.
    // Throws std::invalid_argument for fewer than 2 or more than 4 players.
    explicit GameState(std::vector<Player> players, bool keepSelectionOnFailure = true);

    // Resume from a prepared position. `board` is taken as is, seeds included.
    // Throws std::invalid_argument for fewer than 2 or more than 4 players or
    // a repeated color.
    GameState(Board board, std::vector<Player> players, bool keepSelectionOnFailure = true);

    const Board& board() const noexcept { return board_; }
    const std::vector<Player>& players() const noexcept { return players_; }
    std::size_t currentPlayerIndex() const noexcept { return currentPlayer_; }
    const Player& currentPlayer() const noexcept { return players_[currentPlayer_]; }

    const std::optional<PieceId>& selectedPiece() const noexcept { return selectedPiece_; }
    // Empty shape when nothing is selected
    const Shape& pieceBuffer() const noexcept { return pieceBuffer_; }

    std::size_t passCounter() const noexcept { return passCounter_; }
    TurnPhase phase() const noexcept;

    // Choose a piece (buffer resets to its canonical orientation) or clear
    // the selection with std::nullopt.
    // Throws std::invalid_argument if the current player does not hold it.
    void selectPiece(std::optional<PieceId> id);

    // Re-orient the held piece. No-op when nothing is selected.
    void rotatePiece(RotateDir dir);
    void flipPiece(FlipDir dir);

    // Where the held piece would land for `anchor`, if it can be placed there.
    // Does not change anything.
    std::optional<Position> previewPlacement(Position anchor) const;

    // Place the held piece with its frame center on `anchor`.
    // On success the turn passes to the next player.
    // Throws std::logic_error if no piece is selected.
    PlacementResult attemptPlacement(Position anchor);

    // Hand the turn to the next seat and drop any selection
    void endTurn();

    // Forced pass: endTurn() and count it
    void passTurn();

    // Does the current player have any legal placement left?
    bool canMakeMove() const;

    bool isGameOver() const noexcept;

private:
    Board board_;
    std::vector<Player> players_;
    std::size_t currentPlayer_{0};

    std::optional<PieceId> selectedPiece_;
    Shape pieceBuffer_;

    std::size_t passCounter_{0};
    bool keepSelectionOnFailure_{true};

    static std::vector<Player> seatPlayers(const GameConfig& config);
    static std::vector<TileColor> colorsOf(const std::vector<Player>& players);
    void checkSeats() const;

    void clearSelection() noexcept;
    void rejectPlacement() noexcept;
};

} // namespace blokus::core
