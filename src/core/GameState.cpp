#include "core/GameState.hpp"
#include "core/MoveSearch.hpp"
#include "core/PieceCatalog.hpp"

#include <stdexcept>
#include <utility>

namespace blokus::core {

GameState::GameState(const GameConfig& config)
    : GameState{seatPlayers(config), config.keepSelectionOnFailure}
{
}

GameState::GameState(std::vector<Player> players, bool keepSelectionOnFailure)
    : board_{colorsOf(players)}
    , players_{std::move(players)}
    , currentPlayer_{0}
    , selectedPiece_{}
    , pieceBuffer_{}
    , passCounter_{0}
    , keepSelectionOnFailure_{keepSelectionOnFailure}
{
    checkSeats();
}

GameState::GameState(Board board, std::vector<Player> players, bool keepSelectionOnFailure)
    : board_{std::move(board)}
    , players_{std::move(players)}
    , keepSelectionOnFailure_{keepSelectionOnFailure}
{
    checkSeats();
}

void GameState::checkSeats() const {
    if (players_.size() < static_cast<std::size_t>(MinPlayers)
        || players_.size() > static_cast<std::size_t>(MaxPlayers)) {
        throw std::invalid_argument("GameState needs between 2 and 4 players");
    }

    for (std::size_t i = 0; i < players_.size(); ++i) {
        for (std::size_t j = i + 1; j < players_.size(); ++j) {
            if (players_[i].color() == players_[j].color()) {
                throw std::invalid_argument("GameState seat colors must be distinct");
            }
        }
    }
}

std::vector<Player> GameState::seatPlayers(const GameConfig& config) {
    validate(config);

    std::vector<Player> players;
    for (TileColor color : seatColors(config)) {
        players.emplace_back(color);
    }
    return players;
}

std::vector<TileColor> GameState::colorsOf(const std::vector<Player>& players) {
    if (players.size() > static_cast<std::size_t>(MaxPlayers)) {
        throw std::invalid_argument("GameState needs between 2 and 4 players");
    }

    std::vector<TileColor> colors;
    colors.reserve(players.size());
    for (const auto& p : players) {
        colors.push_back(p.color());
    }
    return colors;
}

TurnPhase GameState::phase() const noexcept {
    if (isGameOver()) return TurnPhase::GameOver;
    return selectedPiece_ ? TurnPhase::PiecePending : TurnPhase::AwaitingSelection;
}

void GameState::selectPiece(std::optional<PieceId> id) {
    if (!id) {
        clearSelection();
        return;
    }

    if (!currentPlayer().hasPiece(*id)) {
        throw std::invalid_argument("GameState::selectPiece current player does not hold this piece");
    }

    selectedPiece_ = id;
    pieceBuffer_ = PieceCatalog::shapeFor(*id);
}

void GameState::rotatePiece(RotateDir dir) {
    if (!selectedPiece_) return;
    pieceBuffer_ = rotate(pieceBuffer_, dir);
}

void GameState::flipPiece(FlipDir dir) {
    if (!selectedPiece_) return;
    pieceBuffer_ = flip(pieceBuffer_, dir);
}

std::optional<Position> GameState::previewPlacement(Position anchor) const {
    if (!selectedPiece_) return std::nullopt;

    const auto origin = Board::placementOrigin(pieceBuffer_, anchor);
    if (!origin || !board_.isLegal(pieceBuffer_, *origin, currentPlayer().color())) {
        return std::nullopt;
    }
    return origin;
}

PlacementResult GameState::attemptPlacement(Position anchor) {
    if (!selectedPiece_) {
        throw std::logic_error("GameState::attemptPlacement called with no piece selected");
    }

    const auto origin = Board::placementOrigin(pieceBuffer_, anchor);
    if (!origin) {
        rejectPlacement();
        return PlacementResult::OutOfBounds;
    }

    Player& player = players_[currentPlayer_];
    if (!board_.isLegal(pieceBuffer_, *origin, player.color())) {
        rejectPlacement();
        return PlacementResult::Illegal;
    }

    board_.place(pieceBuffer_, *origin, player.color());
    player.removePiece(*selectedPiece_);

    passCounter_ = 0;
    endTurn();
    return PlacementResult::Placed;
}

void GameState::endTurn() {
    clearSelection();
    currentPlayer_ = (currentPlayer_ + 1) % players_.size();
}

void GameState::passTurn() {
    endTurn();
    if (passCounter_ < players_.size()) {
        ++passCounter_;
    }
}

bool GameState::canMakeMove() const {
    return blokus::core::canMakeMove(board_, currentPlayer());
}

bool GameState::isGameOver() const noexcept {
    return !currentPlayer().hasPiecesLeft() || passCounter_ == players_.size();
}

void GameState::clearSelection() noexcept {
    selectedPiece_.reset();
    pieceBuffer_ = Shape{};
}

void GameState::rejectPlacement() noexcept {
    if (!keepSelectionOnFailure_) {
        clearSelection();
    }
}

} // namespace blokus::core
