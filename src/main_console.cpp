#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/GameState.hpp"
#include "core/GameConfig.hpp"
#include "core/MatchResult.hpp"
#include "core/PieceCatalog.hpp"
#include "core/Types.hpp"
#include "controller/GameController.hpp"

using namespace blokus::core;

// Helper: render the play area, column/row indices and the held piece as ASCII
void printGame(const GameState& game) {
    const Board& board = game.board();

    std::cout << "\n==== BLOKUS CONSOLE VIEW ====\n";
    std::cout << "Turn: " << toString(game.currentPlayer().color())
              << " | Passes: " << game.passCounter()
              << " | Pieces left: " << game.currentPlayer().remainingCount()
              << '\n';

    std::cout << "    ";
    for (int c = 0; c < PlayAreaSize; ++c) {
        std::cout << (c % 10);
    }
    std::cout << "\n   +" << std::string(PlayAreaSize, '-') << "+\n";

    for (int r = 0; r < PlayAreaSize; ++r) {
        std::cout << (r < 10 ? "  " : " ") << r << '|';
        for (int c = 0; c < PlayAreaSize; ++c) {
            std::cout << toChar(board.tile(r, c));
        }
        std::cout << "|\n";
    }
    std::cout << "   +" << std::string(PlayAreaSize, '-') << "+\n";

    if (game.selectedPiece()) {
        std::cout << "Holding #" << *game.selectedPiece() << " "
                  << PieceCatalog::nameFor(*game.selectedPiece()) << ":\n"
                  << game.pieceBuffer().toString();
    }

    std::cout << "Commands:\n"
              << "  s <id> = select piece, l = list pieces, x = deselect\n"
              << "  q / e = rotate left / right, h / v = flip horizontal / vertical\n"
              << "  p <row> <col> = place (piece centered on that cell), quit = quit\n";
}

void printPieces(const Player& player) {
    for (PieceId id : player.remainingPieces()) {
        std::cout << "  " << id << ": " << PieceCatalog::nameFor(id) << '\n';
    }
}

void printResults(const GameState& game) {
    std::cout << "GAME OVER.\n";
    for (const auto& r : computeResults(game.players())) {
        std::cout << "  " << toString(r.color) << ": " << r.remainingSquares
                  << " squares left -> ";
        switch (r.outcome) {
        case MatchOutcome::Win:  std::cout << "Win";  break;
        case MatchOutcome::Draw: std::cout << "Draw"; break;
        case MatchOutcome::Lose: std::cout << "Lose"; break;
        }
        std::cout << '\n';
    }
}

int main(int argc, char* argv[]) {
    GameConfig config;
    try {
        config = parseArgs(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << '\n'
                  << "Usage: " << argv[0]
                  << " [demo] [--players N] [--order RBYG] [--clear-on-failure] [--verbose]\n";
        return 1;
    }

    GameState game{config};
    blokus::controller::GameController controller{game, config.verbose};

    controller.beginTurn();

    std::string line;
    printGame(game);

    while (!game.isGameOver()) {
        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, line)) {
            break; // EOF
        }

        std::istringstream in{line};
        std::string cmd;
        if (!(in >> cmd)) {
            continue;
        }

        if (cmd == "quit") {
            std::cout << "Quitting.\n";
            return 0;
        }

        using blokus::controller::InputAction;

        if (cmd == "s") {
            PieceId id{};
            if (!(in >> id) || !controller.selectPiece(id)) {
                std::cout << "You do not have that piece.\n";
            }
        } else if (cmd == "l") {
            printPieces(game.currentPlayer());
            continue;
        } else if (cmd == "x") {
            controller.handleAction(InputAction::Deselect);
        } else if (cmd == "q") {
            controller.handleAction(InputAction::RotateLeft);
        } else if (cmd == "e") {
            controller.handleAction(InputAction::RotateRight);
        } else if (cmd == "h") {
            controller.handleAction(InputAction::FlipHorizontal);
        } else if (cmd == "v") {
            controller.handleAction(InputAction::FlipVertical);
        } else if (cmd == "p") {
            Position anchor{};
            if (!(in >> anchor.row >> anchor.col)) {
                std::cout << "Usage: p <row> <col>\n";
                continue;
            }
            const auto result = controller.click(anchor);
            if (!result) {
                std::cout << "Select a piece first.\n";
            } else if (*result == PlacementResult::OutOfBounds) {
                std::cout << "The piece does not fit there.\n";
            } else if (*result == PlacementResult::Illegal) {
                std::cout << "That placement breaks the corner rule.\n";
            }
        } else {
            std::cout << "Unknown command: " << cmd << '\n';
        }

        printGame(game);
    }

    printResults(game);
    return 0;
}
