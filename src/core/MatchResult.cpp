#include "core/MatchResult.hpp"

#include <algorithm>

namespace blokus::core {

std::vector<MatchResult> computeResults(const std::vector<Player>& players)
{
    std::vector<MatchResult> results;
    results.reserve(players.size());

    if (players.empty()) return results;

    std::vector<int> squares;
    squares.reserve(players.size());
    for (const auto& p : players) {
        squares.push_back(p.remainingSquares());
    }

    const int best = *std::min_element(squares.begin(), squares.end());
    const auto winnersCount = std::count(squares.begin(), squares.end(), best);
    const bool isDraw = (winnersCount > 1);

    for (std::size_t seat = 0; seat < players.size(); ++seat) {
        const bool isCandidate = (squares[seat] == best);

        MatchOutcome outcome;
        if (isCandidate && isDraw) {
            outcome = MatchOutcome::Draw;
        } else if (isCandidate) {
            outcome = MatchOutcome::Win;
        } else {
            outcome = MatchOutcome::Lose;
        }

        results.push_back(MatchResult{
            seat,
            players[seat].color(),
            outcome,
            squares[seat]
        });
    }

    return results;
}

} // namespace blokus::core
