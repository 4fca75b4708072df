#include "core/Board.hpp"
#include <algorithm>
#include <stdexcept>

namespace blokus::core {

namespace {

constexpr std::array<Position, 4> Orthogonals{{
    {-1, 0}, {0, -1}, {1, 0}, {0, 1}
}};

constexpr std::array<Position, 4> Diagonals{{
    {-1, -1}, {1, -1}, {-1, 1}, {1, 1}
}};

} // namespace

Board::Board()
{
    grid_.fill(TileColor::Empty);

    for (int i = -1; i <= PlayAreaSize; ++i) {
        setTile(-1, i, TileColor::Wall);
        setTile(PlayAreaSize, i, TileColor::Wall);
        setTile(i, -1, TileColor::Wall);
        setTile(i, PlayAreaSize, TileColor::Wall);
    }
}

Board::Board(const std::vector<TileColor>& seatColors)
    : Board()
{
    if (seatColors.size() > static_cast<std::size_t>(MaxPlayers)) {
        throw std::invalid_argument("Board supports at most 4 seats");
    }

    for (std::size_t seat = 0; seat < seatColors.size(); ++seat) {
        const TileColor color = seatColors[seat];
        if (!isPlayerColor(color)) {
            throw std::invalid_argument("Board seat color must be a player color");
        }
        if (std::count(seatColors.begin(), seatColors.end(), color) > 1) {
            throw std::invalid_argument("Board seat colors must be distinct");
        }

        const Position corner = seedCorner(seat, seatColors.size());
        setTile(corner.row, corner.col, color);
    }
}

TileColor Board::tile(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::tile out of range");
    }
    return grid_[index(row, col)];
}

Position Board::seedCorner(std::size_t seat, std::size_t seatCount) {
    constexpr Position BottomRight{PlayAreaSize, PlayAreaSize};
    constexpr Position BottomLeft{PlayAreaSize, -1};
    constexpr Position TopLeft{-1, -1};
    constexpr Position TopRight{-1, PlayAreaSize};

    // Two seats sit on opposite corners; otherwise go around the board.
    constexpr std::array<Position, 2> TwoSeats{{BottomRight, TopLeft}};
    constexpr std::array<Position, 4> FourSeats{{BottomRight, BottomLeft, TopLeft, TopRight}};

    if (seatCount <= TwoSeats.size()) {
        if (seat >= TwoSeats.size()) {
            throw std::out_of_range("Board::seedCorner seat out of range");
        }
        return TwoSeats[seat];
    }
    if (seat >= FourSeats.size() || seat >= seatCount) {
        throw std::out_of_range("Board::seedCorner seat out of range");
    }
    return FourSeats[seat];
}

std::optional<Position> Board::placementOrigin(const Shape& shape, Position anchor) noexcept {
    // Every shape covers its frame center, so the anchor itself must be
    // playable. Checking it first also keeps the offsets below from overflowing.
    if (!isInPlayArea(anchor.row, anchor.col)) {
        return std::nullopt;
    }

    // Extents relative to the frame center; they start at zero and only grow.
    int top = 0;
    int bottom = 0;
    int left = 0;
    int right = 0;

    for (int r = 0; r < ShapeSize; ++r) {
        for (int c = 0; c < ShapeSize; ++c) {
            if (!shape.at(r, c)) continue;

            const int dr = r - ShapeCenter;
            const int dc = c - ShapeCenter;
            top = std::min(top, dr);
            bottom = std::max(bottom, dr);
            left = std::min(left, dc);
            right = std::max(right, dc);
        }
    }

    if (anchor.row + top < 0 || anchor.row + bottom >= PlayAreaSize
        || anchor.col + left < 0 || anchor.col + right >= PlayAreaSize) {
        return std::nullopt;
    }

    return Position{anchor.row - ShapeCenter, anchor.col - ShapeCenter};
}

bool Board::isLegal(const Shape& shape, Position origin, TileColor color) const {
    bool touchesCorner = false;

    for (const auto& cell : shape.cells()) {
        const int row = origin.row + cell.row;
        const int col = origin.col + cell.col;

        if (tile(row, col) != TileColor::Empty) {
            return false; // overlap (walls included)
        }

        for (const auto& d : Orthogonals) {
            if (tile(row + d.row, col + d.col) == color) {
                return false; // shares an edge with own color
            }
        }

        if (!touchesCorner) {
            for (const auto& d : Diagonals) {
                if (tile(row + d.row, col + d.col) == color) {
                    touchesCorner = true;
                    break;
                }
            }
        }
    }

    return touchesCorner;
}

void Board::place(const Shape& shape, Position origin, TileColor color) {
    if (!isPlayerColor(color)) {
        throw std::invalid_argument("Board::place requires a player color");
    }

    const auto cells = shape.cells();
    for (const auto& cell : cells) {
        const int row = origin.row + cell.row;
        const int col = origin.col + cell.col;
        if (!isInPlayArea(row, col) || grid_[index(row, col)] != TileColor::Empty) {
            throw std::logic_error("Board::place target tile is not an empty play-area tile");
        }
    }

    for (const auto& cell : cells) {
        setTile(origin.row + cell.row, origin.col + cell.col, color);
    }
}

int Board::count(TileColor color) const noexcept {
    int n = 0;
    for (int r = 0; r < PlayAreaSize; ++r) {
        for (int c = 0; c < PlayAreaSize; ++c) {
            if (grid_[index(r, c)] == color) ++n;
        }
    }
    return n;
}

std::string Board::toString() const {
    std::string out;
    out.reserve(BoardSize * (BoardSize + 1));
    for (int r = -1; r <= PlayAreaSize; ++r) {
        for (int c = -1; c <= PlayAreaSize; ++c) {
            out += toChar(grid_[index(r, c)]);
        }
        out += '\n';
    }
    return out;
}

} // namespace blokus::core
