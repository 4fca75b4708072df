#pragma once

#include "Types.hpp"
#include "Shape.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace blokus::core {

// 20x20 play area surrounded by a one-cell Wall ring.
//
// All coordinates taken by this class are play-area coordinates: (0,0) is the
// top-left playable cell and (19,19) the bottom-right one. The ring is
// addressable as row/col -1 and 20; the +1 border offset is applied
// internally when indexing.
//
// Seed cells: each seat's color is written on one corner of the ring, so the
// corner rule has something to match for that seat's opening move. They are
// outside the play area and never rendered.
class Board {
public:
    // Walls only, no seeds
    Board();

    // Seeds one ring corner per seat color.
    // Throws std::invalid_argument for more than 4 seats, a non-player color
    // or a duplicated color.
    explicit Board(const std::vector<TileColor>& seatColors);

    // Throws std::out_of_range outside [-1, 20]
    TileColor tile(int row, int col) const;

    static bool isInPlayArea(int row, int col) noexcept {
        return row >= 0 && row < PlayAreaSize && col >= 0 && col < PlayAreaSize;
    }

    // Ring corner seeded for a seat, for a table of `seatCount` seats
    static Position seedCorner(std::size_t seat, std::size_t seatCount);

    // Map an anchor (where the shape's frame center should go) to the
    // play-area position of the shape's frame origin (0,0).
    // Returns std::nullopt if the anchor or any occupied cell would leave the
    // play area. Any int anchor is accepted.
    static std::optional<Position> placementOrigin(const Shape& shape, Position anchor) noexcept;

    // Corner rule check for `shape` with its frame origin at `origin`:
    //  - every occupied cell lands on an Empty tile;
    //  - no occupied cell is edge-adjacent to a `color` tile;
    //  - at least one occupied cell is corner-adjacent to a `color` tile.
    // Throws std::out_of_range if a cell falls outside the padded board.
    bool isLegal(const Shape& shape, Position origin, TileColor color) const;

    // Write `color` into every occupied cell.
    // Throws std::logic_error if a target is not Empty (tiles are never
    // overwritten), leaving the board untouched.
    void place(const Shape& shape, Position origin, TileColor color);

    // Number of play-area tiles owned by `color`
    int count(TileColor color) const noexcept;

    // Full 22x22 dump, one glyph per tile
    std::string toString() const;

private:
    std::array<TileColor, BoardSize * BoardSize> grid_;

    static bool isInside(int row, int col) noexcept {
        return row >= -1 && row <= PlayAreaSize && col >= -1 && col <= PlayAreaSize;
    }

    static std::size_t index(int row, int col) noexcept {
        return static_cast<std::size_t>((row + 1) * BoardSize + (col + 1));
    }

    void setTile(int row, int col, TileColor c) noexcept { grid_[index(row, col)] = c; }
};

} // namespace blokus::core
