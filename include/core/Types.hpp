#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <string>

// Namespace for Blokus core types
namespace blokus::core {

// Side length of the playable area
inline constexpr int PlayAreaSize = 20;

// Play area plus a one-cell Wall ring on every side
inline constexpr int BoardSize = PlayAreaSize + 2;

// Side length of the frame every shape is authored in
inline constexpr int ShapeSize = 5;

// Frame cell a shape is centered on
inline constexpr int ShapeCenter = 2;

// Number of pieces in the catalog (and in every player's starting hand)
inline constexpr int PieceCount = 21;

inline constexpr int MinPlayers = 2;
inline constexpr int MaxPlayers = 4;

using PieceId = int;

// Position structure representing a cell (row, col)
struct Position {
    int row{};
    int col{};
};

inline bool operator==(Position a, Position b) noexcept {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(Position a, Position b) noexcept {
    return !(a == b);
}

// State of a single board tile. Colors double as player colors.
enum class TileColor : std::uint8_t {
    Empty,
    Red,
    Yellow,
    Green,
    Blue,
    Wall
};

// True for the four colors a player can own
inline bool isPlayerColor(TileColor c) noexcept {
    return c == TileColor::Red || c == TileColor::Yellow
        || c == TileColor::Green || c == TileColor::Blue;
}

// One-character glyph used by the text board dump
char toChar(TileColor c) noexcept;

std::string toString(TileColor c);

enum class RotateDir : std::uint8_t {
    Right, // clockwise
    Left   // counter-clockwise
};

enum class FlipDir : std::uint8_t {
    Horizontal, // mirror columns
    Vertical    // mirror rows
};

} // namespace blokus::core
