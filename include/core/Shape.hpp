#pragma once // Include guard

#include "Types.hpp" // For Position, RotateDir, FlipDir, ShapeSize
#include <array> // For std::array
#include <string>
#include <vector>

// Namespace for Blokus core types
namespace blokus::core {

// One piece in one orientation: a 5x5 occupancy grid.
// Shapes are values; transforms return a new Shape.
class Shape {
public:
    using Row = std::array<bool, ShapeSize>;
    using Grid = std::array<Row, ShapeSize>;

    // The empty shape (nothing occupied)
    Shape() noexcept = default;
    explicit Shape(const Grid& grid) noexcept : grid_{grid} {}

    // Build from 0/1 rows, e.g. {{0,0,1,0,0}, ...}
    static Shape fromRows(const std::array<std::array<int, ShapeSize>, ShapeSize>& rows) noexcept;

    bool at(int row, int col) const noexcept { return grid_[row][col]; }
    const Grid& grid() const noexcept { return grid_; }

    int cellCount() const noexcept;
    bool isEmpty() const noexcept { return cellCount() == 0; }

    // Occupied cells in frame coordinates, row-major
    std::vector<Position> cells() const;

    // Rows of '#' and '.', one line per row
    std::string toString() const;

    bool operator==(const Shape& other) const noexcept { return grid_ == other.grid_; }
    bool operator!=(const Shape& other) const noexcept { return !(*this == other); }

private:
    Grid grid_{};
};

// Swap rows and columns
Shape transpose(const Shape& shape) noexcept;

// Vertical reverses row order; Horizontal reverses each row
Shape flip(const Shape& shape, FlipDir dir) noexcept;

// Right := flip(Vertical) then transpose
// Left  := transpose then flip(Vertical)
Shape rotate(const Shape& shape, RotateDir dir) noexcept;

} // namespace blokus::core
