#include "core/Shape.hpp"

namespace blokus::core {

Shape Shape::fromRows(const std::array<std::array<int, ShapeSize>, ShapeSize>& rows) noexcept {
    Grid grid{};
    for (int r = 0; r < ShapeSize; ++r) {
        for (int c = 0; c < ShapeSize; ++c) {
            grid[r][c] = rows[r][c] != 0;
        }
    }
    return Shape{grid};
}

int Shape::cellCount() const noexcept {
    int count = 0;
    for (const auto& row : grid_) {
        for (bool occupied : row) {
            if (occupied) ++count;
        }
    }
    return count;
}

std::vector<Position> Shape::cells() const {
    std::vector<Position> out;
    out.reserve(ShapeSize);
    for (int r = 0; r < ShapeSize; ++r) {
        for (int c = 0; c < ShapeSize; ++c) {
            if (grid_[r][c]) {
                out.push_back(Position{r, c});
            }
        }
    }
    return out;
}

std::string Shape::toString() const {
    std::string out;
    out.reserve(ShapeSize * (ShapeSize + 1));
    for (const auto& row : grid_) {
        for (bool occupied : row) {
            out += occupied ? '#' : '.';
        }
        out += '\n';
    }
    return out;
}

Shape transpose(const Shape& shape) noexcept {
    Shape::Grid out{};
    for (int r = 0; r < ShapeSize; ++r) {
        for (int c = 0; c < ShapeSize; ++c) {
            out[c][r] = shape.at(r, c);
        }
    }
    return Shape{out};
}

Shape flip(const Shape& shape, FlipDir dir) noexcept {
    Shape::Grid out{};
    switch (dir) {
    case FlipDir::Vertical:
        for (int r = 0; r < ShapeSize; ++r) {
            out[r] = shape.grid()[ShapeSize - 1 - r];
        }
        break;
    case FlipDir::Horizontal:
        for (int r = 0; r < ShapeSize; ++r) {
            for (int c = 0; c < ShapeSize; ++c) {
                out[r][c] = shape.at(r, ShapeSize - 1 - c);
            }
        }
        break;
    }
    return Shape{out};
}

Shape rotate(const Shape& shape, RotateDir dir) noexcept {
    switch (dir) {
    case RotateDir::Right:
        return transpose(flip(shape, FlipDir::Vertical));
    case RotateDir::Left:
        return flip(transpose(shape), FlipDir::Vertical);
    }

    // Fallback (should never happen)
    return shape;
}

} // namespace blokus::core
