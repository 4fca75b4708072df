#include <catch2/catch.hpp>

#include "core/PieceCatalog.hpp"
#include "core/Shape.hpp"
#include "core/Types.hpp"

using namespace blokus::core;

namespace {

using Rows = std::array<std::array<int, ShapeSize>, ShapeSize>;

const Shape& chair() { return PieceCatalog::shapeFor(19); }
const Shape& line5() { return PieceCatalog::shapeFor(9); }

} // namespace

TEST_CASE("Transpose swaps rows and columns", "[shape]") {
    const Shape chairT = Shape::fromRows(Rows{{
        {0, 0, 0, 0, 0},
        {0, 1, 1, 0, 0},
        {0, 0, 1, 1, 0},
        {0, 0, 1, 0, 0},
        {0, 0, 0, 0, 0}}});
    const Shape line5T = Shape::fromRows(Rows{{
        {0, 0, 0, 0, 0},
        {0, 0, 0, 0, 0},
        {1, 1, 1, 1, 1},
        {0, 0, 0, 0, 0},
        {0, 0, 0, 0, 0}}});

    CHECK(transpose(chair()) == chairT);
    CHECK(transpose(line5()) == line5T);
}

TEST_CASE("Flip mirrors rows or columns", "[shape]") {
    const Shape chairV = Shape::fromRows(Rows{{
        {0, 0, 0, 0, 0},
        {0, 0, 1, 0, 0},
        {0, 1, 1, 1, 0},
        {0, 1, 0, 0, 0},
        {0, 0, 0, 0, 0}}});
    const Shape chairH = Shape::fromRows(Rows{{
        {0, 0, 0, 0, 0},
        {0, 0, 0, 1, 0},
        {0, 1, 1, 1, 0},
        {0, 0, 1, 0, 0},
        {0, 0, 0, 0, 0}}});

    CHECK(flip(chair(), FlipDir::Vertical) == chairV);
    CHECK(flip(chair(), FlipDir::Horizontal) == chairH);

    // A vertical line is its own vertical mirror
    CHECK(flip(line5(), FlipDir::Vertical) == line5());
}

TEST_CASE("Rotate is built from transpose and vertical flip", "[shape][rotate]") {
    const Shape chairRight = Shape::fromRows(Rows{{
        {0, 0, 0, 0, 0},
        {0, 0, 1, 1, 0},
        {0, 1, 1, 0, 0},
        {0, 0, 1, 0, 0},
        {0, 0, 0, 0, 0}}});
    const Shape chairLeft = Shape::fromRows(Rows{{
        {0, 0, 0, 0, 0},
        {0, 0, 1, 0, 0},
        {0, 0, 1, 1, 0},
        {0, 1, 1, 0, 0},
        {0, 0, 0, 0, 0}}});

    CHECK(rotate(chair(), RotateDir::Right) == chairRight);
    CHECK(rotate(chair(), RotateDir::Left) == chairLeft);

    CHECK(rotate(chair(), RotateDir::Right) == transpose(flip(chair(), FlipDir::Vertical)));
    CHECK(rotate(chair(), RotateDir::Left) == flip(transpose(chair()), FlipDir::Vertical));

    CHECK(rotate(line5(), RotateDir::Right) == transpose(line5()));
    CHECK(rotate(line5(), RotateDir::Left) == transpose(line5()));
}

TEST_CASE("Four rotations in one direction return every catalog shape", "[shape][rotate]") {
    for (PieceId id = 0; id < PieceCount; ++id) {
        const Shape& original = PieceCatalog::shapeFor(id);

        Shape right = original;
        Shape left = original;
        for (int i = 0; i < 4; ++i) {
            right = rotate(right, RotateDir::Right);
            left = rotate(left, RotateDir::Left);
        }

        INFO("piece " << id << " (" << PieceCatalog::nameFor(id) << ")");
        CHECK(right == original);
        CHECK(left == original);
        CHECK(rotate(rotate(original, RotateDir::Right), RotateDir::Left) == original);
    }
}

TEST_CASE("Flipping twice on the same axis is the identity", "[shape][flip]") {
    for (PieceId id = 0; id < PieceCount; ++id) {
        const Shape& original = PieceCatalog::shapeFor(id);

        INFO("piece " << id);
        CHECK(flip(flip(original, FlipDir::Vertical), FlipDir::Vertical) == original);
        CHECK(flip(flip(original, FlipDir::Horizontal), FlipDir::Horizontal) == original);
    }
}

TEST_CASE("Transforms keep the cell count and the frame center", "[shape]") {
    for (PieceId id = 0; id < PieceCount; ++id) {
        const Shape& original = PieceCatalog::shapeFor(id);
        const Shape turned = rotate(flip(original, FlipDir::Horizontal), RotateDir::Left);

        CHECK(turned.cellCount() == original.cellCount());
        CHECK(turned.at(ShapeCenter, ShapeCenter));
    }
}

TEST_CASE("Default shape is empty", "[shape]") {
    Shape empty;
    CHECK(empty.isEmpty());
    CHECK(empty.cells().empty());
    CHECK(rotate(empty, RotateDir::Right) == empty);
    CHECK(empty.toString() == ".....\n.....\n.....\n.....\n.....\n");
}
