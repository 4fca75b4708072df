#include <catch2/catch.hpp>

#include "core/Board.hpp"
#include "core/MoveSearch.hpp"
#include "core/PieceCatalog.hpp"
#include "core/Player.hpp"

#include <algorithm>
#include <vector>

using namespace blokus::core;

namespace {

Position centeredOn(int row, int col) {
    return Position{row - ShapeCenter, col - ShapeCenter};
}

// Player holding only `id`
Player holdingOnly(TileColor color, PieceId id) {
    Player p{color};
    for (PieceId other = 0; other < PieceCount; ++other) {
        if (other != id) p.removePiece(other);
    }
    return p;
}

} // namespace

TEST_CASE("Every seat can move on a fresh board", "[search]") {
    const std::vector<std::vector<TileColor>> tables{
        {TileColor::Red, TileColor::Blue},
        {TileColor::Red, TileColor::Blue, TileColor::Yellow},
        {TileColor::Red, TileColor::Blue, TileColor::Yellow, TileColor::Green},
    };

    for (const auto& seats : tables) {
        Board b{seats};
        for (TileColor color : seats) {
            CHECK(canMakeMove(b, Player{color}));
        }
    }
}

TEST_CASE("Every single piece fits a fresh corner", "[search]") {
    Board b{std::vector<TileColor>{TileColor::Red, TileColor::Blue}};
    for (PieceId id = 0; id < PieceCount; ++id) {
        INFO("piece " << id);
        CHECK(canPlacePiece(b, TileColor::Red, id));
        CHECK(canPlacePiece(b, TileColor::Blue, id));
    }
}

TEST_CASE("A seat without pieces cannot move", "[search]") {
    Board b{std::vector<TileColor>{TileColor::Red, TileColor::Blue}};
    Player p{TileColor::Red};
    for (PieceId id = 0; id < PieceCount; ++id) {
        p.removePiece(id);
    }
    CHECK_FALSE(canMakeMove(b, p));
}

TEST_CASE("A blocked corner leaves no move", "[search]") {
    Board b{std::vector<TileColor>{TileColor::Red, TileColor::Blue}};

    // Blue sits on the only cell diagonal to Red's seed
    b.place(PieceCatalog::shapeFor(0), centeredOn(19, 19), TileColor::Blue);

    CHECK_FALSE(canMakeMove(b, Player{TileColor::Red}));
    CHECK(canMakeMove(b, Player{TileColor::Blue}));
}

TEST_CASE("Search tries rotated orientations", "[search][orientation]") {
    Board b{std::vector<TileColor>{TileColor::Red, TileColor::Blue}};

    // Only a horizontal Line2 still fits at Red's corner
    b.place(PieceCatalog::shapeFor(0), centeredOn(18, 19), TileColor::Blue);

    const Shape& line2 = PieceCatalog::shapeFor(1);
    for (int row = 0; row < PlayAreaSize; ++row) {
        for (int col = 0; col < PlayAreaSize; ++col) {
            const auto origin = Board::placementOrigin(line2, Position{row, col});
            if (origin) {
                REQUIRE_FALSE(b.isLegal(line2, *origin, TileColor::Red));
            }
        }
    }

    CHECK(canMakeMove(b, holdingOnly(TileColor::Red, 1)));

    // Block the horizontal spot as well
    b.place(PieceCatalog::shapeFor(0), centeredOn(19, 18), TileColor::Blue);
    CHECK_FALSE(canMakeMove(b, holdingOnly(TileColor::Red, 1)));
}

TEST_CASE("Search tries mirrored orientations", "[search][orientation]") {
    Board b{std::vector<TileColor>{TileColor::Red, TileColor::Blue}};

    // Leave Red exactly one free L-shaped spot: a bar along the bottom row
    // with a foot above its left end. No rotation of the canonical L4 has
    // that foot; only a mirror image does.
    const std::vector<Position> spot{{19, 17}, {19, 18}, {19, 19}, {18, 17}};
    for (int row = 0; row < PlayAreaSize; ++row) {
        for (int col = 0; col < PlayAreaSize; ++col) {
            if (std::find(spot.begin(), spot.end(), Position{row, col}) == spot.end()) {
                b.place(PieceCatalog::shapeFor(0), centeredOn(row, col), TileColor::Blue);
            }
        }
    }

    Shape turned = PieceCatalog::shapeFor(5);
    for (int turns = 0; turns < 4; ++turns) {
        for (int row = 0; row < PlayAreaSize; ++row) {
            for (int col = 0; col < PlayAreaSize; ++col) {
                const auto origin = Board::placementOrigin(turned, Position{row, col});
                if (origin) {
                    REQUIRE_FALSE(b.isLegal(turned, *origin, TileColor::Red));
                }
            }
        }
        turned = rotate(turned, RotateDir::Right);
    }

    CHECK(canMakeMove(b, holdingOnly(TileColor::Red, 5)));
    CHECK_FALSE(canMakeMove(b, holdingOnly(TileColor::Red, 4))); // no room for Line4
}
