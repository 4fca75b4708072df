#include <catch2/catch.hpp>

#include "core/PieceCatalog.hpp"

#include <stdexcept>

using namespace blokus::core;

TEST_CASE("Catalog holds 21 pieces totalling 89 squares", "[catalog]") {
    int squares = 0;
    for (PieceId id = 0; id < PieceCount; ++id) {
        squares += PieceCatalog::shapeFor(id).cellCount();
    }
    CHECK(squares == 89);
}

TEST_CASE("Catalog pieces have the expected sizes", "[catalog]") {
    CHECK(PieceCatalog::shapeFor(0).cellCount() == 1);
    CHECK(PieceCatalog::shapeFor(1).cellCount() == 2);
    CHECK(PieceCatalog::shapeFor(2).cellCount() == 3);
    CHECK(PieceCatalog::shapeFor(3).cellCount() == 3);

    for (PieceId id = 4; id <= 8; ++id) {
        CHECK(PieceCatalog::shapeFor(id).cellCount() == 4);
    }
    for (PieceId id = 9; id < PieceCount; ++id) {
        CHECK(PieceCatalog::shapeFor(id).cellCount() == 5);
    }
}

TEST_CASE("Every catalog shape covers the frame center", "[catalog]") {
    for (PieceId id = 0; id < PieceCount; ++id) {
        INFO("piece " << id);
        CHECK(PieceCatalog::shapeFor(id).at(ShapeCenter, ShapeCenter));
    }
}

TEST_CASE("Catalog names match ids", "[catalog]") {
    CHECK(PieceCatalog::nameFor(0) == "Dot");
    CHECK(PieceCatalog::nameFor(9) == "Line5");
    CHECK(PieceCatalog::nameFor(10) == "L5");
    CHECK(PieceCatalog::nameFor(14) == "Notch Square");
    CHECK(PieceCatalog::nameFor(19) == "Chair");
    CHECK(PieceCatalog::nameFor(20) == "Plus");
}

TEST_CASE("Catalog rejects unknown ids", "[catalog]") {
    CHECK_FALSE(PieceCatalog::isValidId(-1));
    CHECK_FALSE(PieceCatalog::isValidId(PieceCount));
    CHECK_THROWS_AS(PieceCatalog::shapeFor(21), std::out_of_range);
    CHECK_THROWS_AS(PieceCatalog::nameFor(-1), std::out_of_range);
}
