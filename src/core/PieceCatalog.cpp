#include "core/PieceCatalog.hpp"

#include <array>
#include <stdexcept>

namespace blokus::core {

namespace {

struct Entry {
    std::string name;
    Shape shape;
};

std::array<Entry, PieceCount> buildCatalog() {
    using R = std::array<std::array<int, ShapeSize>, ShapeSize>;

    return {{
        {"Dot", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 0, 0, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 0, 0, 0},
            {0, 0, 0, 0, 0}}})},
        {"Line2", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 0, 0, 0},
            {0, 0, 0, 0, 0}}})},
        {"Line3", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 0, 0, 0}}})},
        {"L3", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 1, 0},
            {0, 0, 0, 0, 0},
            {0, 0, 0, 0, 0}}})},
        {"Line4", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0}}})},
        {"L4", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 1, 0},
            {0, 0, 0, 0, 0}}})},
        {"Zig-Zag", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 1, 1, 0, 0},
            {0, 0, 1, 1, 0},
            {0, 0, 0, 0, 0},
            {0, 0, 0, 0, 0}}})},
        {"Square", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 0, 1, 1, 0},
            {0, 0, 1, 1, 0},
            {0, 0, 0, 0, 0},
            {0, 0, 0, 0, 0}}})},
        {"Tee", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 1, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 0, 0, 0}}})},
        {"Line5", Shape::fromRows(R{{
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0}}})},
        {"L5", Shape::fromRows(R{{
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 1, 0},
            {0, 0, 0, 0, 0}}})},
        {"Extended Zig", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 1, 0},
            {0, 0, 0, 1, 0}}})},
        {"Extended Tee", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 1, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0}}})},
        {"U", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 0, 0, 0, 0},
            {0, 1, 1, 1, 0},
            {0, 1, 0, 1, 0},
            {0, 0, 0, 0, 0}}})},
        {"Notch Square", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 0, 0, 0, 0},
            {0, 1, 1, 1, 0},
            {0, 1, 1, 0, 0},
            {0, 0, 0, 0, 0}}})},
        {"Big Tee", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 1, 0, 0, 0},
            {0, 1, 1, 1, 0},
            {0, 1, 0, 0, 0},
            {0, 0, 0, 0, 0}}})},
        {"Big L5", Shape::fromRows(R{{
            {0, 0, 1, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 1, 1, 1},
            {0, 0, 0, 0, 0},
            {0, 0, 0, 0, 0}}})},
        {"Stairs", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 1, 1, 0, 0},
            {0, 0, 1, 1, 0},
            {0, 0, 0, 1, 0},
            {0, 0, 0, 0, 0}}})},
        {"Wide Zig", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 1, 0, 0, 0},
            {0, 1, 1, 1, 0},
            {0, 0, 0, 1, 0},
            {0, 0, 0, 0, 0}}})},
        {"Chair", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 1, 0, 0, 0},
            {0, 1, 1, 1, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 0, 0, 0}}})},
        {"Plus", Shape::fromRows(R{{
            {0, 0, 0, 0, 0},
            {0, 0, 1, 0, 0},
            {0, 1, 1, 1, 0},
            {0, 0, 1, 0, 0},
            {0, 0, 0, 0, 0}}})},
    }};
}

const std::array<Entry, PieceCount>& catalog() {
    static const std::array<Entry, PieceCount> table = buildCatalog();
    return table;
}

} // namespace

const Shape& PieceCatalog::shapeFor(PieceId id) {
    if (!isValidId(id)) {
        throw std::out_of_range("PieceCatalog::shapeFor unknown piece id");
    }
    return catalog()[static_cast<std::size_t>(id)].shape;
}

const std::string& PieceCatalog::nameFor(PieceId id) {
    if (!isValidId(id)) {
        throw std::out_of_range("PieceCatalog::nameFor unknown piece id");
    }
    return catalog()[static_cast<std::size_t>(id)].name;
}

} // namespace blokus::core
