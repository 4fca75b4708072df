#pragma once

#include "Types.hpp"
#include "Shape.hpp"
#include <string>

namespace blokus::core {

// Fixed table of the 21 pieces in canonical orientation.
// Every canonical shape covers the frame center (2,2).
class PieceCatalog {
public:
    static bool isValidId(PieceId id) noexcept {
        return id >= 0 && id < PieceCount;
    }

    // Throws std::out_of_range for an unknown id
    static const Shape& shapeFor(PieceId id);
    static const std::string& nameFor(PieceId id);
};

} // namespace blokus::core
