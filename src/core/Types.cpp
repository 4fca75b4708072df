#include "core/Types.hpp"

namespace blokus::core {

char toChar(TileColor c) noexcept {
    switch (c) {
    case TileColor::Empty:  return '.';
    case TileColor::Red:    return 'R';
    case TileColor::Yellow: return 'Y';
    case TileColor::Green:  return 'G';
    case TileColor::Blue:   return 'B';
    case TileColor::Wall:   return '#';
    }
    return '?';
}

std::string toString(TileColor c) {
    switch (c) {
    case TileColor::Empty:  return "Empty";
    case TileColor::Red:    return "Red";
    case TileColor::Yellow: return "Yellow";
    case TileColor::Green:  return "Green";
    case TileColor::Blue:   return "Blue";
    case TileColor::Wall:   return "Wall";
    }
    return "Unknown";
}

} // namespace blokus::core
