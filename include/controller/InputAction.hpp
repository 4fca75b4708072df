#pragma once

namespace blokus::controller {

// Discrete actions on the held piece.
// These are UI- and platform-agnostic: keyboard, gamepad, network, etc.
enum class InputAction {
    RotateLeft,
    RotateRight,
    FlipHorizontal,
    FlipVertical,
    Deselect
};

} // namespace blokus::controller
