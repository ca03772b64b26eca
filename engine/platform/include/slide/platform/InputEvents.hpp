#pragma once

#include "slide/core/Types.hpp"

namespace slide::platform {

enum class InputEventType {
    Quit,
    PointerMove,
    PointerDown,
    Command,
    FocusLost
};

enum class InputDevice { MouseKeyboard, Controller };

enum class PointerButton { Primary, Secondary, Other };

// What the player asked for, independent of the key or button pressed.
enum class Command {
    None,
    Move,  // slide the board, or step a menu selection, toward |direction|
    Confirm,
    Back,
    Pause,
    NewGame,
    ToggleMute
};

struct InputEvent {
    InputEventType type = InputEventType::Quit;
    InputDevice device = InputDevice::MouseKeyboard;
    int x = 0;
    int y = 0;
    PointerButton button = PointerButton::Other;
    Command command = Command::None;
    slide::core::Direction direction = slide::core::Direction::Up;
    // Generated by keyboard auto-repeat while a key is held.
    bool repeat = false;

    bool isMove() const noexcept { return type == InputEventType::Command && command == Command::Move; }
    bool is(Command wanted) const noexcept { return type == InputEventType::Command && command == wanted; }
};

}  // namespace slide::platform
