#pragma once

#include <cstdint>
#include <optional>

namespace camrig {

enum class Key {
    Unknown,
    Escape,
    Digit1,
    Digit2,
    Digit3,
    Digit4,
    Digit5,
    Digit6,
    Digit7,
    Digit8,
    Digit9,
    W,
    A,
    S,
    D,
    Q,
    E,
    Space,
    Enter,
    Tab,
    LeftShift,
    LeftControl,
    Left,
    Right,
    Up,
    Down,
};

enum class MouseButton {
    Left,
    Middle,
    Right,
    X1,
    X2,
};

enum class Action {
    Release,
    Press,
    Repeat,
};

using Modifiers = std::uint16_t;

enum ModifierBits : Modifiers {
    ModNone     = 0,
    ModShift    = 1u << 0,
    ModControl  = 1u << 1,
    ModAlt      = 1u << 2,
    ModSuper    = 1u << 3,
    ModCapsLock = 1u << 4,
    ModNumLock  = 1u << 5,
};

struct KeyEvent {
    Key       key      = Key::Unknown;
    int       scancode = 0; // platform scancode, valid even when key == Unknown
    Action    action   = Action::Release;
    Modifiers mods     = ModNone;

    bool operator==(const KeyEvent&) const = default;
};

struct MouseButtonEvent {
    MouseButton button = MouseButton::Left;
    Action      action = Action::Release;
    Modifiers   mods   = ModNone;

    bool operator==(const MouseButtonEvent&) const = default;
};

// Cursor motion, scroll, or a button transition.
// Offsets are y-up: positive yOffset means the cursor moved up the screen
// (or the wheel scrolled away from the user when isScroll is set).
struct MouseEvent {
    float xPos    = 0.0f;
    float yPos    = 0.0f;
    float xOffset = 0.0f;
    float yOffset = 0.0f;
    bool  isScroll = false;
    std::optional<MouseButtonEvent> button;

    bool operator==(const MouseEvent&) const = default;
};

// Static names for log lines.
[[nodiscard]] const char* keyName(Key key);
[[nodiscard]] const char* actionName(Action action);

} // namespace camrig
