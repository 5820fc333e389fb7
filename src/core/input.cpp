#include <camrig/input.hpp>

namespace camrig {

const char* keyName(Key key) {
    switch (key) {
    case Key::Escape:      return "Escape";
    case Key::Digit1:      return "1";
    case Key::Digit2:      return "2";
    case Key::Digit3:      return "3";
    case Key::Digit4:      return "4";
    case Key::Digit5:      return "5";
    case Key::Digit6:      return "6";
    case Key::Digit7:      return "7";
    case Key::Digit8:      return "8";
    case Key::Digit9:      return "9";
    case Key::W:           return "W";
    case Key::A:           return "A";
    case Key::S:           return "S";
    case Key::D:           return "D";
    case Key::Q:           return "Q";
    case Key::E:           return "E";
    case Key::Space:       return "Space";
    case Key::Enter:       return "Enter";
    case Key::Tab:         return "Tab";
    case Key::LeftShift:   return "LeftShift";
    case Key::LeftControl: return "LeftControl";
    case Key::Left:        return "Left";
    case Key::Right:       return "Right";
    case Key::Up:          return "Up";
    case Key::Down:        return "Down";
    case Key::Unknown:
        break;
    }
    return "Unknown";
}

const char* actionName(Action action) {
    switch (action) {
    case Action::Release: return "release";
    case Action::Press:   return "press";
    case Action::Repeat:  return "repeat";
    }
    return "unknown";
}

} // namespace camrig
