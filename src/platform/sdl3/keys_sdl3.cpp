#include <camrig/window.hpp>

#include <SDL3/SDL.h>

namespace camrig {

namespace {

struct KeyMapping {
    Key          key;
    SDL_Scancode scancode;
};

constexpr KeyMapping kKeyMap[] = {
    {Key::Escape,      SDL_SCANCODE_ESCAPE},
    {Key::Digit1,      SDL_SCANCODE_1},
    {Key::Digit2,      SDL_SCANCODE_2},
    {Key::Digit3,      SDL_SCANCODE_3},
    {Key::Digit4,      SDL_SCANCODE_4},
    {Key::Digit5,      SDL_SCANCODE_5},
    {Key::Digit6,      SDL_SCANCODE_6},
    {Key::Digit7,      SDL_SCANCODE_7},
    {Key::Digit8,      SDL_SCANCODE_8},
    {Key::Digit9,      SDL_SCANCODE_9},
    {Key::W,           SDL_SCANCODE_W},
    {Key::A,           SDL_SCANCODE_A},
    {Key::S,           SDL_SCANCODE_S},
    {Key::D,           SDL_SCANCODE_D},
    {Key::Q,           SDL_SCANCODE_Q},
    {Key::E,           SDL_SCANCODE_E},
    {Key::Space,       SDL_SCANCODE_SPACE},
    {Key::Enter,       SDL_SCANCODE_RETURN},
    {Key::Tab,         SDL_SCANCODE_TAB},
    {Key::LeftShift,   SDL_SCANCODE_LSHIFT},
    {Key::LeftControl, SDL_SCANCODE_LCTRL},
    {Key::Left,        SDL_SCANCODE_LEFT},
    {Key::Right,       SDL_SCANCODE_RIGHT},
    {Key::Up,          SDL_SCANCODE_UP},
    {Key::Down,        SDL_SCANCODE_DOWN},
};

} // namespace

Key keyFromScancode(int scancode) {
    for (const auto& m : kKeyMap) {
        if (static_cast<int>(m.scancode) == scancode) return m.key;
    }
    return Key::Unknown;
}

int scancodeFromKey(Key key) {
    for (const auto& m : kKeyMap) {
        if (m.key == key) return static_cast<int>(m.scancode);
    }
    return static_cast<int>(SDL_SCANCODE_UNKNOWN);
}

} // namespace camrig
