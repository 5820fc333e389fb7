#pragma once

// Internal header -- shared between app_sdl3.cpp and window_sdl3.cpp.
// Not part of the public API.

#include <camrig/window.hpp>

#include <SDL3/SDL.h>

#include <queue>

namespace camrig {

class WindowImpl {
public:
    SDL_Window*       sdlWindow   = nullptr;
    SDL_GLContext     glContext   = nullptr;
    SDL_WindowID      windowId    = 0;
    bool              resized     = false;
    bool              shouldClose = false;
    std::queue<Event> events;
};

// SDL event timestamps are nanoseconds since SDL_Init, same as SDL_GetTicksNS().
inline double sdlSeconds(Uint64 ns) {
    return static_cast<double>(ns) * 1e-9;
}

} // namespace camrig
