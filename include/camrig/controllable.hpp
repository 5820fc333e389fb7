#pragma once

#include <camrig/input.hpp>

namespace camrig {

class Backend;

// Anything that reacts to input. Registered with a FrameLoop, which calls
// onMouse/onKeyboard for every queued event and onInput once per frame.
// dt is the current frame's delta time in seconds.
class Controllable {
public:
    virtual ~Controllable() = default;

    virtual void onMouse(const MouseEvent& event, double dt) = 0;
    virtual void onKeyboard(const KeyEvent& event, double dt) = 0;

    // Continuous poll: read held keys/buttons straight from the backend.
    virtual void onInput(const Backend& backend, double dt) = 0;
};

} // namespace camrig
