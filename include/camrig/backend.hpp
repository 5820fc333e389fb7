#pragma once

#include <camrig/input.hpp>

#include <cstdint>

namespace camrig {

struct Size {
    std::uint32_t width  = 0;
    std::uint32_t height = 0;
};

enum class EventType {
    None,
    Quit,
    CloseRequested,
    Resized,
    Key,
    MouseMotion,
    MouseWheel,
    MouseButton,
};

// Raw backend notification, queued in arrival order.
struct Event {
    EventType   type      = EventType::None;
    double      timestamp = 0.0;              // seconds, same clock as Backend::time()
    Size        size      = {};               // valid when type == Resized
    int         scancode  = 0;                // valid when type == Key (raw escape hatch)
    Key         keyCode   = Key::Unknown;     // valid when type == Key
    Action      action    = Action::Release;  // valid when type == Key or MouseButton
    Modifiers   mods      = ModNone;          // valid when type == Key or MouseButton
    float       mouseX    = 0.0f;             // valid when type == MouseMotion (pixel coords, y-down)
    float       mouseY    = 0.0f;
    float       wheelX    = 0.0f;             // valid when type == MouseWheel (positive = right)
    float       wheelY    = 0.0f;             // valid when type == MouseWheel (positive = up)
    MouseButton button    = MouseButton::Left; // valid when type == MouseButton
};

// Everything the frame loop needs from a window system: an event queue,
// live key/button state, a clock, and a presentable rendering context.
// Window (SDL3 + OpenGL) is the production implementation.
//
// Thread safety: thread-confined (main/UI thread).
class Backend {
public:
    virtual ~Backend() = default;

    // Drain one queued event. Returns false when the queue is empty.
    virtual bool pollEvent(Event& event) = 0;

    [[nodiscard]] virtual bool shouldClose() const = 0;
    virtual void setShouldClose(bool close) = 0;

    // Live state, not queued. Returns Press or Release, never Repeat.
    [[nodiscard]] virtual Action keyState(Key key) const = 0;
    [[nodiscard]] virtual Action mouseButtonState(MouseButton button) const = 0;

    // Seconds since the backend epoch.
    [[nodiscard]] virtual double time() const = 0;

    virtual void swapBuffers() = 0;

    // Collect pending OS events into the queue drained by pollEvent().
    virtual void pumpEvents() = 0;

    [[nodiscard]] virtual Size pixelSize() const = 0;
    virtual void setViewport(Size size) = 0;
    virtual void clear(float r, float g, float b, float a) = 0;

protected:
    Backend() = default;
    Backend(const Backend&) = default;
    Backend& operator=(const Backend&) = default;
    Backend(Backend&&) = default;
    Backend& operator=(Backend&&) = default;
};

} // namespace camrig
