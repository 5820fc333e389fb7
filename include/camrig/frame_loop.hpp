#pragma once

#include <camrig/backend.hpp>
#include <camrig/control_registry.hpp>
#include <camrig/input.hpp>

#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace camrig {

// Time between the current frame and the previous one.
struct Timing {
    double deltaTime = 0.0; // seconds
    double lastFrame = 0.0; // Backend::time() at the start of the previous tick
};

enum class LoopState {
    Running,
    Closing,
};

struct FrameLoopOptions {
    Key                  quitKey    = Key::Escape;
    std::array<float, 4> clearColor = {0.2f, 0.3f, 0.3f, 1.0f}; // used when no render callback is given
};

struct MousePosition {
    float x = 0.0f;
    float y = 0.0f;
};

// Drives a Backend one frame at a time and feeds every registered
// Controllable. Per tick:
//   1. timing          (deltaTime = now - lastFrame)
//   2. events          drain the backend queue, normalize, dispatch
//   3. input           Controllable::onInput on every control
//   4. render          callback, or clear to options.clearColor
//   5. present         swapBuffers
//   6. pump            collect OS events for the next tick
// Closing is checked once per tick boundary; a tick that starts always
// runs to completion.
//
// The backend is borrowed and must outlive the loop.
// Thread safety: tick()/run() are thread-confined; controls() may be used
// from any thread.
class FrameLoop {
public:
    using RenderFn = std::function<void(FrameLoop&)>;

    explicit FrameLoop(Backend& backend, FrameLoopOptions options = {});

    FrameLoop(const FrameLoop&) = delete;
    FrameLoop& operator=(const FrameLoop&) = delete;

    // Visible from the next tick if called mid-frame.
    template <typename T>
    ControlHandle<T> addControl(std::shared_ptr<T> control) {
        return controls_.add(std::move(control));
    }

    template <typename T, typename... Args>
    ControlHandle<T> emplaceControl(Args&&... args) {
        return controls_.emplace<T>(std::forward<Args>(args)...);
    }

    // Run until the backend or the quit key asks to close.
    void run(const RenderFn& render = {});

    // One iteration. Returns true while still Running.
    bool tick(const RenderFn& render = {});

    void requestClose();

    // Forget the last cursor position so the next motion event seeds it
    // again. Call after warping or capturing the cursor.
    void resetMouseTracking() { lastMousePos_.reset(); }

    [[nodiscard]] Backend& backend() { return backend_; }
    [[nodiscard]] const Backend& backend() const { return backend_; }
    [[nodiscard]] ControlRegistry& controls() { return controls_; }
    [[nodiscard]] const Timing& timing() const { return timing_; }
    [[nodiscard]] LoopState state() const { return state_; }
    [[nodiscard]] const FrameLoopOptions& options() const { return options_; }
    [[nodiscard]] std::optional<MousePosition> lastMousePosition() const { return lastMousePos_; }

private:
    void updateTiming();
    void processEvents(const ControlRegistry::Snapshot& controls);
    void processInput(const ControlRegistry::Snapshot& controls);
    void mouseEvent(const ControlRegistry::Snapshot& controls, const MouseEvent& event);
    void keyboardEvent(const ControlRegistry::Snapshot& controls, const KeyEvent& event);
    void renderFrame(const RenderFn& renderFn);

    Backend&         backend_;
    FrameLoopOptions options_;
    ControlRegistry  controls_;
    Timing           timing_;
    LoopState        state_ = LoopState::Running;

    std::optional<MousePosition> lastMousePos_;
};

} // namespace camrig
