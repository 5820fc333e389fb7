#include <camrig/frame_loop.hpp>

#include <cstdio>

namespace camrig {

FrameLoop::FrameLoop(Backend& backend, FrameLoopOptions options)
    : backend_(backend), options_(options) {
    timing_.lastFrame = backend_.time();
}

void FrameLoop::run(const RenderFn& render) {
    while (state_ == LoopState::Running && !backend_.shouldClose()) {
        tick(render);
    }
    state_ = LoopState::Closing;
}

bool FrameLoop::tick(const RenderFn& renderFn) {
    updateTiming();

    // Controls added during this tick show up in the next one.
    const ControlRegistry::Snapshot controls = controls_.snapshot();

    processEvents(controls);
    processInput(controls);

    renderFrame(renderFn);
    backend_.swapBuffers();

    backend_.pumpEvents();

    if (backend_.shouldClose()) {
        state_ = LoopState::Closing;
    }
    return state_ == LoopState::Running;
}

void FrameLoop::requestClose() {
    backend_.setShouldClose(true);
    state_ = LoopState::Closing;
}

void FrameLoop::updateTiming() {
    const double now = backend_.time();
    timing_.deltaTime = now - timing_.lastFrame;
    timing_.lastFrame = now;
}

void FrameLoop::processEvents(const ControlRegistry::Snapshot& controls) {
    Event event;
    while (backend_.pollEvent(event)) {
        switch (event.type) {
        case EventType::Quit:
        case EventType::CloseRequested:
            if (!backend_.shouldClose()) {
                std::fprintf(stderr, "[camrig] close requested by the window system\n");
            }
            backend_.setShouldClose(true);
            break;

        case EventType::Resized:
            backend_.setViewport(event.size);
            break;

        case EventType::MouseMotion: {
            if (!lastMousePos_) {
                lastMousePos_ = MousePosition{event.mouseX, event.mouseY};
            }

            MouseEvent m;
            m.xPos    = event.mouseX;
            m.yPos    = event.mouseY;
            m.xOffset = event.mouseX - lastMousePos_->x;
            m.yOffset = lastMousePos_->y - event.mouseY; // screen y grows downward

            lastMousePos_ = MousePosition{event.mouseX, event.mouseY};
            mouseEvent(controls, m);
            break;
        }

        case EventType::MouseWheel: {
            const MousePosition pos = lastMousePos_.value_or(MousePosition{});
            MouseEvent m;
            m.xPos     = pos.x;
            m.yPos     = pos.y;
            m.xOffset  = event.wheelX;
            m.yOffset  = event.wheelY;
            m.isScroll = true;
            mouseEvent(controls, m);
            break;
        }

        case EventType::MouseButton: {
            const MousePosition pos = lastMousePos_.value_or(MousePosition{});
            MouseEvent m;
            m.xPos   = pos.x;
            m.yPos   = pos.y;
            m.button = MouseButtonEvent{event.button, event.action, event.mods};
            mouseEvent(controls, m);
            break;
        }

        case EventType::Key:
            keyboardEvent(controls, KeyEvent{event.keyCode, event.scancode, event.action, event.mods});
            break;

        case EventType::None:
            break;
        }
    }
}

void FrameLoop::processInput(const ControlRegistry::Snapshot& controls) {
    const double dt = timing_.deltaTime;
    ControlRegistry::dispatch(controls, [&](Controllable& c) { c.onInput(backend_, dt); });
}

void FrameLoop::mouseEvent(const ControlRegistry::Snapshot& controls, const MouseEvent& event) {
    const double dt = timing_.deltaTime;
    ControlRegistry::dispatch(controls, [&](Controllable& c) { c.onMouse(event, dt); });
}

void FrameLoop::keyboardEvent(const ControlRegistry::Snapshot& controls, const KeyEvent& event) {
    // The quit key is handled before any control sees it.
    if (event.key == options_.quitKey && event.action == Action::Press) {
        std::fprintf(stderr, "[camrig] quit key %s (%s), closing\n",
                     keyName(event.key), actionName(event.action));
        requestClose();
    }

    const double dt = timing_.deltaTime;
    ControlRegistry::dispatch(controls, [&](Controllable& c) { c.onKeyboard(event, dt); });
}

void FrameLoop::renderFrame(const RenderFn& renderFn) {
    if (renderFn) {
        renderFn(*this);
        return;
    }
    const auto& c = options_.clearColor;
    backend_.clear(c[0], c[1], c[2], c[3]);
}

} // namespace camrig
