#include "window_impl.hpp"
#include <camrig/app.hpp>

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

namespace camrig {

class AppImpl {
public:
    std::vector<Window*> windows; // non-owning, for event routing
};

namespace {

Modifiers modifiersFromSdl(SDL_Keymod mod) {
    Modifiers out = ModNone;
    if (mod & SDL_KMOD_SHIFT) out |= ModShift;
    if (mod & SDL_KMOD_CTRL)  out |= ModControl;
    if (mod & SDL_KMOD_ALT)   out |= ModAlt;
    if (mod & SDL_KMOD_GUI)   out |= ModSuper;
    if (mod & SDL_KMOD_CAPS)  out |= ModCapsLock;
    if (mod & SDL_KMOD_NUM)   out |= ModNumLock;
    return out;
}

bool mouseButtonFromSdl(Uint8 sdlButton, MouseButton& out) {
    switch (sdlButton) {
    case SDL_BUTTON_LEFT:   out = MouseButton::Left;   return true;
    case SDL_BUTTON_MIDDLE: out = MouseButton::Middle; return true;
    case SDL_BUTTON_RIGHT:  out = MouseButton::Right;  return true;
    case SDL_BUTTON_X1:     out = MouseButton::X1;     return true;
    case SDL_BUTTON_X2:     out = MouseButton::X2;     return true;
    default:                return false;
    }
}

void setGlAttributes(const WindowOptions& options) {
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, options.glMajor);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, options.glMinor);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
#ifdef __APPLE__
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, SDL_GL_CONTEXT_FORWARD_COMPATIBLE_FLAG);
#endif
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    SDL_GL_SetAttribute(SDL_GL_MULTISAMPLEBUFFERS, options.samples > 0 ? 1 : 0);
    SDL_GL_SetAttribute(SDL_GL_MULTISAMPLESAMPLES, options.samples);
}

} // namespace

Result<App> App::create() {
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        return Error{"initialize SDL", std::string("SDL_Init failed: ") + SDL_GetError()};
    }
    App app;
    app.impl_ = std::make_unique<AppImpl>();
    return app;
}

App::~App() {
    if (impl_) {
        impl_.reset();
        SDL_Quit();
    }
}

App::App(App&&) noexcept = default;
App& App::operator=(App&&) noexcept = default;

Result<Window> App::createWindow(std::string_view title, std::uint32_t width,
                                 std::uint32_t height, const WindowOptions& options) {
    std::string titleStr(title);

    setGlAttributes(options);

    SDL_WindowFlags flags = SDL_WINDOW_OPENGL;
    if (options.resizable) flags |= SDL_WINDOW_RESIZABLE;

    SDL_Window* sdlWin = SDL_CreateWindow(titleStr.c_str(), static_cast<int>(width),
                                          static_cast<int>(height), flags);
    if (!sdlWin) {
        return Error{"create window", std::string("SDL_CreateWindow failed: ") + SDL_GetError()};
    }

    SDL_GLContext context = SDL_GL_CreateContext(sdlWin);
    if (!context) {
        Error err{"create OpenGL context",
                  std::string("SDL_GL_CreateContext failed: ") + SDL_GetError()};
        SDL_DestroyWindow(sdlWin);
        return err;
    }

    if (!SDL_GL_MakeCurrent(sdlWin, context)) {
        Error err{"make OpenGL context current",
                  std::string("SDL_GL_MakeCurrent failed: ") + SDL_GetError()};
        SDL_GL_DestroyContext(context);
        SDL_DestroyWindow(sdlWin);
        return err;
    }

    if (!SDL_GL_SetSwapInterval(options.vsync ? 1 : 0)) {
        std::fprintf(stderr, "[camrig::sdl3] could not set swap interval: %s\n", SDL_GetError());
    }

    auto impl = std::make_unique<WindowImpl>();
    impl->sdlWindow = sdlWin;
    impl->glContext = context;
    impl->windowId  = SDL_GetWindowID(sdlWin);

    Window window(std::move(impl), this);
    window.setViewport(window.pixelSize());
    return window;
}

void App::pumpEvents() {
    auto forWindow = [&](SDL_WindowID id, auto&& fn) {
        for (auto* w : impl_->windows) {
            if (w->windowId() == id) fn(*w->impl_);
        }
    };

    SDL_Event sdlEvent;
    while (SDL_PollEvent(&sdlEvent)) {
        Event e{};
        e.timestamp = sdlSeconds(sdlEvent.common.timestamp);

        switch (sdlEvent.type) {
        case SDL_EVENT_QUIT:
            e.type = EventType::Quit;
            for (auto* w : impl_->windows) {
                w->impl_->shouldClose = true;
                w->impl_->events.push(e);
            }
            break;

        case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
            e.type = EventType::CloseRequested;
            forWindow(sdlEvent.window.windowID, [&](WindowImpl& w) {
                w.shouldClose = true;
                w.events.push(e);
            });
            break;

        case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
            if (sdlEvent.window.data1 <= 0 || sdlEvent.window.data2 <= 0) break;
            e.type        = EventType::Resized;
            e.size.width  = static_cast<std::uint32_t>(sdlEvent.window.data1);
            e.size.height = static_cast<std::uint32_t>(sdlEvent.window.data2);
            forWindow(sdlEvent.window.windowID, [&](WindowImpl& w) {
                w.events.push(e);
                w.resized = true;
            });
            break;

        case SDL_EVENT_KEY_DOWN:
        case SDL_EVENT_KEY_UP:
            e.type     = EventType::Key;
            e.scancode = static_cast<int>(sdlEvent.key.scancode);
            e.keyCode  = keyFromScancode(e.scancode);
            e.mods     = modifiersFromSdl(sdlEvent.key.mod);
            if (!sdlEvent.key.down) {
                e.action = Action::Release;
            } else {
                e.action = sdlEvent.key.repeat ? Action::Repeat : Action::Press;
            }
            forWindow(sdlEvent.key.windowID, [&](WindowImpl& w) { w.events.push(e); });
            break;

        case SDL_EVENT_MOUSE_MOTION:
            e.type   = EventType::MouseMotion;
            e.mouseX = sdlEvent.motion.x;
            e.mouseY = sdlEvent.motion.y;
            forWindow(sdlEvent.motion.windowID, [&](WindowImpl& w) { w.events.push(e); });
            break;

        case SDL_EVENT_MOUSE_WHEEL: {
            const float flip = sdlEvent.wheel.direction == SDL_MOUSEWHEEL_FLIPPED ? -1.0f : 1.0f;
            e.type   = EventType::MouseWheel;
            e.wheelX = sdlEvent.wheel.x * flip;
            e.wheelY = sdlEvent.wheel.y * flip;
            forWindow(sdlEvent.wheel.windowID, [&](WindowImpl& w) { w.events.push(e); });
            break;
        }

        case SDL_EVENT_MOUSE_BUTTON_DOWN:
        case SDL_EVENT_MOUSE_BUTTON_UP:
            if (!mouseButtonFromSdl(sdlEvent.button.button, e.button)) break;
            e.type   = EventType::MouseButton;
            e.action = sdlEvent.button.down ? Action::Press : Action::Release;
            e.mods   = modifiersFromSdl(SDL_GetModState());
            forWindow(sdlEvent.button.windowID, [&](WindowImpl& w) { w.events.push(e); });
            break;

        default:
            break;
        }
    }
}

void App::registerWindow(Window* w) {
    impl_->windows.push_back(w);
}

void App::unregisterWindow(Window* w) {
    auto& v = impl_->windows;
    v.erase(std::remove(v.begin(), v.end(), w), v.end());
}

} // namespace camrig
