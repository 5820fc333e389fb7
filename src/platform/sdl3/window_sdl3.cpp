#include "window_impl.hpp"
#include <camrig/app.hpp>

#include <SDL3/SDL_opengl.h>

#include <cstdio>
#include <string>

namespace camrig {

Window::Window(std::unique_ptr<WindowImpl> impl, App* app)
    : impl_(std::move(impl)), app_(app) {
    if (app_) app_->registerWindow(this);
}

void Window::destroy() {
    if (!impl_) return;
    if (impl_->glContext) {
        SDL_GL_DestroyContext(impl_->glContext);
        impl_->glContext = nullptr;
    }
    if (impl_->sdlWindow) {
        SDL_DestroyWindow(impl_->sdlWindow);
        impl_->sdlWindow = nullptr;
    }
}

Window::~Window() {
    if (app_) app_->unregisterWindow(this);
    destroy();
}

Window::Window(Window&& o) noexcept
    : impl_(std::move(o.impl_)), app_(o.app_) {
    o.app_ = nullptr;
    if (app_) {
        app_->unregisterWindow(&o);
        app_->registerWindow(this);
    }
}

Window& Window::operator=(Window&& o) noexcept {
    if (this != &o) {
        if (app_) app_->unregisterWindow(this);
        destroy();

        impl_  = std::move(o.impl_);
        app_   = o.app_;
        o.app_ = nullptr;

        if (app_) {
            app_->unregisterWindow(&o);
            app_->registerWindow(this);
        }
    }
    return *this;
}

bool Window::pollEvent(Event& event) {
    if (!impl_ || impl_->events.empty()) {
        event.type = EventType::None;
        return false;
    }
    event = impl_->events.front();
    impl_->events.pop();
    return true;
}

bool Window::shouldClose() const {
    return impl_->shouldClose;
}

void Window::setShouldClose(bool close) {
    impl_->shouldClose = close;
}

Action Window::keyState(Key key) const {
    const int scancode = scancodeFromKey(key);
    if (scancode == SDL_SCANCODE_UNKNOWN) return Action::Release;

    int numKeys = 0;
    const bool* keys = SDL_GetKeyboardState(&numKeys);
    if (scancode >= numKeys) return Action::Release;
    return keys[scancode] ? Action::Press : Action::Release;
}

Action Window::mouseButtonState(MouseButton button) const {
    SDL_MouseButtonFlags mask = 0;
    switch (button) {
    case MouseButton::Left:   mask = SDL_BUTTON_LMASK;  break;
    case MouseButton::Middle: mask = SDL_BUTTON_MMASK;  break;
    case MouseButton::Right:  mask = SDL_BUTTON_RMASK;  break;
    case MouseButton::X1:     mask = SDL_BUTTON_X1MASK; break;
    case MouseButton::X2:     mask = SDL_BUTTON_X2MASK; break;
    }
    const SDL_MouseButtonFlags buttons = SDL_GetMouseState(nullptr, nullptr);
    return (buttons & mask) != 0 ? Action::Press : Action::Release;
}

double Window::time() const {
    return sdlSeconds(SDL_GetTicksNS());
}

void Window::swapBuffers() {
    if (!SDL_GL_SwapWindow(impl_->sdlWindow)) {
        std::fprintf(stderr, "[camrig::sdl3] swap failed: %s\n", SDL_GetError());
    }
}

void Window::pumpEvents() {
    if (app_) app_->pumpEvents();
}

Size Window::pixelSize() const {
    int w = 0, h = 0;
    SDL_GetWindowSizeInPixels(impl_->sdlWindow, &w, &h);
    return Size{
        static_cast<std::uint32_t>(w),
        static_cast<std::uint32_t>(h)
    };
}

void Window::setViewport(Size size) {
    // Pixel size, not window size: larger than requested on HiDPI displays.
    if (!SDL_GL_MakeCurrent(impl_->sdlWindow, impl_->glContext)) {
        std::fprintf(stderr, "[camrig::sdl3] viewport: context not current: %s\n", SDL_GetError());
        return;
    }
    glViewport(0, 0, static_cast<GLsizei>(size.width), static_cast<GLsizei>(size.height));
}

void Window::clear(float r, float g, float b, float a) {
    glClearColor(r, g, b, a);
    glClear(GL_COLOR_BUFFER_BIT);
}

bool Window::consumeResize() {
    bool r = impl_->resized;
    impl_->resized = false;
    return r;
}

Result<void> Window::setTitle(std::string_view title) {
    std::string titleStr(title);
    if (!SDL_SetWindowTitle(impl_->sdlWindow, titleStr.c_str())) {
        return Error{"set window title", std::string("SDL_SetWindowTitle failed: ") + SDL_GetError()};
    }
    return {};
}

SDL_Window* Window::sdlWindow() const {
    return impl_->sdlWindow;
}

std::uint32_t Window::windowId() const {
    return impl_->windowId;
}

} // namespace camrig
