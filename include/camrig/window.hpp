#pragma once

#include <camrig/backend.hpp>
#include <camrig/error.hpp>
#include <camrig/result.hpp>

#include <cstdint>
#include <memory>
#include <string_view>

struct SDL_Window; // forward-declare -- no SDL.h in user code

namespace camrig {

[[nodiscard]] Key keyFromScancode(int scancode);
[[nodiscard]] int scancodeFromKey(Key key);

class App;
class WindowImpl;

// SDL3 window + OpenGL context. The Backend a FrameLoop normally runs on.
class Window final : public Backend {
public:
    ~Window() override;
    Window(Window&&) noexcept;
    Window& operator=(Window&&) noexcept;
    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool pollEvent(Event& event) override;

    [[nodiscard]] bool shouldClose() const override;
    void setShouldClose(bool close) override;

    [[nodiscard]] Action keyState(Key key) const override;
    [[nodiscard]] Action mouseButtonState(MouseButton button) const override;

    [[nodiscard]] double time() const override;

    void swapBuffers() override;
    void pumpEvents() override;

    // Pixel size of the client area (accounts for DPI/HiDPI).
    [[nodiscard]] Size pixelSize() const override;
    void setViewport(Size size) override;
    void clear(float r, float g, float b, float a) override;

    // Returns true once if the window was resized since the last call.
    [[nodiscard]] bool consumeResize();

    [[nodiscard]] Result<void> setTitle(std::string_view title);

    // Escape hatch -- typed pointer, forward-declared above.
    [[nodiscard]] SDL_Window* sdlWindow() const;

    // SDL window ID for event routing.
    [[nodiscard]] std::uint32_t windowId() const;

private:
    friend class App;
    explicit Window(std::unique_ptr<WindowImpl> impl, App* app);
    void destroy();

    std::unique_ptr<WindowImpl> impl_;
    App* app_ = nullptr;
};

} // namespace camrig
