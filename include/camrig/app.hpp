#pragma once

#include <camrig/error.hpp>
#include <camrig/result.hpp>

#include <cstdint>
#include <memory>
#include <string_view>

namespace camrig {

class Window;
class AppImpl;

struct WindowOptions {
    int  glMajor   = 3;
    int  glMinor   = 3;    // core profile
    int  samples   = 4;    // MSAA, 0 to disable
    bool vsync     = true;
    bool resizable = true;
};

// SDL lifecycle owner. Create one App before any windows and keep it alive
// until they are gone. Pumps the global SDL event queue and routes events to
// per-window queues.
// Windows keep a pointer to the App: it must outlive them and must not be
// moved after the first createWindow().
class App {
public:
    [[nodiscard]] static Result<App> create();

    ~App();
    App(App&&) noexcept;
    App& operator=(App&&) noexcept;
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // Window with a current OpenGL context.
    [[nodiscard]] Result<Window> createWindow(std::string_view title,
                                              std::uint32_t width,
                                              std::uint32_t height,
                                              const WindowOptions& options = {});

    void pumpEvents();

private:
    friend class Window;
    App() = default;
    void registerWindow(Window* w);
    void unregisterWindow(Window* w);

    std::unique_ptr<AppImpl> impl_;
};

} // namespace camrig
