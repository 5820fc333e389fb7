#include <camrig/camrig.hpp>

#include <glm/glm.hpp>

#include <cstdint>
#include <cstdio>

// Fly around an empty scene. The clear colour follows the view direction so
// mouse-look is visible without any draw calls; the title shows position,
// field of view and frame rate.
int main() {
    auto app = camrig::App::create().orThrow();
    auto window = app.createWindow("camrig - Fly Camera", 1280, 720).orThrow();

    camrig::FrameLoop loop(window);
    auto camera = loop.emplaceControl<camrig::Camera>();

    std::printf("Controls: hold LMB to look, WASD move, scroll zoom, ESC quit\n");

    double titleTimer = 0.0;
    std::uint32_t frames = 0;

    loop.run([&](camrig::FrameLoop& l) {
        const camrig::Size size = l.backend().pixelSize();
        if (size.width == 0 || size.height == 0) {
            return; // minimized
        }

        glm::vec3 front{0.0f};
        glm::vec3 pos{0.0f};
        float zoom = 0.0f;
        l.controls().with(camera, [&](camrig::Camera& c) {
            front = c.front();
            pos   = c.position();
            zoom  = c.zoom();
        });

        const glm::vec3 tint = 0.5f * (front + glm::vec3(1.0f));
        l.backend().clear(0.2f * tint.x, 0.3f * tint.y, 0.3f * tint.z, 1.0f);

        ++frames;
        titleTimer += l.timing().deltaTime;
        if (titleTimer >= 0.5) {
            char title[128];
            std::snprintf(title, sizeof(title),
                          "camrig - Fly Camera | pos %.2f %.2f %.2f | fov %.0f | %.0f fps",
                          pos.x, pos.y, pos.z, zoom, frames / titleTimer);
            auto r = window.setTitle(title);
            if (!r.ok()) {
                std::fprintf(stderr, "%s\n", r.error().format().c_str());
            }
            titleTimer = 0.0;
            frames = 0;
        }
    });

    return 0;
}
