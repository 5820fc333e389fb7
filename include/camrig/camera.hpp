#pragma once

#include <camrig/controllable.hpp>

#include <glm/glm.hpp>

namespace camrig {

enum class Direction {
    Forward,
    Backward,
    Left,
    Right,
};

// First-person camera with mouse-look and WASD movement.
// Angles are in degrees. front/right/up are derived from yaw/pitch and are
// only ever written by recomputeBasis().
// Usage:
//   auto camera = loop.emplaceControl<Camera>();
//   loop.controls().with(camera, [&](Camera& c) {
//       glm::mat4 vp = c.projectionMatrix(w, h) * c.viewMatrix();
//   });
//
// Input: hold LMB for mouse-look, WASD = move, scroll = zoom (field of view).
//
// Thread safety: none. Share through ControlRegistry.
class Camera final : public Controllable {
public:
    static constexpr float kMinZoom  = 1.0f;
    static constexpr float kMaxZoom  = 45.0f;
    static constexpr float kMaxPitch = 89.0f;

    Camera();
    explicit Camera(const glm::vec3& position, float yaw = -90.0f, float pitch = 0.0f);

    // Look-at from position toward position + front.
    [[nodiscard]] glm::mat4 viewMatrix() const;

    // OpenGL clip conventions (depth [-1,1]). height must be > 0.
    [[nodiscard]] glm::mat4 projectionMatrix(int width, int height) const;

    // front from yaw/pitch, then right = front x worldUp, up = right x front.
    // Both are re-normalized so movement speed does not drop near the poles.
    void recomputeBasis();

    // Translate along front/right by movementSpeed * dt.
    void move(Direction direction, double dt);

    void onMouse(const MouseEvent& event, double dt) override;
    void onKeyboard(const KeyEvent& event, double dt) override;
    void onInput(const Backend& backend, double dt) override;

    void setPosition(const glm::vec3& position) { position_ = position; }
    void setOrientation(float yaw, float pitch);
    void setWorldUp(const glm::vec3& worldUp);
    void setMovementSpeed(float speed) { movementSpeed_ = speed; }
    void setMouseSensitivity(float sens) { mouseSensitivity_ = sens; }
    void setZoom(float zoom);
    void setClipPlanes(float zNear, float zFar) {
        near_ = zNear;
        far_  = zFar;
    }
    void setConstrainPitch(bool constrain) { constrainPitch_ = constrain; }
    void setRotateEnabled(bool enabled) { rotateEnabled_ = enabled; }

    [[nodiscard]] const glm::vec3& position() const { return position_; }
    [[nodiscard]] const glm::vec3& front() const { return front_; }
    [[nodiscard]] const glm::vec3& right() const { return right_; }
    [[nodiscard]] const glm::vec3& up() const { return up_; }
    [[nodiscard]] const glm::vec3& worldUp() const { return worldUp_; }

    [[nodiscard]] float yaw() const { return yaw_; }
    [[nodiscard]] float pitch() const { return pitch_; }
    [[nodiscard]] float zoom() const { return zoom_; }
    [[nodiscard]] float nearPlane() const { return near_; }
    [[nodiscard]] float farPlane() const { return far_; }
    [[nodiscard]] float movementSpeed() const { return movementSpeed_; }
    [[nodiscard]] float mouseSensitivity() const { return mouseSensitivity_; }
    [[nodiscard]] bool constrainPitch() const { return constrainPitch_; }
    [[nodiscard]] bool rotateEnabled() const { return rotateEnabled_; }

private:
    void applyScroll(float yOffset);
    void applyLook(float xOffset, float yOffset);

    glm::vec3 position_{0.0f, 0.0f, 3.0f};
    glm::vec3 front_{0.0f, 0.0f, -1.0f};
    glm::vec3 up_{0.0f, 1.0f, 0.0f};
    glm::vec3 right_{1.0f, 0.0f, 0.0f};
    glm::vec3 worldUp_{0.0f, 1.0f, 0.0f};
    float near_ = 0.1f;
    float far_  = 100.0f;

    float yaw_   = -90.0f;
    float pitch_ = 0.0f;
    bool constrainPitch_ = true;

    bool  rotateEnabled_    = false;
    float movementSpeed_    = 2.5f;
    float mouseSensitivity_ = 0.1f;
    float zoom_             = kMaxZoom;
};

} // namespace camrig
