#include <camrig/backend.hpp>
#include <camrig/camera.hpp>

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <cmath>

namespace camrig {

Camera::Camera() {
    recomputeBasis();
}

Camera::Camera(const glm::vec3& position, float yaw, float pitch)
    : position_(position), yaw_(yaw), pitch_(pitch) {
    recomputeBasis();
}

glm::mat4 Camera::viewMatrix() const {
    return glm::lookAt(position_, position_ + front_, up_);
}

glm::mat4 Camera::projectionMatrix(int width, int height) const {
    const float aspect = static_cast<float>(width) / static_cast<float>(height);
    return glm::perspective(glm::radians(zoom_), aspect, near_, far_);
}

void Camera::recomputeBasis() {
    const float yawRad   = glm::radians(yaw_);
    const float pitchRad = glm::radians(pitch_);

    glm::vec3 front;
    front.x = std::cos(yawRad) * std::cos(pitchRad);
    front.y = std::sin(pitchRad);
    front.z = std::sin(yawRad) * std::cos(pitchRad);

    front_ = glm::normalize(front);
    right_ = glm::normalize(glm::cross(front_, worldUp_));
    up_    = glm::normalize(glm::cross(right_, front_));
}

void Camera::move(Direction direction, double dt) {
    const float distance = movementSpeed_ * static_cast<float>(dt);
    switch (direction) {
    case Direction::Forward:
        position_ += front_ * distance;
        break;
    case Direction::Backward:
        position_ -= front_ * distance;
        break;
    case Direction::Left:
        position_ -= right_ * distance;
        break;
    case Direction::Right:
        position_ += right_ * distance;
        break;
    }
}

void Camera::setOrientation(float yaw, float pitch) {
    yaw_   = yaw;
    pitch_ = pitch;
    if (constrainPitch_) {
        pitch_ = std::clamp(pitch_, -kMaxPitch, kMaxPitch);
    }
    recomputeBasis();
}

void Camera::setWorldUp(const glm::vec3& worldUp) {
    worldUp_ = glm::normalize(worldUp);
    recomputeBasis();
}

void Camera::setZoom(float zoom) {
    zoom_ = std::clamp(zoom, kMinZoom, kMaxZoom);
}

void Camera::applyScroll(float yOffset) {
    // Clamp after applying: an overshooting scroll lands on the boundary.
    if (zoom_ >= kMinZoom && zoom_ <= kMaxZoom) {
        zoom_ -= yOffset;
    }
    if (zoom_ <= kMinZoom) {
        zoom_ = kMinZoom;
    }
    if (zoom_ >= kMaxZoom) {
        zoom_ = kMaxZoom;
    }
}

void Camera::applyLook(float xOffset, float yOffset) {
    yaw_   += xOffset * mouseSensitivity_;
    pitch_ += yOffset * mouseSensitivity_;

    // Past +-90 the view flips.
    if (constrainPitch_) {
        if (pitch_ > kMaxPitch) {
            pitch_ = kMaxPitch;
        }
        if (pitch_ < -kMaxPitch) {
            pitch_ = -kMaxPitch;
        }
    }

    recomputeBasis();
}

void Camera::onMouse(const MouseEvent& event, double /*dt*/) {
    if (event.isScroll) {
        applyScroll(event.yOffset);
        return;
    }
    if (event.button) {
        return; // rotation is gated by polled state in onInput()
    }
    if (rotateEnabled_) {
        applyLook(event.xOffset, event.yOffset);
    }
}

void Camera::onKeyboard(const KeyEvent& /*event*/, double /*dt*/) {}

void Camera::onInput(const Backend& backend, double dt) {
    // Edge-triggered: only flip on a state change.
    const Action lmb = backend.mouseButtonState(MouseButton::Left);
    if (lmb == Action::Press && !rotateEnabled_) {
        rotateEnabled_ = true;
    } else if (lmb == Action::Release && rotateEnabled_) {
        rotateEnabled_ = false;
    }

    if (backend.keyState(Key::W) == Action::Press) {
        move(Direction::Forward, dt);
    }
    if (backend.keyState(Key::S) == Action::Press) {
        move(Direction::Backward, dt);
    }
    if (backend.keyState(Key::A) == Action::Press) {
        move(Direction::Left, dt);
    }
    if (backend.keyState(Key::D) == Action::Press) {
        move(Direction::Right, dt);
    }
}

} // namespace camrig
