#include "flycam/camera_controller.hpp"

#include <cmath>
#include <stdexcept>

#include <glm/geometric.hpp>

namespace flycam {

namespace {
constexpr float kEpsilon = 1e-6f;
// Vertical orbiting stops this close to looking straight along up.
constexpr float kMaxPitchCos = 0.99f;
}  // namespace

CameraController::CameraController(float speed) : speed_(speed) {
  if (!(speed > 0.0f) || !std::isfinite(speed)) {
    throw std::invalid_argument("CameraController: speed must be a positive finite number");
  }
}

bool CameraController::Handle(const KeyEvent& event) {
  const bool pressed = event.state == KeyState::Pressed;
  switch (event.key) {
    case Key::W:
    case Key::Up:
      forward_ = pressed;
      return true;
    case Key::S:
    case Key::Down:
      backward_ = pressed;
      return true;
    case Key::A:
    case Key::Left:
      left_ = pressed;
      return true;
    case Key::D:
    case Key::Right:
      right_ = pressed;
      return true;
    case Key::Space:
      up_ = pressed;
      return true;
    case Key::LeftShift:
      down_ = pressed;
      return true;
    default:
      return false;
  }
}

void CameraController::UpdateCamera(Camera& camera) const {
  const glm::vec3 forward = camera.target - camera.eye;
  const float forward_len = glm::length(forward);
  if (!(forward_len > kEpsilon)) return;
  const glm::vec3 forward_dir = forward / forward_len;

  // Never step onto or past the target. Backing away is unbounded.
  if (forward_ && forward_len > speed_) {
    camera.eye += forward_dir * speed_;
  }
  if (backward_) {
    camera.eye -= forward_dir * speed_;
  }

  glm::vec3 right = glm::cross(forward_dir, camera.up);
  const float right_len = glm::length(right);
  if (!(right_len > kEpsilon)) return;  // view direction parallel to up
  right /= right_len;
  const glm::vec3 true_up = glm::cross(right, forward_dir);

  const float sideways = (right_ ? speed_ : 0.0f) - (left_ ? speed_ : 0.0f);
  float vertical = (up_ ? speed_ : 0.0f) - (down_ ? speed_ : 0.0f);
  if (sideways == 0.0f && vertical == 0.0f) return;

  // Radius after the forward/backward step; strafing keeps it.
  const float radius = glm::length(camera.target - camera.eye);
  glm::vec3 moved = forward_dir * radius + right * sideways + true_up * vertical;
  if (vertical != 0.0f &&
      std::abs(glm::dot(glm::normalize(moved), glm::normalize(camera.up))) > kMaxPitchCos) {
    // Crossing the pole would flip right every frame; keep only the sideways part.
    vertical = 0.0f;
    if (sideways == 0.0f) return;
    moved = forward_dir * radius + right * sideways;
  }
  camera.eye = camera.target - glm::normalize(moved) * radius;
}

void CameraController::Reset() {
  forward_ = backward_ = left_ = right_ = up_ = down_ = false;
}

}  // namespace flycam
