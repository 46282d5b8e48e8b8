#pragma once

#include "flycam/camera.hpp"
#include "flycam/input.hpp"

namespace flycam {

// Moves the camera eye around its target from held movement keys.
//
// Forward/backward travel along the eye->target direction. Strafing (left,
// right, up, down) nudges the eye sideways and then pulls it back onto the
// sphere around the target, so the camera orbits instead of sliding past.
class CameraController : public InputHandler {
 public:
  explicit CameraController(float speed);

  // W/A/S/D, arrow keys, Space (up) and LeftShift (down). Returns false for
  // any other key.
  bool Handle(const KeyEvent& event) override;

  // Applies one frame of movement. Held keys stay held afterwards.
  void UpdateCamera(Camera& camera) const;

  // Releases every key, e.g. when the window loses focus.
  void Reset();

  float speed() const { return speed_; }

  bool forwardPressed() const { return forward_; }
  bool backwardPressed() const { return backward_; }
  bool leftPressed() const { return left_; }
  bool rightPressed() const { return right_; }
  bool upPressed() const { return up_; }
  bool downPressed() const { return down_; }

 private:
  float speed_;
  bool forward_ = false;
  bool backward_ = false;
  bool left_ = false;
  bool right_ = false;
  bool up_ = false;
  bool down_ = false;
};

}  // namespace flycam
