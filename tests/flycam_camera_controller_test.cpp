#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

#include <glm/geometric.hpp>

#include "flycam/camera.hpp"
#include "flycam/camera_controller.hpp"

using flycam::Camera;
using flycam::CameraController;
using flycam::Key;
using flycam::KeyEvent;
using flycam::KeyState;

namespace {
Camera sceneCamera() {
  Camera c;
  c.eye = {0.0f, 1.0f, 1.3f};
  c.target = {0.0f, 0.0f, 0.0f};
  c.up = {0.0f, 1.0f, 0.0f};
  c.aspect = 1.2f;
  c.fovy = 70.0f;
  c.znear = 0.1f;
  c.zfar = 1000.0f;
  return c;
}

float distanceToTarget(const Camera& c) { return glm::length(c.target - c.eye); }

void press(CameraController& controller, Key key) {
  ASSERT_TRUE(controller.Handle({key, KeyState::Pressed}));
}
}  // namespace

TEST(CameraController, RejectsNonPositiveSpeed) {
  EXPECT_THROW(CameraController(0.0f), std::invalid_argument);
  EXPECT_THROW(CameraController(-1.0f), std::invalid_argument);
  EXPECT_THROW(CameraController(NAN), std::invalid_argument);
}

TEST(CameraController, MapsMovementKeys) {
  CameraController c(0.2f);
  EXPECT_TRUE(c.Handle({Key::W, KeyState::Pressed}));
  EXPECT_TRUE(c.forwardPressed());
  EXPECT_TRUE(c.Handle({Key::W, KeyState::Released}));
  EXPECT_FALSE(c.forwardPressed());

  EXPECT_TRUE(c.Handle({Key::Down, KeyState::Pressed}));
  EXPECT_TRUE(c.backwardPressed());
  EXPECT_TRUE(c.Handle({Key::Left, KeyState::Pressed}));
  EXPECT_TRUE(c.leftPressed());
  EXPECT_TRUE(c.Handle({Key::D, KeyState::Pressed}));
  EXPECT_TRUE(c.rightPressed());
  EXPECT_TRUE(c.Handle({Key::Space, KeyState::Pressed}));
  EXPECT_TRUE(c.upPressed());
  EXPECT_TRUE(c.Handle({Key::LeftShift, KeyState::Pressed}));
  EXPECT_TRUE(c.downPressed());
}

TEST(CameraController, LeavesOtherKeysUnconsumed) {
  CameraController c(0.2f);
  EXPECT_FALSE(c.Handle({Key::Escape, KeyState::Pressed}));
  EXPECT_FALSE(c.Handle({Key::Other, KeyState::Pressed}));
  EXPECT_FALSE(c.Handle({Key::Other, KeyState::Released}));
  EXPECT_FALSE(c.forwardPressed());
}

TEST(CameraController, ForwardStepsExactlySpeedTowardTarget) {
  CameraController c(0.2f);
  press(c, Key::W);
  Camera cam = sceneCamera();
  const glm::vec3 before = cam.eye;
  const glm::vec3 dir = glm::normalize(cam.target - cam.eye);
  const float dist = distanceToTarget(cam);
  ASSERT_NEAR(dist, 1.6401f, 1e-4f);

  c.UpdateCamera(cam);

  EXPECT_NEAR(distanceToTarget(cam), dist - 0.2f, 1e-5f);
  const glm::vec3 expected = before + dir * 0.2f;
  EXPECT_NEAR(cam.eye.x, expected.x, 1e-6f);
  EXPECT_NEAR(cam.eye.y, expected.y, 1e-6f);
  EXPECT_NEAR(cam.eye.z, expected.z, 1e-6f);
}

TEST(CameraController, ForwardStopsShortOfTarget) {
  CameraController c(0.2f);
  press(c, Key::Up);
  Camera cam = sceneCamera();
  cam.eye = {0.0f, 0.0f, 0.15f};
  c.UpdateCamera(cam);
  EXPECT_EQ(cam.eye, glm::vec3(0.0f, 0.0f, 0.15f));

  // Distance equal to speed is not enough either.
  cam.eye = {0.0f, 0.0f, 0.2f};
  c.UpdateCamera(cam);
  EXPECT_EQ(cam.eye, glm::vec3(0.0f, 0.0f, 0.2f));
}

TEST(CameraController, ForwardNeverPassesTarget) {
  CameraController c(0.2f);
  press(c, Key::W);
  Camera cam = sceneCamera();
  for (int i = 0; i < 100; ++i) {
    c.UpdateCamera(cam);
    ASSERT_GT(cam.eye.z, 0.0f);
    ASSERT_GT(distanceToTarget(cam), 0.0f);
  }
  EXPECT_LE(distanceToTarget(cam), 0.2f + 1e-5f);
}

// Backing away has no limit, unlike moving forward.
TEST(CameraController, BackwardIsNotClamped) {
  CameraController c(0.2f);
  press(c, Key::S);
  Camera cam = sceneCamera();
  cam.eye = {0.0f, 0.0f, 0.1f};
  for (int i = 0; i < 50; ++i) c.UpdateCamera(cam);
  EXPECT_NEAR(distanceToTarget(cam), 0.1f + 50 * 0.2f, 1e-3f);
  EXPECT_NEAR(cam.eye.x, 0.0f, 1e-6f);
  EXPECT_NEAR(cam.eye.y, 0.0f, 1e-6f);
}

TEST(CameraController, ForwardAndBackwardCancel) {
  CameraController c(0.2f);
  press(c, Key::W);
  press(c, Key::S);
  Camera cam = sceneCamera();
  const float dist = distanceToTarget(cam);
  c.UpdateCamera(cam);
  EXPECT_NEAR(distanceToTarget(cam), dist, 1e-5f);
}

TEST(CameraController, StrafeKeepsDistanceToTarget) {
  for (Key key : {Key::A, Key::D, Key::Space, Key::LeftShift}) {
    CameraController c(0.2f);
    press(c, key);
    Camera cam = sceneCamera();
    const float dist = distanceToTarget(cam);
    const glm::vec3 start = cam.eye;
    for (int i = 0; i < 5; ++i) {
      c.UpdateCamera(cam);
      EXPECT_NEAR(distanceToTarget(cam), dist, 1e-5f);
    }
    EXPECT_GT(glm::length(cam.eye - start), 0.1f);
  }
}

TEST(CameraController, RightSwingsViewDirectionRight) {
  CameraController c(0.2f);
  press(c, Key::D);
  Camera cam;
  cam.eye = {0.0f, 0.0f, 2.0f};
  c.UpdateCamera(cam);
  const glm::vec3 forward = cam.target - cam.eye;
  EXPECT_GT(forward.x, 0.0f);
  EXPECT_NEAR(forward.y, 0.0f, 1e-6f);
  EXPECT_NEAR(glm::length(forward), 2.0f, 1e-5f);
}

TEST(CameraController, LeftMirrorsRight) {
  Camera right;
  right.eye = {0.0f, 0.0f, 2.0f};
  Camera left = right;

  CameraController r(0.2f);
  press(r, Key::Right);
  r.UpdateCamera(right);
  CameraController l(0.2f);
  press(l, Key::A);
  l.UpdateCamera(left);

  EXPECT_NEAR(left.eye.x, -right.eye.x, 1e-6f);
  EXPECT_NEAR(left.eye.z, right.eye.z, 1e-6f);
}

TEST(CameraController, UpTiltsViewDirectionUp) {
  CameraController c(0.2f);
  press(c, Key::Space);
  Camera cam;
  cam.eye = {0.0f, 0.0f, 2.0f};
  c.UpdateCamera(cam);
  const glm::vec3 forward = cam.target - cam.eye;
  EXPECT_GT(forward.y, 0.0f);
  EXPECT_NEAR(forward.x, 0.0f, 1e-6f);
}

TEST(CameraController, OpposingStrafesCancel) {
  CameraController c(0.2f);
  press(c, Key::A);
  press(c, Key::D);
  Camera cam = sceneCamera();
  const glm::vec3 before = cam.eye;
  c.UpdateCamera(cam);
  EXPECT_EQ(cam.eye, before);
}

TEST(CameraController, StrafeUsesRadiusAfterForwardStep) {
  CameraController c(0.2f);
  press(c, Key::W);
  press(c, Key::D);
  Camera cam = sceneCamera();
  const float dist = distanceToTarget(cam);
  c.UpdateCamera(cam);
  EXPECT_NEAR(distanceToTarget(cam), dist - 0.2f, 1e-5f);
}

TEST(CameraController, KeysStayHeldAcrossUpdates) {
  CameraController c(0.2f);
  press(c, Key::S);
  Camera cam = sceneCamera();
  const float dist = distanceToTarget(cam);
  c.UpdateCamera(cam);
  c.UpdateCamera(cam);
  EXPECT_TRUE(c.backwardPressed());
  EXPECT_NEAR(distanceToTarget(cam), dist + 0.4f, 1e-5f);

  ASSERT_TRUE(c.Handle({Key::S, KeyState::Released}));
  c.UpdateCamera(cam);
  EXPECT_NEAR(distanceToTarget(cam), dist + 0.4f, 1e-5f);
}

TEST(CameraController, ResetReleasesEverything) {
  CameraController c(0.2f);
  press(c, Key::W);
  press(c, Key::A);
  press(c, Key::Space);
  c.Reset();
  EXPECT_FALSE(c.forwardPressed());
  EXPECT_FALSE(c.leftPressed());
  EXPECT_FALSE(c.upPressed());
  Camera cam = sceneCamera();
  const glm::vec3 before = cam.eye;
  c.UpdateCamera(cam);
  EXPECT_EQ(cam.eye, before);
}

TEST(CameraController, CoincidentEyeAndTargetIsLeftAlone) {
  CameraController c(0.2f);
  press(c, Key::S);
  press(c, Key::D);
  Camera cam;
  cam.eye = cam.target;
  c.UpdateCamera(cam);
  EXPECT_EQ(cam.eye, cam.target);
  EXPECT_FALSE(std::isnan(cam.eye.x));
}

TEST(CameraController, NoSidewaysMoveWhenLookingAlongUp) {
  CameraController c(0.2f);
  press(c, Key::D);
  Camera cam;
  cam.eye = {0.0f, 3.0f, 0.0f};
  c.UpdateCamera(cam);
  EXPECT_EQ(cam.eye, glm::vec3(0.0f, 3.0f, 0.0f));
}

TEST(CameraController, HoldingUpStopsShortOfThePole) {
  CameraController c(0.2f);
  press(c, Key::Space);
  Camera cam = sceneCamera();
  glm::mat4 previous = flycam::BuildViewProjection(cam);
  for (int frame = 0; frame < 50; ++frame) {
    c.UpdateCamera(cam);
    const glm::vec3 forward_dir = glm::normalize(cam.target - cam.eye);
    const glm::vec3 right = glm::cross(forward_dir, cam.up);
    EXPECT_GT(right.x, 0.0f) << "frame " << frame;
    EXPECT_LE(std::abs(glm::dot(forward_dir, cam.up)), 0.99f + 1e-5f) << "frame " << frame;

    glm::mat4 view_proj;
    ASSERT_NO_THROW(view_proj = flycam::BuildViewProjection(cam)) << "frame " << frame;
    for (int col = 0; col < 4; ++col) {
      for (int row = 0; row < 4; ++row) {
        EXPECT_NEAR(view_proj[col][row], previous[col][row], 0.5f)
            << "frame " << frame << " [" << col << "][" << row << "]";
      }
    }
    previous = view_proj;
  }
  EXPECT_NEAR(distanceToTarget(cam), distanceToTarget(sceneCamera()), 1e-4f);
}

TEST(CameraController, SidewaysStillWorksAtThePitchLimit) {
  CameraController c(0.2f);
  press(c, Key::Space);
  Camera cam = sceneCamera();
  for (int frame = 0; frame < 50; ++frame) c.UpdateCamera(cam);
  const glm::vec3 pinned = cam.eye;
  c.UpdateCamera(cam);
  EXPECT_EQ(cam.eye, pinned);

  press(c, Key::D);
  c.UpdateCamera(cam);
  EXPECT_NE(cam.eye.x, pinned.x);
}
