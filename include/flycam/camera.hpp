#pragma once

#include <glm/glm.hpp>

namespace flycam {

struct Camera {
  glm::vec3 eye{0.0f, 1.0f, 2.0f};
  glm::vec3 target{0.0f, 0.0f, 0.0f};
  glm::vec3 up{0.0f, 1.0f, 0.0f};
  float aspect = 1.0f;
  float fovy = 45.0f;  // degrees
  float znear = 0.1f;
  float zfar = 100.0f;
};

// Combined projection * view for a right-handed world and WebGPU clip space
// (depth in [0, 1]). Throws std::invalid_argument when eye == target, when up
// is parallel to the view direction, or when the projection parameters are
// degenerate.
glm::mat4 BuildViewProjection(const Camera& camera);

// Layout of the camera uniform buffer: one column-major mat4x4<f32>.
struct CameraUniform {
  float view_proj[4][4];

  CameraUniform();

  void UpdateViewProj(const Camera& camera);
};

static_assert(sizeof(CameraUniform) == 16 * sizeof(float), "CameraUniform must be 64 bytes");

}  // namespace flycam
