#include "flycam/camera.hpp"

#include <cstring>
#include <stdexcept>

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>

namespace flycam {

namespace {
constexpr float kEpsilon = 1e-6f;

void checkPreconditions(const Camera& camera) {
  const glm::vec3 forward = camera.target - camera.eye;
  const float forward_len = glm::length(forward);
  if (!(forward_len > kEpsilon)) {
    throw std::invalid_argument("BuildViewProjection: eye and target coincide");
  }
  if (!(glm::length(glm::cross(forward / forward_len, camera.up)) > kEpsilon)) {
    throw std::invalid_argument("BuildViewProjection: up is parallel to the view direction");
  }
  if (!(camera.aspect > 0.0f)) {
    throw std::invalid_argument("BuildViewProjection: aspect must be positive");
  }
  if (!(camera.fovy > 0.0f && camera.fovy < 180.0f)) {
    throw std::invalid_argument("BuildViewProjection: fovy must be in (0, 180) degrees");
  }
  if (!(camera.znear > 0.0f && camera.zfar > camera.znear)) {
    throw std::invalid_argument("BuildViewProjection: require 0 < znear < zfar");
  }
}
}  // namespace

glm::mat4 BuildViewProjection(const Camera& camera) {
  checkPreconditions(camera);
  const glm::mat4 view = glm::lookAtRH(camera.eye, camera.target, camera.up);
  const glm::mat4 proj =
      glm::perspectiveRH_ZO(glm::radians(camera.fovy), camera.aspect, camera.znear, camera.zfar);
  return proj * view;
}

CameraUniform::CameraUniform() {
  const glm::mat4 identity(1.0f);
  std::memcpy(view_proj, glm::value_ptr(identity), sizeof(view_proj));
}

void CameraUniform::UpdateViewProj(const Camera& camera) {
  const glm::mat4 m = BuildViewProjection(camera);
  std::memcpy(view_proj, glm::value_ptr(m), sizeof(view_proj));
}

}  // namespace flycam
