#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "flycam/camera.hpp"
#include "flycam/camera_controller.hpp"
#include "flycam/input.hpp"

namespace flycam {

// Outcome of presenting one frame.
enum class FrameStatus {
  Ok,
  Lost,         // surface must be reconfigured
  Outdated,     // surface must be reconfigured
  Timeout,      // skip this frame
  OutOfMemory,  // fatal
  DeviceLost,   // fatal
};

const char* ToString(FrameStatus status);

struct Size {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
};

// Everything GPU side. Implemented by the WebGPU renderer and by fakes in tests.
class RenderBackend {
 public:
  virtual ~RenderBackend() = default;
  // Reconfigure the presentation surface. Only called with non-zero sizes.
  virtual void Resize(std::uint32_t width, std::uint32_t height) = 0;
  // Upload the camera and draw one frame.
  virtual FrameStatus Render(const CameraUniform& camera) = 0;
};

// Owns the camera, the controller and the render backend, and reacts to
// window events. Uninitialized -> Running -> ShuttingDown.
class App {
 public:
  enum class State { Uninitialized, Running, ShuttingDown };

  explicit App(float speed);
  App(const Camera& camera, float speed);

  App(const App&) = delete;
  App& operator=(const App&) = delete;

  // Takes ownership of the backend. Throws std::logic_error unless
  // Uninitialized, std::invalid_argument on a null backend.
  void Start(std::unique_ptr<RenderBackend> backend, Size size);

  void HandleEvent(const WindowEvent& event);

  // Called whenever a frame finishes, so the window keeps redrawing.
  void SetRedrawRequester(std::function<void()> request_redraw) {
    request_redraw_ = std::move(request_redraw);
  }

  // Additional input consumers, tried after the camera controller.
  void AddInputHandler(InputHandler* handler);

  State state() const { return state_; }
  bool running() const { return state_ == State::Running; }
  // True when the app stopped because of an unrecoverable render failure.
  bool failed() const { return failed_; }

  Size size() const { return size_; }
  const Camera& camera() const { return camera_; }
  const CameraController& controller() const { return controller_; }
  const CameraUniform& uniform() const { return uniform_; }

 private:
  bool routeInput_(const KeyEvent& event);
  void resize_(Size size);
  void redraw_();

  State state_ = State::Uninitialized;
  bool failed_ = false;
  Size size_{};

  Camera camera_;
  CameraController controller_;
  CameraUniform uniform_;
  std::vector<InputHandler*> handlers_;

  std::unique_ptr<RenderBackend> backend_;
  std::function<void()> request_redraw_;
};

}  // namespace flycam
