#include "flycam/app.hpp"

#include <iostream>
#include <stdexcept>

#include "flycam/config.hpp"

namespace flycam {

const char* ToString(FrameStatus status) {
  switch (status) {
    case FrameStatus::Ok:
      return "ok";
    case FrameStatus::Lost:
      return "lost";
    case FrameStatus::Outdated:
      return "outdated";
    case FrameStatus::Timeout:
      return "timeout";
    case FrameStatus::OutOfMemory:
      return "out of memory";
    case FrameStatus::DeviceLost:
      return "device lost";
  }
  return "unknown";
}

App::App(float speed) : App(Camera{}, speed) {}

App::App(const Camera& camera, float speed) : camera_(camera), controller_(speed) {}

void App::Start(std::unique_ptr<RenderBackend> backend, Size size) {
  if (state_ != State::Uninitialized) {
    throw std::logic_error("App::Start: already started");
  }
  if (!backend) {
    throw std::invalid_argument("App::Start: null render backend");
  }
  backend_ = std::move(backend);
  size_ = size;
  if (size_.width > 0 && size_.height > 0) {
    camera_.aspect = static_cast<float>(size_.width) / static_cast<float>(size_.height);
  }
  state_ = State::Running;
  if (Verbose()) {
    std::cout << "App running at " << size_.width << "x" << size_.height << std::endl;
  }
}

void App::AddInputHandler(InputHandler* handler) {
  if (handler) handlers_.push_back(handler);
}

void App::HandleEvent(const WindowEvent& event) {
  if (state_ != State::Running) return;

  switch (event.type) {
    case WindowEvent::Type::CloseRequested:
      state_ = State::ShuttingDown;
      break;
    case WindowEvent::Type::Key:
      if (!routeInput_(event.key) && event.key.key == Key::Escape &&
          event.key.state == KeyState::Pressed) {
        state_ = State::ShuttingDown;
      }
      break;
    case WindowEvent::Type::FocusLost:
      controller_.Reset();
      break;
    case WindowEvent::Type::Resized:
      resize_({event.width, event.height});
      break;
    case WindowEvent::Type::RedrawRequested:
      redraw_();
      break;
  }
}

bool App::routeInput_(const KeyEvent& event) {
  if (controller_.Handle(event)) return true;
  for (InputHandler* handler : handlers_) {
    if (handler->Handle(event)) return true;
  }
  return false;
}

void App::resize_(Size size) {
  // Minimized windows report 0x0; keep the last usable configuration.
  if (size.width == 0 || size.height == 0) return;
  size_ = size;
  camera_.aspect = static_cast<float>(size_.width) / static_cast<float>(size_.height);
  backend_->Resize(size_.width, size_.height);
}

void App::redraw_() {
  if (request_redraw_) request_redraw_();

  controller_.UpdateCamera(camera_);
  try {
    uniform_.UpdateViewProj(camera_);
  } catch (const std::invalid_argument& e) {
    // Keep drawing with the last valid matrix.
    std::cerr << "Warning: camera not updated: " << e.what() << std::endl;
  }

  const FrameStatus status = backend_->Render(uniform_);
  switch (status) {
    case FrameStatus::Ok:
      break;
    case FrameStatus::Lost:
    case FrameStatus::Outdated:
      if (Verbose()) {
        std::cout << "Surface " << ToString(status) << ", reconfiguring" << std::endl;
      }
      if (size_.width > 0 && size_.height > 0) {
        backend_->Resize(size_.width, size_.height);
      }
      break;
    case FrameStatus::Timeout:
      std::cerr << "Warning: surface timeout, frame skipped" << std::endl;
      break;
    case FrameStatus::OutOfMemory:
    case FrameStatus::DeviceLost:
      std::cerr << "Error: " << ToString(status) << std::endl;
      failed_ = true;
      state_ = State::ShuttingDown;
      break;
  }
}

}  // namespace flycam
