#pragma once
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <webgpu/webgpu.h>
#include <functional>
#include <string>

#include "flycam/app.hpp"
#include "flycam/input.hpp"

namespace flycam::viewer {

// GLFW window without a client API. Translates GLFW callbacks into
// flycam::WindowEvent and hands them to the registered sink.
class Window {
 public:
  using EventSink = std::function<void(const WindowEvent&)>;

  // Throws std::runtime_error if GLFW or the window cannot be created.
  Window(const std::string& title, Size size);
  ~Window();

  Window(const Window&) = delete;
  Window& operator=(const Window&) = delete;

  // Current framebuffer size in pixels; 0x0 while minimized.
  Size size() const;

  void SetEventSink(EventSink sink) { sink_ = std::move(sink); }

  // Emit RedrawRequested on the next PollEvents.
  void RequestRedraw() { redraw_requested_ = true; }

  // Pumps GLFW and dispatches pending events. While the window is minimized
  // this blocks briefly instead of spinning and holds back redraws.
  void PollEvents();

  WGPUSurface CreateSurface(WGPUInstance instance) const;

 private:
  static Window* self(GLFWwindow* win);
  void emit(const WindowEvent& event);

  GLFWwindow* window_{};
  std::string title_;
  EventSink sink_;
  bool redraw_requested_ = false;
};

// GLFW_KEY_* to flycam::Key.
Key KeyFromGlfw(int key);

}  // namespace flycam::viewer
