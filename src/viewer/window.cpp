#include "window.h"
#include <webgpu/webgpu_cpp.h>
#include <webgpu/webgpu_glfw.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "flycam/config.hpp"

namespace flycam::viewer {

Key KeyFromGlfw(int key) {
  switch (key) {
    case GLFW_KEY_ESCAPE:
      return Key::Escape;
    case GLFW_KEY_W:
      return Key::W;
    case GLFW_KEY_A:
      return Key::A;
    case GLFW_KEY_S:
      return Key::S;
    case GLFW_KEY_D:
      return Key::D;
    case GLFW_KEY_UP:
      return Key::Up;
    case GLFW_KEY_DOWN:
      return Key::Down;
    case GLFW_KEY_LEFT:
      return Key::Left;
    case GLFW_KEY_RIGHT:
      return Key::Right;
    case GLFW_KEY_SPACE:
      return Key::Space;
    case GLFW_KEY_LEFT_SHIFT:
      return Key::LeftShift;
    default:
      return Key::Other;
  }
}

Window::Window(const std::string& title, Size size) : title_(title) {
  if (!glfwInit()) {
    throw std::runtime_error("GLFW init failed");
  }
  // WebGPU owns presentation; no GL context.
  glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
  glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
#if defined(__APPLE__)
  glfwWindowHint(GLFW_COCOA_RETINA_FRAMEBUFFER, GLFW_TRUE);
#endif

  window_ = glfwCreateWindow(static_cast<int>(size.width), static_cast<int>(size.height),
                             title_.c_str(), nullptr, nullptr);
  if (!window_) {
    glfwTerminate();
    throw std::runtime_error("GLFW window creation failed");
  }

  glfwSetWindowUserPointer(window_, this);

  glfwSetWindowCloseCallback(window_, [](GLFWwindow* win) {
    if (auto* w = self(win)) w->emit(WindowEvent::closeRequested());
  });

  glfwSetFramebufferSizeCallback(window_, [](GLFWwindow* win, int width, int height) {
    auto* w = self(win);
    if (!w) return;
    w->emit(WindowEvent::resized(static_cast<std::uint32_t>(std::max(0, width)),
                                 static_cast<std::uint32_t>(std::max(0, height))));
  });

  glfwSetKeyCallback(window_, [](GLFWwindow* win, int key, int /*scancode*/, int action,
                                 int /*mods*/) {
    auto* w = self(win);
    if (!w) return;
    // Held keys are tracked by press/release; repeats carry no information.
    if (action == GLFW_REPEAT) return;
    const KeyState state = action == GLFW_PRESS ? KeyState::Pressed : KeyState::Released;
    w->emit(WindowEvent::keyboard(KeyFromGlfw(key), state));
  });

  glfwSetWindowFocusCallback(window_, [](GLFWwindow* win, int focused) {
    auto* w = self(win);
    if (w && focused == GLFW_FALSE) w->emit(WindowEvent::focusLost());
  });

  // Repaint during live resize on platforms that run a modal resize loop.
  glfwSetWindowRefreshCallback(window_, [](GLFWwindow* win) {
    if (auto* w = self(win)) w->RequestRedraw();
  });

  if (Verbose()) {
    const Size fb = this->size();
    std::cout << "Window '" << title_ << "' framebuffer " << fb.width << "x" << fb.height
              << std::endl;
  }
}

Window::~Window() {
  if (window_) glfwDestroyWindow(window_);
  glfwTerminate();
}

Window* Window::self(GLFWwindow* win) {
  return static_cast<Window*>(glfwGetWindowUserPointer(win));
}

void Window::emit(const WindowEvent& event) {
  if (sink_) sink_(event);
}

Size Window::size() const {
  int w = 0, h = 0;
  glfwGetFramebufferSize(window_, &w, &h);
  return {static_cast<std::uint32_t>(std::max(0, w)), static_cast<std::uint32_t>(std::max(0, h))};
}

void Window::PollEvents() {
  const Size fb = size();
  if (fb.width == 0 || fb.height == 0 || glfwGetWindowAttrib(window_, GLFW_ICONIFIED)) {
    // Nothing to present to while minimized.
    glfwWaitEventsTimeout(0.1);
    return;
  }

  glfwPollEvents();
  if (redraw_requested_) {
    redraw_requested_ = false;
    emit(WindowEvent::redrawRequested());
  }
}

WGPUSurface Window::CreateSurface(WGPUInstance instance) const {
  wgpu::Surface surface = wgpu::glfw::CreateSurfaceForWindow(wgpu::Instance(instance), window_);
  if (!surface) {
    throw std::runtime_error("failed to create WebGPU surface for window");
  }
  return surface.MoveToCHandle();
}

}  // namespace flycam::viewer
