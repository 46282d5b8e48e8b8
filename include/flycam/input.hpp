#pragma once

#include <cstdint>

namespace flycam {

// Keys the application reacts to. Everything else arrives as Key::Other.
enum class Key {
  Other,
  Escape,
  W,
  A,
  S,
  D,
  Up,
  Down,
  Left,
  Right,
  Space,
  LeftShift,
};

enum class KeyState { Pressed, Released };

struct KeyEvent {
  Key key = Key::Other;
  KeyState state = KeyState::Pressed;
};

struct WindowEvent {
  enum class Type {
    CloseRequested,
    Resized,
    Key,
    FocusLost,
    RedrawRequested,
  };

  Type type = Type::RedrawRequested;
  std::uint32_t width = 0;   // Resized
  std::uint32_t height = 0;  // Resized
  KeyEvent key{};            // Key

  static WindowEvent closeRequested() { return {Type::CloseRequested}; }
  static WindowEvent resized(std::uint32_t w, std::uint32_t h) { return {Type::Resized, w, h}; }
  static WindowEvent keyboard(Key k, KeyState s) { return {Type::Key, 0, 0, {k, s}}; }
  static WindowEvent focusLost() { return {Type::FocusLost}; }
  static WindowEvent redrawRequested() { return {Type::RedrawRequested}; }
};

// Something that can consume key input. Returns true when the event was used
// and must not be routed to anyone else.
class InputHandler {
 public:
  virtual ~InputHandler() = default;
  virtual bool Handle(const KeyEvent& event) = 0;
};

}  // namespace flycam
