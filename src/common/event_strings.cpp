/**
 * @file common/event_strings.cpp
 * @brief Display names for the public event enumerations.
 */

#include <hookwatch/event.hpp>

namespace hookwatch {

HOOKWATCH_API const char *toString(HookKind kind) noexcept {
  switch (kind) {
  case HookKind::Keyboard:
    return "Keyboard";
  case HookKind::Mouse:
    return "Mouse";
  }
  return "Unknown";
}

HOOKWATCH_API const char *toString(KeyAction action) noexcept {
  switch (action) {
  case KeyAction::Down:
    return "Down";
  case KeyAction::Up:
    return "Up";
  }
  return "Unknown";
}

HOOKWATCH_API const char *toString(MouseButton button) noexcept {
  switch (button) {
  case MouseButton::None:
    return "None";
  case MouseButton::Left:
    return "Left";
  case MouseButton::Right:
    return "Right";
  case MouseButton::Middle:
    return "Middle";
  case MouseButton::X1:
    return "X1";
  case MouseButton::X2:
    return "X2";
  }
  return "Unknown";
}

HOOKWATCH_API const char *toString(RecvStatus status) noexcept {
  switch (status) {
  case RecvStatus::Received:
    return "Received";
  case RecvStatus::Empty:
    return "Empty";
  case RecvStatus::Disconnected:
    return "Disconnected";
  }
  return "Unknown";
}

} // namespace hookwatch
