/**
 * @file hook/hook_procedure.cpp
 * @brief Low-level hook callback body shared by the keyboard and mouse hooks.
 */

#include "hook/hook_procedure.hpp"

#include "hook/event_channel.hpp"
#include "hook/hook_registry.hpp"

namespace hookwatch::detail {

namespace {

std::optional<InputEvent> classifyKeyboard(std::uintptr_t message,
                                           const EventDetails &details) {
  InputEvent ev;
  ev.kind = HookKind::Keyboard;
  switch (message) {
  case kWmKeyDown:
  case kWmSysKeyDown:
    ev.action = KeyAction::Down;
    break;
  case kWmKeyUp:
  case kWmSysKeyUp:
    ev.action = KeyAction::Up;
    break;
  default:
    return std::nullopt;
  }
  ev.keyCode = details.keyCode;
  ev.scanCode = details.scanCode;
  ev.injected = details.injected;
  return ev;
}

std::optional<InputEvent> classifyMouse(std::uintptr_t message,
                                        const EventDetails &details) {
  InputEvent ev;
  ev.kind = HookKind::Mouse;
  switch (message) {
  case kWmLButtonDown:
    ev.action = KeyAction::Down;
    ev.button = MouseButton::Left;
    break;
  case kWmLButtonUp:
    ev.action = KeyAction::Up;
    ev.button = MouseButton::Left;
    break;
  case kWmRButtonDown:
    ev.action = KeyAction::Down;
    ev.button = MouseButton::Right;
    break;
  case kWmRButtonUp:
    ev.action = KeyAction::Up;
    ev.button = MouseButton::Right;
    break;
  case kWmMButtonDown:
    ev.action = KeyAction::Down;
    ev.button = MouseButton::Middle;
    break;
  case kWmMButtonUp:
    ev.action = KeyAction::Up;
    ev.button = MouseButton::Middle;
    break;
  case kWmXButtonDown:
  case kWmXButtonUp: {
    ev.action = message == kWmXButtonDown ? KeyAction::Down : KeyAction::Up;
    const uint32_t which = (details.mouseData >> 16) & 0xFFFFu;
    if (which == kXButton1)
      ev.button = MouseButton::X1;
    else if (which == kXButton2)
      ev.button = MouseButton::X2;
    else
      return std::nullopt;
    break;
  }
  case kWmMouseMove:
  case kWmMouseWheel:
  case kWmMouseHWheel:
  default:
    return std::nullopt;
  }
  ev.injected = details.injected;
  return ev;
}

} // namespace

std::optional<InputEvent> classifyMessage(HookKind kind,
                                          std::uintptr_t message,
                                          const EventDetails &details) noexcept {
  switch (kind) {
  case HookKind::Keyboard:
    return classifyKeyboard(message, details);
  case HookKind::Mouse:
    return classifyMouse(message, details);
  }
  return std::nullopt;
}

std::intptr_t hookProcedure(HookKind kind, int code, std::uintptr_t message,
                            std::intptr_t details) noexcept {
  HookApi &api = hookApi();

  // A negative code must be passed on without any processing.
  if (code < 0 || !HookRegistry::instance().isPresent(kind))
    return api.callNext(code, message, details);

  const EventDetails decoded = api.readDetails(kind, details);
  std::optional<InputEvent> ev = classifyMessage(kind, message, decoded);
  // Fire-and-forget: a failed send drops the event.
  if (ev)
    (void)EventChannel::instance().send(*ev);

  return api.callNext(code, message, details);
}

} // namespace hookwatch::detail
