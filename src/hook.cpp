/**
 * @file hook.cpp
 * @brief Public Hook / HookBuilder facade over the hook registry.
 */

#include <hookwatch/hook.hpp>

#include <hookwatch/log.hpp>

#include "hook/event_channel.hpp"
#include "hook/hook_api.hpp"
#include "hook/hook_context.hpp"
#include "hook/hook_registry.hpp"

namespace hookwatch {

HOOKWATCH_API RecvStatus Hook::tryRecv(InputEvent &event) const {
  return detail::EventChannel::instance().tryRecv(event);
}

HOOKWATCH_API bool Hook::hasKeyboard() const noexcept {
  return m_keyboard != nullptr;
}

HOOKWATCH_API bool Hook::hasMouse() const noexcept { return m_mouse != nullptr; }

HOOKWATCH_API bool Hook::isInstalled(HookKind kind) const {
  const auto &ctx = kind == HookKind::Keyboard ? m_keyboard : m_mouse;
  return ctx && ctx->isInstalled();
}

HOOKWATCH_API HookBuilder &HookBuilder::withKeyboard() noexcept {
  m_keyboard = true;
  return *this;
}

HOOKWATCH_API HookBuilder &HookBuilder::withMouse() noexcept {
  m_mouse = true;
  return *this;
}

HOOKWATCH_API std::optional<Hook> HookBuilder::build() const {
  if (!m_keyboard && !m_mouse) {
    HOOKWATCH_LOG_DEBUG("HookBuilder::build: no hook kind selected");
    return std::nullopt;
  }

  auto &registry = detail::HookRegistry::instance();
  auto &api = detail::hookApi();
  Hook hook;

  // A partially built hook is released on the failure paths below.
  if (m_keyboard) {
    hook.m_keyboard = registry.acquire(HookKind::Keyboard, api);
    if (!hook.m_keyboard) {
      HOOKWATCH_LOG_INFO("HookBuilder::build: keyboard hook already active");
      return std::nullopt;
    }
  }
  if (m_mouse) {
    hook.m_mouse = registry.acquire(HookKind::Mouse, api);
    if (!hook.m_mouse) {
      HOOKWATCH_LOG_INFO("HookBuilder::build: mouse hook already active");
      return std::nullopt;
    }
  }
  return hook;
}

HOOKWATCH_API std::optional<Hook> HookBuilder::attach() const {
  if (!m_keyboard && !m_mouse)
    return std::nullopt;

  auto &registry = detail::HookRegistry::instance();
  Hook hook;
  if (m_keyboard) {
    hook.m_keyboard = registry.current(HookKind::Keyboard);
    if (!hook.m_keyboard)
      return std::nullopt;
  }
  if (m_mouse) {
    hook.m_mouse = registry.current(HookKind::Mouse);
    if (!hook.m_mouse)
      return std::nullopt;
  }
  return hook;
}

HOOKWATCH_API std::optional<Hook> keyboardHook() {
  return HookBuilder().withKeyboard().build();
}

HOOKWATCH_API std::optional<Hook> mouseHook() {
  return HookBuilder().withMouse().build();
}

HOOKWATCH_API std::optional<Hook> willhook() {
  return HookBuilder().withKeyboard().withMouse().build();
}

HOOKWATCH_API bool isHookActive(HookKind kind) {
  return detail::HookRegistry::instance().isPresent(kind);
}

HOOKWATCH_API std::optional<Hook> activeHook(HookKind kind) {
  HookBuilder builder;
  if (kind == HookKind::Keyboard)
    builder.withKeyboard();
  else
    builder.withMouse();
  return builder.attach();
}

} // namespace hookwatch
