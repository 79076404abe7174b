#pragma once

/**
 * @file hook.hpp
 * @brief Global low-level keyboard and mouse hooks (Windows).
 *
 * A `Hook` observes keyboard and/or mouse input system-wide, whichever
 * application has focus. Events can only be read: nothing is injected,
 * blocked or altered, and every event still reaches the other hooks in the
 * OS chain.
 *
 * Each hook kind is registered at most once per process. Every kind runs on
 * its own background thread, started when the first `Hook` for it is built
 * and unregistered when the last copy of that `Hook` is destroyed. Copying a
 * `Hook` shares the same registration.
 *
 * Registration failures do not throw. A hook that could not be registered
 * (or any hook on platforms other than Windows) is inert: `isInstalled`
 * returns false and no events ever arrive.
 *
 * Example:
 *
 * @code{.cpp}
 * #include <hookwatch/hook.hpp>
 *
 * int main() {
 *   auto hook = hookwatch::willhook();
 *   if (!hook)
 *     return 1; // keyboard or mouse hook already active in this process
 *
 *   hookwatch::InputEvent ev;
 *   for (;;) {
 *     switch (hook->tryRecv(ev)) {
 *     case hookwatch::RecvStatus::Received:
 *       // handle ev
 *       break;
 *     case hookwatch::RecvStatus::Empty:
 *       // nothing yet; poll again later
 *       break;
 *     case hookwatch::RecvStatus::Disconnected:
 *       return 0;
 *     }
 *   }
 * }
 * @endcode
 */

#include <memory>
#include <optional>

#include <hookwatch/core.hpp>
#include <hookwatch/event.hpp>

namespace hookwatch {

namespace detail {
class HookContext;
} // namespace detail

/**
 * @class Hook
 * @brief Shared handle to the keyboard and/or mouse low-level hook.
 *
 * Copies share ownership; the underlying OS hook of a kind is removed when
 * the last `Hook` referencing it is destroyed.
 */
class HOOKWATCH_API Hook {
public:
  Hook(const Hook &) = default;
  Hook &operator=(const Hook &) = default;
  Hook(Hook &&) noexcept = default;
  Hook &operator=(Hook &&) noexcept = default;
  ~Hook() = default;

  /**
   * @brief Poll for the next event without blocking.
   *
   * All hooks in the process feed a single queue, so a keyboard-only hook can
   * also return mouse events while another `Hook` holds the mouse hook.
   *
   * @param event Receives the event when the result is `Received`.
   * @return `Received`, `Empty` or `Disconnected` (no hook active and no
   * events left).
   */
  RecvStatus tryRecv(InputEvent &event) const;

  [[nodiscard]] bool hasKeyboard() const noexcept;
  [[nodiscard]] bool hasMouse() const noexcept;

  /**
   * @brief Whether the OS registration for `kind` is held by this hook and
   * succeeded.
   */
  [[nodiscard]] bool isInstalled(HookKind kind) const;

private:
  friend class HookBuilder;

  Hook() = default;

  std::shared_ptr<detail::HookContext> m_keyboard;
  std::shared_ptr<detail::HookContext> m_mouse;
};

/**
 * @class HookBuilder
 * @brief Selects which hooks to register.
 *
 * `build()` registers new hooks. It returns std::nullopt when nothing was
 * selected or when a selected kind already has a live hook in this process;
 * `attach()` shares the live hooks instead.
 */
class HOOKWATCH_API HookBuilder {
public:
  HookBuilder() = default;

  HookBuilder &withKeyboard() noexcept;
  HookBuilder &withMouse() noexcept;

  [[nodiscard]] std::optional<Hook> build() const;

  /**
   * @brief Share the live hooks of the selected kinds.
   * @return std::nullopt when nothing was selected or a selected kind has no
   * live hook.
   */
  [[nodiscard]] std::optional<Hook> attach() const;

private:
  bool m_keyboard{false};
  bool m_mouse{false};
};

/// Keyboard hook only. See HookBuilder::build.
HOOKWATCH_API std::optional<Hook> keyboardHook();

/// Mouse hook only. See HookBuilder::build.
HOOKWATCH_API std::optional<Hook> mouseHook();

/// Keyboard and mouse hooks. See HookBuilder::build.
HOOKWATCH_API std::optional<Hook> willhook();

/// Whether a hook of `kind` is live anywhere in the process.
HOOKWATCH_API bool isHookActive(HookKind kind);

/**
 * @brief Share the live hook of `kind`.
 * @return A `Hook` holding only that kind, or std::nullopt if none is live.
 */
HOOKWATCH_API std::optional<Hook> activeHook(HookKind kind);

} // namespace hookwatch
