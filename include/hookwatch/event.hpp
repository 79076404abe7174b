#pragma once

/**
 * @file event.hpp
 * @brief Input event types delivered by hookwatch hooks.
 *
 * Events are plain values: a hook kind, a press/release action and the key
 * or button that produced it. Events are queued in the order the OS hook
 * callback observed them and read back through `Hook::tryRecv`.
 */

#include <cstddef>
#include <cstdint>

#include <hookwatch/core.hpp>

namespace hookwatch {

/**
 * @enum HookKind
 * @brief Low-level hook type. Each kind owns one slot in the process-wide
 * hook registry and one OS hook registration.
 */
enum class HookKind : uint8_t {
  Keyboard = 0,
  Mouse = 1,
};

inline constexpr std::size_t kHookKindCount = 2;

inline constexpr std::size_t hookKindIndex(HookKind kind) noexcept {
  return static_cast<std::size_t>(kind);
}

/**
 * @enum KeyAction
 * @brief Classification of a raw key or button message.
 */
enum class KeyAction : uint8_t {
  Down = 0,
  Up = 1,
};

/**
 * @enum MouseButton
 * @brief Mouse button reported by a mouse event. Keyboard events always
 * carry `MouseButton::None`.
 */
enum class MouseButton : uint8_t {
  None = 0,
  Left,
  Right,
  Middle,
  X1,
  X2,
};

/**
 * @struct InputEvent
 * @brief One observed key or mouse-button transition.
 *
 * For keyboard events `keyCode` is the Windows virtual-key code and
 * `scanCode` the hardware scan code. For mouse events both are zero and
 * `button` identifies the button. `injected` is set when the OS flags the
 * event as synthesized by another process.
 */
struct InputEvent {
  HookKind kind{HookKind::Keyboard};
  KeyAction action{KeyAction::Down};
  uint32_t keyCode{0};
  uint32_t scanCode{0};
  MouseButton button{MouseButton::None};
  bool injected{false};

  bool operator==(const InputEvent &) const = default;
};

/**
 * @enum RecvStatus
 * @brief Result of a non-blocking receive.
 *
 * - `Received`: an event was written to the output argument.
 * - `Empty`: no event is queued right now; a hook may still produce one.
 * - `Disconnected`: no hook is active and the queue is drained, so nothing
 *   can arrive until a new hook is acquired.
 */
enum class RecvStatus : uint8_t {
  Received = 0,
  Empty = 1,
  Disconnected = 2,
};

HOOKWATCH_API const char *toString(HookKind kind) noexcept;
HOOKWATCH_API const char *toString(KeyAction action) noexcept;
HOOKWATCH_API const char *toString(MouseButton button) noexcept;
HOOKWATCH_API const char *toString(RecvStatus status) noexcept;

} // namespace hookwatch
