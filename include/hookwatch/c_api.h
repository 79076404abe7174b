/**
 * @file c_api.h
 * @brief C-compatible wrapper for hookwatch.
 *
 * A minimal, stable C ABI over `hookwatch::Hook` for language bindings and
 * consumers that cannot link against the C++ API.
 *
 * Notes:
 *  - Hook handles are opaque. Each handle returned by this API must be
 *    released with `hookwatch_hook_destroy`; the OS hook of a kind is removed
 *    when the last handle (C or C++) referencing it is gone.
 *  - Exported symbols are decorated with `HOOKWATCH_API`. When included from
 *    C++ the macro comes from <hookwatch/core.hpp>; from C a no-op fallback
 *    is provided below.
 *  - No C++ exception crosses this boundary. Failing calls return false or
 *    NULL and record a process-wide last error (`hookwatch_get_last_error`).
 *
 * Memory ownership:
 *  - Functions that return strings allocate heap memory which callers must
 *    free via `hookwatch_free_string`.
 *
 * Example:
 * @code{.c}
 * #include <hookwatch/c_api.h>
 *
 * int main(void) {
 *   hookwatch_hook_t hook = hookwatch_keyboard_hook();
 *   if (!hook) return 1;
 *
 *   hookwatch_event_t ev;
 *   while (hookwatch_hook_try_recv(hook, &ev) != HOOKWATCH_RECV_DISCONNECTED) {
 *     // poll
 *   }
 *
 *   hookwatch_hook_destroy(hook);
 *   return 0;
 * }
 * @endcode
 */

#pragma once
#ifndef HOOKWATCH_C_API_H
#define HOOKWATCH_C_API_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifndef HOOKWATCH_API
#define HOOKWATCH_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Opaque hook handle (wraps a `hookwatch::Hook`).
 */
typedef void *hookwatch_hook_t;

/** @brief Hook kinds (mirror hookwatch::HookKind). */
enum {
  HOOKWATCH_KIND_KEYBOARD = 0,
  HOOKWATCH_KIND_MOUSE = 1,
};
typedef uint8_t hookwatch_kind_t;

/** @brief Key/button actions (mirror hookwatch::KeyAction). */
enum {
  HOOKWATCH_ACTION_DOWN = 0,
  HOOKWATCH_ACTION_UP = 1,
};

/** @brief Mouse buttons (mirror hookwatch::MouseButton). */
enum {
  HOOKWATCH_BUTTON_NONE = 0,
  HOOKWATCH_BUTTON_LEFT = 1,
  HOOKWATCH_BUTTON_RIGHT = 2,
  HOOKWATCH_BUTTON_MIDDLE = 3,
  HOOKWATCH_BUTTON_X1 = 4,
  HOOKWATCH_BUTTON_X2 = 5,
};

/** @brief Results of `hookwatch_hook_try_recv` (mirror hookwatch::RecvStatus). */
enum {
  HOOKWATCH_RECV_RECEIVED = 0,
  HOOKWATCH_RECV_EMPTY = 1,
  HOOKWATCH_RECV_DISCONNECTED = 2,
  HOOKWATCH_RECV_ERROR = 255, /**< Invalid arguments; see last error. */
};
typedef uint8_t hookwatch_recv_status_t;

/**
 * @brief One observed key or mouse-button transition (mirrors
 * hookwatch::InputEvent).
 *
 * @var hookwatch_event_t::kind One of HOOKWATCH_KIND_*.
 * @var hookwatch_event_t::action One of HOOKWATCH_ACTION_*.
 * @var hookwatch_event_t::key_code Virtual-key code (keyboard events).
 * @var hookwatch_event_t::scan_code Hardware scan code (keyboard events).
 * @var hookwatch_event_t::button One of HOOKWATCH_BUTTON_* (mouse events).
 * @var hookwatch_event_t::injected True when the OS flagged the event as
 * synthesized.
 */
typedef struct hookwatch_event_t {
  uint8_t kind;
  uint8_t action;
  uint32_t key_code;
  uint32_t scan_code;
  uint8_t button;
  bool injected;
} hookwatch_event_t;

/** @name Hooks
 * @{
 */

/**
 * @brief Register the keyboard hook.
 * @return New handle, or NULL if the keyboard hook is already active in the
 * process (see `hookwatch_active_hook`) or on failure.
 */
HOOKWATCH_API hookwatch_hook_t hookwatch_keyboard_hook(void);

/**
 * @brief Register the mouse hook.
 * @return New handle, or NULL if the mouse hook is already active.
 */
HOOKWATCH_API hookwatch_hook_t hookwatch_mouse_hook(void);

/**
 * @brief Register both the keyboard and the mouse hook.
 * @return New handle, or NULL if either hook is already active.
 */
HOOKWATCH_API hookwatch_hook_t hookwatch_willhook(void);

/**
 * @brief Share the live hook of `kind`.
 * @return New handle, or NULL if no hook of that kind is active.
 */
HOOKWATCH_API hookwatch_hook_t hookwatch_active_hook(hookwatch_kind_t kind);

/**
 * @brief Create another handle sharing the same hooks as `hook`.
 * @return New handle, or NULL on failure.
 */
HOOKWATCH_API hookwatch_hook_t hookwatch_hook_clone(hookwatch_hook_t hook);

/**
 * @brief Release a handle (safe to call with NULL).
 */
HOOKWATCH_API void hookwatch_hook_destroy(hookwatch_hook_t hook);

/**
 * @brief Poll for the next event without blocking.
 * @param hook Hook handle.
 * @param out_event Receives the event when HOOKWATCH_RECV_RECEIVED is
 * returned.
 * @return One of HOOKWATCH_RECV_*.
 */
HOOKWATCH_API hookwatch_recv_status_t
hookwatch_hook_try_recv(hookwatch_hook_t hook, hookwatch_event_t *out_event);

/**
 * @brief Whether `hook` holds a successfully registered hook of `kind`.
 */
HOOKWATCH_API bool hookwatch_hook_is_installed(hookwatch_hook_t hook,
                                               hookwatch_kind_t kind);

/**
 * @brief Whether a hook of `kind` is live anywhere in the process.
 */
HOOKWATCH_API bool hookwatch_is_hook_active(hookwatch_kind_t kind);
/** @} */ /* end of Hooks group */

/* ---------------- Utilities ---------------- */

/**
 * @brief Get the library version string (do not free).
 */
HOOKWATCH_API const char *hookwatch_library_version(void);

/**
 * @brief Retrieve the last process-wide error string, if any.
 * @return char* Heap-allocated copy (free with `hookwatch_free_string`), or
 * NULL when no error is recorded.
 */
HOOKWATCH_API char *hookwatch_get_last_error(void);

/**
 * @brief Clear the process-wide last error string.
 */
HOOKWATCH_API void hookwatch_clear_last_error(void);

/**
 * @brief Free a string returned by the C API. Safe to call with NULL.
 */
HOOKWATCH_API void hookwatch_free_string(char *s);

/** @name Logging
 * @{
 */

enum {
  HOOKWATCH_LOG_LEVEL_DEBUG = 0, /**< Most verbose */
  HOOKWATCH_LOG_LEVEL_INFO = 1,
  HOOKWATCH_LOG_LEVEL_WARN = 2,
  HOOKWATCH_LOG_LEVEL_ERROR = 3, /**< Least verbose */
};
typedef uint8_t hookwatch_log_level_t;

/**
 * @brief Set the global logging level. Out-of-range values are clamped to
 * HOOKWATCH_LOG_LEVEL_ERROR.
 */
HOOKWATCH_API void hookwatch_log_set_level(hookwatch_log_level_t level);

HOOKWATCH_API hookwatch_log_level_t hookwatch_log_get_level(void);

HOOKWATCH_API bool hookwatch_log_is_enabled(hookwatch_log_level_t level);

/**
 * @brief Emit a log message through the library's logger (thread-safe).
 * @param level Log level for the message.
 * @param file Source file name (typically `__FILE__`).
 * @param line Source line number (typically `__LINE__`).
 * @param fmt Printf-style format string.
 */
HOOKWATCH_API void hookwatch_log_message(hookwatch_log_level_t level,
                                         const char *file, int line,
                                         const char *fmt, ...);
/** @} */ /* end of Logging group */

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* HOOKWATCH_C_API_H */
