/**
 * @file c_api.cpp
 * @brief C API implementation for hookwatch.
 *
 * Implements the C-compatible wrapper declared in `include/hookwatch/c_api.h`.
 * C++ exceptions are caught at every entry point and converted into a
 * process-wide last-error string retrievable via `hookwatch_get_last_error`.
 */

#include <hookwatch/core.hpp>

#include <hookwatch/c_api.h>

#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <new>
#include <optional>
#include <string>
#include <utility>

#include <hookwatch/hook.hpp>
#include <hookwatch/log.hpp>

namespace {

/**
 * @brief Heap-allocated owner of one `hookwatch::Hook` copy, handed to C
 * callers as `hookwatch_hook_t`.
 */
struct HookWrapper {
  hookwatch::Hook hook;
};

std::mutex g_last_error_mutex;
std::string g_last_error;

void set_last_error(const std::string &s) {
  std::lock_guard<std::mutex> lk(g_last_error_mutex);
  g_last_error = s;
}

void clear_last_error() {
  std::lock_guard<std::mutex> lk(g_last_error_mutex);
  g_last_error.clear();
}

/**
 * @brief Duplicate a std::string into a malloc'ed, null-terminated buffer.
 * @return Buffer to release with `hookwatch_free_string`, or nullptr on OOM.
 */
char *duplicate_c_string(const std::string &s) {
  size_t n = s.size();
  char *p = static_cast<char *>(std::malloc(n + 1));
  if (!p) {
    return nullptr;
  }
  std::memcpy(p, s.data(), n);
  p[n] = '\0';
  return p;
}

bool valid_kind(hookwatch_kind_t kind) {
  return kind == HOOKWATCH_KIND_KEYBOARD || kind == HOOKWATCH_KIND_MOUSE;
}

hookwatch::HookKind to_kind(hookwatch_kind_t kind) {
  return kind == HOOKWATCH_KIND_MOUSE ? hookwatch::HookKind::Mouse
                                      : hookwatch::HookKind::Keyboard;
}

/**
 * @brief Wrap an optional Hook into a C handle.
 * @param hook Result of a builder call.
 * @param what Name used in the last-error message when `hook` is empty.
 */
hookwatch_hook_t wrap_hook(std::optional<hookwatch::Hook> hook,
                           const char *what) {
  if (!hook) {
    set_last_error(std::string(what) + " is already active");
    return nullptr;
  }
  HookWrapper *w = new (std::nothrow) HookWrapper{std::move(*hook)};
  if (!w) {
    set_last_error("Out of memory (hook)");
    return nullptr;
  }
  return reinterpret_cast<hookwatch_hook_t>(w);
}

hookwatch::log::Level to_level(hookwatch_log_level_t level) {
  if (level > HOOKWATCH_LOG_LEVEL_ERROR)
    level = HOOKWATCH_LOG_LEVEL_ERROR;
  return static_cast<hookwatch::log::Level>(level);
}

} // namespace

#ifdef __cplusplus
extern "C" {
#endif

/* ---------------- Hooks ---------------- */

HOOKWATCH_API hookwatch_hook_t hookwatch_keyboard_hook(void) {
  try {
    clear_last_error();
    return wrap_hook(hookwatch::keyboardHook(), "keyboard hook");
  } catch (const std::exception &e) {
    set_last_error(e.what());
    return nullptr;
  } catch (...) {
    set_last_error("Unknown exception in hookwatch_keyboard_hook");
    return nullptr;
  }
}

HOOKWATCH_API hookwatch_hook_t hookwatch_mouse_hook(void) {
  try {
    clear_last_error();
    return wrap_hook(hookwatch::mouseHook(), "mouse hook");
  } catch (const std::exception &e) {
    set_last_error(e.what());
    return nullptr;
  } catch (...) {
    set_last_error("Unknown exception in hookwatch_mouse_hook");
    return nullptr;
  }
}

HOOKWATCH_API hookwatch_hook_t hookwatch_willhook(void) {
  try {
    clear_last_error();
    return wrap_hook(hookwatch::willhook(), "keyboard or mouse hook");
  } catch (const std::exception &e) {
    set_last_error(e.what());
    return nullptr;
  } catch (...) {
    set_last_error("Unknown exception in hookwatch_willhook");
    return nullptr;
  }
}

HOOKWATCH_API hookwatch_hook_t hookwatch_active_hook(hookwatch_kind_t kind) {
  if (!valid_kind(kind)) {
    set_last_error("kind is not a valid hookwatch_kind_t");
    return nullptr;
  }
  try {
    clear_last_error();
    std::optional<hookwatch::Hook> hook = hookwatch::activeHook(to_kind(kind));
    if (!hook) {
      set_last_error(std::string("no active ") +
                     hookwatch::toString(to_kind(kind)) + " hook");
      return nullptr;
    }
    return wrap_hook(std::move(hook), "hook");
  } catch (const std::exception &e) {
    set_last_error(e.what());
    return nullptr;
  } catch (...) {
    set_last_error("Unknown exception in hookwatch_active_hook");
    return nullptr;
  }
}

HOOKWATCH_API hookwatch_hook_t hookwatch_hook_clone(hookwatch_hook_t hook) {
  if (!hook) {
    set_last_error("hook is NULL");
    return nullptr;
  }
  try {
    clear_last_error();
    HookWrapper *w = reinterpret_cast<HookWrapper *>(hook);
    HookWrapper *copy = new (std::nothrow) HookWrapper{w->hook};
    if (!copy) {
      set_last_error("Out of memory (hook)");
      return nullptr;
    }
    return reinterpret_cast<hookwatch_hook_t>(copy);
  } catch (const std::exception &e) {
    set_last_error(e.what());
    return nullptr;
  } catch (...) {
    set_last_error("Unknown exception in hookwatch_hook_clone");
    return nullptr;
  }
}

HOOKWATCH_API void hookwatch_hook_destroy(hookwatch_hook_t hook) {
  if (!hook) {
    return;
  }
  try {
    clear_last_error();
    delete reinterpret_cast<HookWrapper *>(hook);
  } catch (const std::exception &e) {
    set_last_error(e.what());
  } catch (...) {
    set_last_error("Unknown exception in hookwatch_hook_destroy");
  }
}

HOOKWATCH_API hookwatch_recv_status_t
hookwatch_hook_try_recv(hookwatch_hook_t hook, hookwatch_event_t *out_event) {
  if (!hook) {
    set_last_error("hook is NULL");
    return HOOKWATCH_RECV_ERROR;
  }
  if (!out_event) {
    set_last_error("out_event is NULL");
    return HOOKWATCH_RECV_ERROR;
  }
  try {
    HookWrapper *w = reinterpret_cast<HookWrapper *>(hook);
    hookwatch::InputEvent ev;
    hookwatch::RecvStatus status = w->hook.tryRecv(ev);
    if (status == hookwatch::RecvStatus::Received) {
      out_event->kind = static_cast<uint8_t>(ev.kind);
      out_event->action = static_cast<uint8_t>(ev.action);
      out_event->key_code = ev.keyCode;
      out_event->scan_code = ev.scanCode;
      out_event->button = static_cast<uint8_t>(ev.button);
      out_event->injected = ev.injected;
    }
    return static_cast<hookwatch_recv_status_t>(status);
  } catch (const std::exception &e) {
    set_last_error(e.what());
    return HOOKWATCH_RECV_ERROR;
  } catch (...) {
    set_last_error("Unknown exception in hookwatch_hook_try_recv");
    return HOOKWATCH_RECV_ERROR;
  }
}

HOOKWATCH_API bool hookwatch_hook_is_installed(hookwatch_hook_t hook,
                                               hookwatch_kind_t kind) {
  if (!hook) {
    set_last_error("hook is NULL");
    return false;
  }
  if (!valid_kind(kind)) {
    set_last_error("kind is not a valid hookwatch_kind_t");
    return false;
  }
  try {
    clear_last_error();
    HookWrapper *w = reinterpret_cast<HookWrapper *>(hook);
    return w->hook.isInstalled(to_kind(kind));
  } catch (const std::exception &e) {
    set_last_error(e.what());
    return false;
  } catch (...) {
    set_last_error("Unknown exception in hookwatch_hook_is_installed");
    return false;
  }
}

HOOKWATCH_API bool hookwatch_is_hook_active(hookwatch_kind_t kind) {
  if (!valid_kind(kind)) {
    set_last_error("kind is not a valid hookwatch_kind_t");
    return false;
  }
  try {
    clear_last_error();
    return hookwatch::isHookActive(to_kind(kind));
  } catch (const std::exception &e) {
    set_last_error(e.what());
    return false;
  } catch (...) {
    set_last_error("Unknown exception in hookwatch_is_hook_active");
    return false;
  }
}

/* ---------------- Utilities ---------------- */

HOOKWATCH_API const char *hookwatch_library_version(void) {
  return hookwatch::libraryVersion();
}

HOOKWATCH_API char *hookwatch_get_last_error(void) {
  std::lock_guard<std::mutex> lk(g_last_error_mutex);
  if (g_last_error.empty()) {
    return nullptr;
  }
  return duplicate_c_string(g_last_error);
}

HOOKWATCH_API void hookwatch_clear_last_error(void) { clear_last_error(); }

HOOKWATCH_API void hookwatch_free_string(char *s) {
  if (!s) {
    return;
  }
  std::free(s);
}

/* ---------------- Logging ---------------- */

HOOKWATCH_API void hookwatch_log_set_level(hookwatch_log_level_t level) {
  hookwatch::log::setLevel(to_level(level));
}

HOOKWATCH_API hookwatch_log_level_t hookwatch_log_get_level(void) {
  return static_cast<hookwatch_log_level_t>(hookwatch::log::getLevel());
}

HOOKWATCH_API bool hookwatch_log_is_enabled(hookwatch_log_level_t level) {
  return hookwatch::log::isEnabled(to_level(level));
}

HOOKWATCH_API void hookwatch_log_message(hookwatch_log_level_t level,
                                         const char *file, int line,
                                         const char *fmt, ...) {
  if (!fmt)
    return;
  const hookwatch::log::Level lvl = to_level(level);
  if (!hookwatch::log::isEnabled(lvl))
    return;
  va_list ap;
  va_start(ap, fmt);
  hookwatch::log::vlog(lvl, file ? file : "<c>", line, fmt, ap);
  va_end(ap);
}

#ifdef __cplusplus
} /* extern "C" */
#endif
