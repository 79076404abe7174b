/**
 * @file hook/hook_api.hpp
 * @brief OS hook primitives used by the hook runtime.
 *
 * Every call the runtime makes into the operating system goes through
 * `HookApi`: hook registration and removal, hook chaining, reading the
 * event-details structure and the per-thread message loop. The native
 * implementation wraps user32 on Windows; other platforms get a backend whose
 * registration always fails, which leaves every handle inert.
 */

#pragma once

#include <cstdint>

#include <hookwatch/event.hpp>

namespace hookwatch::detail {

/// Opaque OS hook registration token (an HHOOK on Windows). Null means unset.
using HookToken = void *;

/**
 * @struct EventDetails
 * @brief Fields read from the OS event-details structure
 * (KBDLLHOOKSTRUCT / MSLLHOOKSTRUCT).
 */
struct EventDetails {
  uint32_t keyCode{0};
  uint32_t scanCode{0};
  uint32_t mouseData{0};
  bool injected{false};
};

class HookApi {
public:
  virtual ~HookApi() = default;

  /// Register the low-level hook for `kind`. Returns null on failure.
  virtual HookToken install(HookKind kind) = 0;

  /// Remove a hook previously returned by `install`.
  virtual bool uninstall(HookToken token) = 0;

  /// Pass an event to the next hook in the OS chain and return its result.
  virtual std::intptr_t callNext(int code, std::uintptr_t message,
                                 std::intptr_t details) = 0;

  /// Decode the OS event-details pointer. A null pointer yields zeroes.
  virtual EventDetails readDetails(HookKind kind, std::intptr_t details) = 0;

  /**
   * Identifier of the calling thread, usable with `postQuit`. Also makes sure
   * the thread owns a message queue so a quit posted later is not lost.
   */
  virtual uint32_t currentThreadId() = 0;

  /// Pump messages on the calling thread until a quit message arrives.
  virtual void runMessageLoop() = 0;

  /// Ask the thread identified by `threadId` to leave its message loop.
  virtual bool postQuit(uint32_t threadId) = 0;
};

/// Native implementation for this platform (process lifetime).
HookApi &nativeHookApi();

/// Implementation used for new hooks and by the hook callbacks.
HookApi &hookApi();

/**
 * Replace the active implementation. Passing nullptr restores the native
 * one. Returns the previously installed override (nullptr if native).
 * Hooks already created keep the implementation they were created with.
 */
HookApi *setHookApi(HookApi *api) noexcept;

} // namespace hookwatch::detail
