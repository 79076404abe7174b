/**
 * @file hook/raw_hook.hpp
 * @brief Owner of a single OS hook registration token.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>

#include "hook/hook_api.hpp"

namespace hookwatch::detail {

/**
 * @class RawHook
 * @brief Holds the token returned by `HookApi::install`.
 *
 * The token is unset when the RawHook is created and is filled in once by the
 * hook worker after registration succeeds. `release` unregisters it at most
 * once. Access is serialized by an internal mutex that is never held across
 * the OS call.
 */
class RawHook {
public:
  RawHook() = default;
  RawHook(const RawHook &) = delete;
  RawHook &operator=(const RawHook &) = delete;

  void set(HookToken token);
  HookToken get() const;
  bool isSet() const;

  /// True while a token is held or its unregister call has not returned.
  bool isRegistered() const;

  /// Block until `isRegistered()` is false.
  void waitUntilReleased() const;

  /**
   * @brief Take the token and unregister it through `api`.
   *
   * Does nothing when the token is unset or was already released, and treats
   * a lock failure the same way.
   * @return true if an unregister call was issued.
   */
  bool release(HookApi &api) noexcept;

private:
  mutable std::mutex m_mutex;
  mutable std::condition_variable m_releasedCv;
  HookToken m_token{nullptr};
  std::atomic<bool> m_releasing{false};
};

} // namespace hookwatch::detail
