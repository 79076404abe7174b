/**
 * @file hook/raw_hook.cpp
 * @brief RawHook implementation.
 */

#include "hook/raw_hook.hpp"

#include <system_error>

#include <hookwatch/log.hpp>

namespace hookwatch::detail {

void RawHook::set(HookToken token) {
  std::lock_guard<std::mutex> lk(m_mutex);
  m_token = token;
}

HookToken RawHook::get() const {
  std::lock_guard<std::mutex> lk(m_mutex);
  return m_token;
}

bool RawHook::isSet() const { return get() != nullptr; }

bool RawHook::isRegistered() const {
  std::lock_guard<std::mutex> lk(m_mutex);
  return m_token != nullptr || m_releasing;
}

void RawHook::waitUntilReleased() const {
  std::unique_lock<std::mutex> lk(m_mutex);
  m_releasedCv.wait(lk, [this] { return m_token == nullptr && !m_releasing; });
}

bool RawHook::release(HookApi &api) noexcept {
  HookToken token = nullptr;
  try {
    std::lock_guard<std::mutex> lk(m_mutex);
    token = m_token;
    if (token == nullptr)
      return false;
    m_token = nullptr;
    m_releasing = true;
  } catch (const std::system_error &) {
    return false;
  }

  if (!api.uninstall(token)) {
    HOOKWATCH_LOG_WARN("RawHook: unregistering hook %p failed", token);
  } else {
    HOOKWATCH_LOG_DEBUG("RawHook: unregistered hook %p", token);
  }

  {
    std::unique_lock<std::mutex> lk(m_mutex, std::defer_lock);
    try {
      lk.lock();
    } catch (const std::system_error &) {
      // Clear the flag unlocked rather than strand waiters.
    }
    m_releasing = false;
  }
  m_releasedCv.notify_all();
  return true;
}

} // namespace hookwatch::detail
