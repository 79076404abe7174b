/**
 * @file hook/event_channel.cpp
 * @brief EventChannel implementation.
 */

#include "hook/event_channel.hpp"

#include <algorithm>
#include <iterator>
#include <new>
#include <system_error>

#include <hookwatch/log.hpp>

namespace hookwatch::detail {

EventChannel &EventChannel::instance() {
  // Never destroyed: hooks held in static storage close their senders during
  // static teardown.
  static EventChannel *channel = new EventChannel;
  return *channel;
}

void EventChannel::openSender(HookKind kind) {
  std::lock_guard<std::mutex> lk(m_mutex);
  ++m_senders[hookKindIndex(kind)];
}

void EventChannel::closeSender(HookKind kind) noexcept {
  std::size_t dropped = 0;
  try {
    std::lock_guard<std::mutex> lk(m_mutex);
    std::size_t &count = m_senders[hookKindIndex(kind)];
    if (count == 0)
      return;
    if (--count > 0)
      return;
    auto it = std::remove_if(
        m_queue.begin(), m_queue.end(),
        [kind](const InputEvent &ev) { return ev.kind == kind; });
    dropped = static_cast<std::size_t>(std::distance(it, m_queue.end()));
    m_queue.erase(it, m_queue.end());
  } catch (const std::system_error &e) {
    HOOKWATCH_LOG_WARN("EventChannel: closing %s sender failed: %s",
                       toString(kind), e.what());
    return;
  }
  if (dropped > 0) {
    HOOKWATCH_LOG_DEBUG("EventChannel: discarded %zu pending %s event(s)",
                        dropped, toString(kind));
  }
}

bool EventChannel::send(const InputEvent &event) noexcept {
  try {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_senders[hookKindIndex(event.kind)] == 0)
      return false;
    m_queue.push_back(event);
    return true;
  } catch (const std::system_error &) {
    return false;
  } catch (const std::bad_alloc &) {
    return false;
  }
}

RecvStatus EventChannel::tryRecv(InputEvent &out) noexcept {
  std::unique_lock<std::mutex> lk(m_mutex, std::defer_lock);
  try {
    lk.lock();
  } catch (const std::system_error &) {
    return RecvStatus::Disconnected;
  }
  if (!m_queue.empty()) {
    out = m_queue.front();
    m_queue.pop_front();
    return RecvStatus::Received;
  }
  for (std::size_t senders : m_senders) {
    if (senders > 0)
      return RecvStatus::Empty;
  }
  return RecvStatus::Disconnected;
}

std::size_t EventChannel::pending() const noexcept {
  try {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_queue.size();
  } catch (const std::system_error &) {
    return 0;
  }
}

bool EventChannel::isOpen(HookKind kind) const noexcept {
  try {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_senders[hookKindIndex(kind)] > 0;
  } catch (const std::system_error &) {
    return false;
  }
}

} // namespace hookwatch::detail
