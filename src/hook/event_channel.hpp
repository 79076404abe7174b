/**
 * @file hook/event_channel.hpp
 * @brief Process-wide event queue between hook callbacks and consumers.
 *
 * One sender side per hook kind (opened while a hook of that kind exists),
 * one shared receiver. The queue is unbounded so hook callbacks never wait
 * for a consumer; events keep the order in which callbacks sent them.
 */

#pragma once

#include <array>
#include <cstddef>
#include <deque>
#include <mutex>

#include <hookwatch/event.hpp>

namespace hookwatch::detail {

class EventChannel {
public:
  /// Process-wide channel, created on first use and never destroyed.
  static EventChannel &instance();

  EventChannel() = default;
  EventChannel(const EventChannel &) = delete;
  EventChannel &operator=(const EventChannel &) = delete;

  /// Open one sender reference for `kind`. Paired with `closeSender`.
  void openSender(HookKind kind);

  /**
   * Release one sender reference for `kind`. When the last one is released,
   * events of that kind still waiting in the queue are discarded.
   */
  void closeSender(HookKind kind) noexcept;

  /**
   * Queue `event` for the receiver. Never blocks on a consumer. Returns
   * false (and drops the event) when no sender is open for the event's kind
   * or the queue cannot be locked or grown.
   */
  bool send(const InputEvent &event) noexcept;

  /// Non-blocking receive.
  RecvStatus tryRecv(InputEvent &out) noexcept;

  std::size_t pending() const noexcept;
  bool isOpen(HookKind kind) const noexcept;

private:
  mutable std::mutex m_mutex;
  std::deque<InputEvent> m_queue;
  std::array<std::size_t, kHookKindCount> m_senders{};
};

} // namespace hookwatch::detail
