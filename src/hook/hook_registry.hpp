/**
 * @file hook/hook_registry.hpp
 * @brief Process-wide table of the live hook per HookKind.
 */

#pragma once

#include <array>
#include <functional>
#include <memory>
#include <mutex>

#include <hookwatch/event.hpp>

#include "hook/hook_api.hpp"
#include "hook/hook_context.hpp"

namespace hookwatch::detail {

/**
 * @class HookRegistry
 * @brief One slot per HookKind holding a weak reference to the live
 * HookContext.
 *
 * The registry never keeps a hook alive: once every owner drops its
 * shared_ptr the slot reads as empty, and the next acquisition registers a
 * fresh hook. Each slot has its own mutex, held only while deciding whether
 * to reuse or create a context, never while the OS registration runs.
 *
 * A slot also remembers the RawHook of its last context. The weak reference
 * expires before that context's destructor unregisters the hook, so a new
 * context is only started once the previous registration is gone.
 */
class HookRegistry {
public:
  using Factory = std::function<std::shared_ptr<HookContext>()>;

  /// Process-wide registry, created on first use and never destroyed.
  static HookRegistry &instance();

  HookRegistry() = default;
  HookRegistry(const HookRegistry &) = delete;
  HookRegistry &operator=(const HookRegistry &) = delete;

  /// Whether a hook of `kind` currently has at least one owner.
  bool isPresent(HookKind kind) const noexcept;

  /// Share the live hook of `kind`, or nullptr when there is none.
  std::shared_ptr<HookContext> current(HookKind kind) const;

  /**
   * @brief Return the live hook of `kind`, creating it with `factory` when
   * there is none.
   *
   * `factory` runs under the slot lock and must only start the context; the
   * wait for registration happens after the lock is released. Either way the
   * returned context has finished its registration attempt.
   */
  std::shared_ptr<HookContext> acquireOrCreate(HookKind kind,
                                               const Factory &factory);

  /**
   * @brief Register a new hook of `kind` through `api`.
   * @return nullptr when a hook of that kind is already live; use `current`
   * to share it instead.
   */
  std::shared_ptr<HookContext> acquire(HookKind kind, HookApi &api);

private:
  struct Slot {
    mutable std::mutex mutex;
    std::weak_ptr<HookContext> context;
    std::weak_ptr<RawHook> raw;
  };

  static void awaitRetirement(Slot &s, std::unique_lock<std::mutex> &lk);
  static void store(Slot &s, const std::shared_ptr<HookContext> &ctx);

  Slot &slot(HookKind kind) { return m_slots[hookKindIndex(kind)]; }
  const Slot &slot(HookKind kind) const { return m_slots[hookKindIndex(kind)]; }

  std::array<Slot, kHookKindCount> m_slots;
};

} // namespace hookwatch::detail
