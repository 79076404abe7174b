/**
 * @file hook/hook_registry.cpp
 * @brief HookRegistry implementation.
 */

#include "hook/hook_registry.hpp"

#include <system_error>

#include <hookwatch/log.hpp>

namespace hookwatch::detail {

HookRegistry &HookRegistry::instance() {
  // Never destroyed, like the event channel.
  static HookRegistry *registry = new HookRegistry;
  return *registry;
}

bool HookRegistry::isPresent(HookKind kind) const noexcept {
  // expired() rather than lock(): a temporary owner created here could end
  // up running the context's teardown on the caller's thread, which may be
  // the hook worker itself.
  try {
    const Slot &s = slot(kind);
    std::lock_guard<std::mutex> lk(s.mutex);
    return !s.context.expired();
  } catch (const std::system_error &) {
    return false;
  }
}

std::shared_ptr<HookContext> HookRegistry::current(HookKind kind) const {
  std::shared_ptr<HookContext> ctx;
  {
    const Slot &s = slot(kind);
    std::lock_guard<std::mutex> lk(s.mutex);
    ctx = s.context.lock();
  }
  if (ctx)
    ctx->waitUntilReady();
  return ctx;
}

void HookRegistry::awaitRetirement(Slot &s, std::unique_lock<std::mutex> &lk) {
  for (;;) {
    if (!s.context.expired())
      return;
    std::shared_ptr<RawHook> previous = s.raw.lock();
    if (!previous || !previous->isRegistered())
      return;
    // Unlocked so callbacks of the retiring hook can still check the slot.
    lk.unlock();
    previous->waitUntilReleased();
    lk.lock();
  }
}

void HookRegistry::store(Slot &s, const std::shared_ptr<HookContext> &ctx) {
  s.context = ctx;
  s.raw = ctx->rawHook();
}

std::shared_ptr<HookContext>
HookRegistry::acquireOrCreate(HookKind kind, const Factory &factory) {
  std::shared_ptr<HookContext> ctx;
  {
    Slot &s = slot(kind);
    std::unique_lock<std::mutex> lk(s.mutex);
    awaitRetirement(s, lk);
    ctx = s.context.lock();
    if (!ctx) {
      ctx = factory();
      if (ctx) {
        store(s, ctx);
        HOOKWATCH_LOG_DEBUG("HookRegistry: started a new %s hook",
                            toString(kind));
      }
    }
  }
  if (ctx)
    ctx->waitUntilReady();
  return ctx;
}

std::shared_ptr<HookContext> HookRegistry::acquire(HookKind kind,
                                                   HookApi &api) {
  std::shared_ptr<HookContext> ctx;
  {
    Slot &s = slot(kind);
    std::unique_lock<std::mutex> lk(s.mutex);
    awaitRetirement(s, lk);
    if (!s.context.expired()) {
      HOOKWATCH_LOG_DEBUG("HookRegistry: %s hook already active",
                          toString(kind));
      return nullptr;
    }
    ctx = HookContext::launch(kind, api);
    store(s, ctx);
  }
  ctx->waitUntilReady();
  return ctx;
}

} // namespace hookwatch::detail
