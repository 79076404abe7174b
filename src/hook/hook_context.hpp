/**
 * @file hook/hook_context.hpp
 * @brief Background thread that owns one low-level hook registration.
 */

#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include <hookwatch/event.hpp>

#include "hook/hook_api.hpp"
#include "hook/raw_hook.hpp"

namespace hookwatch::detail {

/**
 * @class HookContext
 * @brief Pairs a RawHook with the worker thread that registered it.
 *
 * The worker registers the hook, publishes the token, signals readiness and
 * then parks in the OS message loop, which is what keeps a low-level hook
 * callable. Destroying the context unregisters the hook, posts a quit
 * message to the worker and joins it.
 *
 * Instances are shared through std::shared_ptr; the last owner going away
 * tears the hook down.
 */
class HookContext {
public:
  /**
   * @brief Start the worker for `kind` without waiting for registration.
   *
   * Never throws on OS or thread failures: a context whose worker could not
   * be started or whose registration failed is simply inert.
   */
  static std::shared_ptr<HookContext> launch(HookKind kind, HookApi &api);

  /**
   * @brief Start the worker and block until registration has been attempted.
   */
  static std::shared_ptr<HookContext> create(HookKind kind, HookApi &api);

  HookContext(HookKind kind, HookApi &api);
  ~HookContext();

  HookContext(const HookContext &) = delete;
  HookContext &operator=(const HookContext &) = delete;

  /// Block until the worker has attempted registration.
  void waitUntilReady() const;

  HookKind kind() const noexcept { return m_kind; }

  /// True when the OS registration succeeded and has not been released.
  bool isInstalled() const;

  std::shared_ptr<RawHook> rawHook() const noexcept { return m_raw; }

private:
  struct Startup {
    std::mutex mutex;
    std::condition_variable cv;
    bool ready{false};
    bool installed{false};
    uint32_t threadId{0};
  };

  void start();
  static void threadMain(HookKind kind, HookApi *api,
                         std::shared_ptr<RawHook> raw,
                         std::shared_ptr<Startup> startup);
  static void signalReady(Startup &startup, uint32_t threadId, bool installed);
  void retireWorker() noexcept;

  HookKind m_kind;
  HookApi &m_api;
  std::shared_ptr<RawHook> m_raw;
  std::shared_ptr<Startup> m_startup;
  std::thread m_worker;
};

} // namespace hookwatch::detail
