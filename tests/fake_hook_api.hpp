// fake_hook_api.hpp
//
// Counting HookApi used by the unit tests. It hands out distinct fake
// tokens, records every registration / unregistration / chain call, and
// emulates the per-thread message loop with a condition variable so hook
// workers park and wake exactly like they do on Windows.
//
// Declare the fake before any hook handle in a test so handles (and their
// worker threads) are gone before the fake is destroyed.
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "hook/hook_api.hpp"

namespace hookwatch::test {

class FakeHookApi : public detail::HookApi {
public:
  // Behaviour knobs, set before the hooks are created.
  std::atomic<bool> failInstall{false};
  std::atomic<bool> failPostQuit{false};
  std::atomic<int> installDelayMs{0};
  std::atomic<int> uninstallDelayMs{0};
  std::atomic<std::intptr_t> chainResult{0};

  // Counters.
  std::atomic<int> installs{0};
  std::atomic<int> uninstalls{0};
  std::atomic<int> chainCalls{0};
  std::atomic<int> detailReads{0};
  std::atomic<int> quitsPosted{0};
  std::atomic<int> loopsEntered{0};
  std::atomic<int> loopsExited{0};
  // Registrations not yet removed, and the highest that number ever was.
  std::atomic<int> liveRegistrations{0};
  std::atomic<int> peakLiveRegistrations{0};

  detail::HookToken install(HookKind) override {
    if (installDelayMs.load() > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(installDelayMs.load()));
    if (failInstall.load())
      return nullptr;
    const int n = ++installs;
    const int live = ++liveRegistrations;
    int peak = peakLiveRegistrations.load();
    while (live > peak && !peakLiveRegistrations.compare_exchange_weak(peak, live)) {
    }
    return reinterpret_cast<detail::HookToken>(static_cast<std::uintptr_t>(0x1000 + n));
  }

  bool uninstall(detail::HookToken token) override {
    if (uninstallDelayMs.load() > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(uninstallDelayMs.load()));
    --liveRegistrations;
    ++uninstalls;
    std::lock_guard<std::mutex> lk(m_mutex);
    m_uninstalled.push_back(token);
    return true;
  }

  std::intptr_t callNext(int, std::uintptr_t, std::intptr_t) override {
    ++chainCalls;
    return chainResult.load();
  }

  // Tests pass the address of an EventDetails as the details pointer.
  detail::EventDetails readDetails(HookKind, std::intptr_t details) override {
    ++detailReads;
    if (details == 0)
      return {};
    return *reinterpret_cast<const detail::EventDetails *>(details);
  }

  uint32_t currentThreadId() override {
    t_threadId = m_nextThreadId.fetch_add(1);
    return t_threadId;
  }

  void runMessageLoop() override {
    ++loopsEntered;
    const uint32_t self = t_threadId;
    {
      std::unique_lock<std::mutex> lk(m_mutex);
      m_cv.wait(lk, [&] { return m_releaseAll || m_quit.count(self) > 0; });
    }
    ++loopsExited;
  }

  bool postQuit(uint32_t threadId) override {
    if (failPostQuit.load())
      return false;
    ++quitsPosted;
    {
      std::lock_guard<std::mutex> lk(m_mutex);
      m_quit.insert(threadId);
    }
    m_cv.notify_all();
    return true;
  }

  // Wake every parked loop, including ones nobody posted a quit to.
  void releaseAll() {
    {
      std::lock_guard<std::mutex> lk(m_mutex);
      m_releaseAll = true;
    }
    m_cv.notify_all();
  }

  // Spin until `counter` reaches `expected` or the timeout elapses.
  static bool waitFor(const std::atomic<int> &counter, int expected,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (counter.load() < expected) {
      if (std::chrono::steady_clock::now() > deadline)
        return false;
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
  }

  std::vector<detail::HookToken> uninstalledTokens() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_uninstalled;
  }

private:
  static inline thread_local uint32_t t_threadId = 0;

  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::set<uint32_t> m_quit;
  bool m_releaseAll{false};
  std::vector<detail::HookToken> m_uninstalled;
  std::atomic<uint32_t> m_nextThreadId{1};
};

// Installs a fake as the process-wide HookApi for the current scope.
class ScopedHookApi {
public:
  explicit ScopedHookApi(detail::HookApi &api)
      : m_previous(detail::setHookApi(&api)) {}
  ~ScopedHookApi() { detail::setHookApi(m_previous); }

  ScopedHookApi(const ScopedHookApi &) = delete;
  ScopedHookApi &operator=(const ScopedHookApi &) = delete;

private:
  detail::HookApi *m_previous;
};

} // namespace hookwatch::test
