// test_hook_registry.cpp
// Unit tests for HookRegistry: one live hook per kind, concurrent callers
// sharing a single registration, and re-registration after the last owner
// goes away.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "fake_hook_api.hpp"
#include "hook/hook_registry.hpp"

using hookwatch::HookKind;
using hookwatch::detail::HookContext;
using hookwatch::detail::HookRegistry;
using hookwatch::test::FakeHookApi;

TEST(HookRegistryTest, SecondAcquireOfALiveKindIsRefused) {
  FakeHookApi api;
  HookRegistry registry;

  auto first = registry.acquire(HookKind::Keyboard, api);
  ASSERT_NE(first, nullptr);
  EXPECT_TRUE(registry.isPresent(HookKind::Keyboard));
  EXPECT_EQ(registry.acquire(HookKind::Keyboard, api), nullptr);
  EXPECT_EQ(api.installs.load(), 1);
}

TEST(HookRegistryTest, CurrentSharesTheLiveContext) {
  FakeHookApi api;
  HookRegistry registry;
  EXPECT_EQ(registry.current(HookKind::Mouse), nullptr);

  auto owner = registry.acquire(HookKind::Mouse, api);
  auto shared = registry.current(HookKind::Mouse);
  EXPECT_EQ(shared, owner);
  EXPECT_EQ(api.installs.load(), 1);
}

TEST(HookRegistryTest, ConcurrentAcquireRegistersOnce) {
  constexpr int kThreads = 8;
  FakeHookApi api;
  api.installDelayMs = 20;
  HookRegistry registry;

  std::vector<std::shared_ptr<HookContext>> results(kThreads);
  std::atomic<bool> go{false};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load())
        std::this_thread::yield();
      results[i] = registry.acquire(HookKind::Keyboard, api);
    });
  }
  go = true;
  for (auto &t : threads)
    t.join();

  int winners = 0;
  for (const auto &r : results) {
    if (r) {
      ++winners;
      // Callers never see a context still in the middle of registering.
      EXPECT_TRUE(r->isInstalled());
    }
  }
  EXPECT_EQ(winners, 1);
  EXPECT_EQ(api.installs.load(), 1);
}

TEST(HookRegistryTest, ConcurrentAcquireOrCreateSharesOneContext) {
  constexpr int kThreads = 8;
  FakeHookApi api;
  api.installDelayMs = 20;
  HookRegistry registry;
  std::atomic<int> factoryCalls{0};
  auto factory = [&] {
    ++factoryCalls;
    return HookContext::launch(HookKind::Mouse, api);
  };

  std::vector<std::shared_ptr<HookContext>> results(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i)
    threads.emplace_back(
        [&, i] { results[i] = registry.acquireOrCreate(HookKind::Mouse, factory); });
  for (auto &t : threads)
    t.join();

  EXPECT_EQ(factoryCalls.load(), 1);
  EXPECT_EQ(api.installs.load(), 1);
  for (const auto &r : results) {
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r, results[0]);
    EXPECT_TRUE(r->isInstalled());
  }
}

TEST(HookRegistryTest, DroppingTheLastOwnerAllowsAFreshRegistration) {
  FakeHookApi api;
  HookRegistry registry;

  auto ctx = registry.acquire(HookKind::Keyboard, api);
  ASSERT_NE(ctx, nullptr);
  ctx.reset();
  EXPECT_FALSE(registry.isPresent(HookKind::Keyboard));
  EXPECT_EQ(api.uninstalls.load(), 1);

  ctx = registry.acquire(HookKind::Keyboard, api);
  ASSERT_NE(ctx, nullptr);
  EXPECT_EQ(api.installs.load(), 2);
}

TEST(HookRegistryTest, KindsAreIndependent) {
  FakeHookApi api;
  HookRegistry registry;

  auto keyboard = registry.acquire(HookKind::Keyboard, api);
  auto mouse = registry.acquire(HookKind::Mouse, api);
  ASSERT_NE(keyboard, nullptr);
  ASSERT_NE(mouse, nullptr);
  EXPECT_NE(keyboard, mouse);

  keyboard.reset();
  EXPECT_FALSE(registry.isPresent(HookKind::Keyboard));
  EXPECT_TRUE(registry.isPresent(HookKind::Mouse));
}

TEST(HookRegistryTest, HookOutlivesAllButTheLastHandle) {
  FakeHookApi api;
  HookRegistry registry;

  auto a = registry.acquire(HookKind::Keyboard, api);
  auto b = registry.current(HookKind::Keyboard);
  ASSERT_NE(a, nullptr);
  ASSERT_EQ(a, b);

  a.reset();
  EXPECT_TRUE(registry.isPresent(HookKind::Keyboard));
  EXPECT_EQ(api.uninstalls.load(), 0);

  b.reset();
  EXPECT_FALSE(registry.isPresent(HookKind::Keyboard));
  EXPECT_EQ(api.uninstalls.load(), 1);
  EXPECT_EQ(api.installs.load(), 1);
}

TEST(HookRegistryTest, ReplacementWaitsForThePreviousHookToBeRemoved) {
  FakeHookApi api;
  api.uninstallDelayMs = 50;
  HookRegistry registry;

  auto first = registry.acquire(HookKind::Keyboard, api);
  ASSERT_NE(first, nullptr);

  // Drop the last owner elsewhere; its unregister call is slow.
  std::thread dropper([&first] { first.reset(); });
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (registry.isPresent(HookKind::Keyboard) &&
         std::chrono::steady_clock::now() < deadline)
    std::this_thread::yield();
  EXPECT_FALSE(registry.isPresent(HookKind::Keyboard));

  auto second = registry.acquire(HookKind::Keyboard, api);
  dropper.join();

  ASSERT_NE(second, nullptr);
  EXPECT_TRUE(second->isInstalled());
  EXPECT_EQ(api.installs.load(), 2);
  EXPECT_EQ(api.uninstalls.load(), 1);
  EXPECT_EQ(api.peakLiveRegistrations.load(), 1);
}
