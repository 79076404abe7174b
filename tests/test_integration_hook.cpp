/**
 * @file test_integration_hook.cpp
 * @brief Integration tests for hookwatch against the real OS hooks.
 *
 * These tests register genuine low-level hooks and synthesize input with
 * SendInput, so they move real keys and buttons on the desktop. They only
 * run when HOOKWATCH_RUN_INTEGRATION_TESTS=1 is set and only do real work on
 * Windows.
 */

#include <catch2/catch_all.hpp>
#include <hookwatch/core.hpp>
#include <hookwatch/hook.hpp>
#include <hookwatch/log.hpp>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <thread>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

using namespace hookwatch;
using namespace std::chrono_literals;

static bool integrationEnabled() {
  const char *v = std::getenv("HOOKWATCH_RUN_INTEGRATION_TESTS");
  return v && std::strcmp(v, "1") == 0;
}

// Poll until `count` events arrived or `timeout` elapsed.
static std::vector<InputEvent> collect(const Hook &hook, std::size_t count,
                                       std::chrono::milliseconds timeout) {
  std::vector<InputEvent> events;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (events.size() < count && std::chrono::steady_clock::now() < deadline) {
    InputEvent ev;
    if (hook.tryRecv(ev) == RecvStatus::Received)
      events.push_back(ev);
    else
      std::this_thread::sleep_for(5ms);
  }
  return events;
}

#ifdef _WIN32

static void tapKey(WORD vk) {
  INPUT in[2] = {};
  in[0].type = INPUT_KEYBOARD;
  in[0].ki.wVk = vk;
  in[1] = in[0];
  in[1].ki.dwFlags = KEYEVENTF_KEYUP;
  SendInput(2, in, sizeof(INPUT));
}

static void clickRight() {
  INPUT in[2] = {};
  in[0].type = INPUT_MOUSE;
  in[0].mi.dwFlags = MOUSEEVENTF_RIGHTDOWN;
  in[1].type = INPUT_MOUSE;
  in[1].mi.dwFlags = MOUSEEVENTF_RIGHTUP;
  SendInput(2, in, sizeof(INPUT));
}

TEST_CASE("Hook Integration Suite", "[integration]") {
  if (!integrationEnabled()) {
    INFO("Integration tests are disabled; set "
         "HOOKWATCH_RUN_INTEGRATION_TESTS=1 to run them");
    return;
  }
  HOOKWATCH_LOG_INFO("Hook Integration Suite: starting (version %s)",
                     libraryVersion());

  auto hook = willhook();
  REQUIRE(hook.has_value());
  REQUIRE(hook->isInstalled(HookKind::Keyboard));
  REQUIRE(hook->isInstalled(HookKind::Mouse));

  SECTION("A synthesized key tap is observed as down then up") {
    // VK_F24 is rarely bound to anything.
    tapKey(VK_F24);
    auto events = collect(*hook, 2, 2s);
    REQUIRE(events.size() == 2);
    CHECK(events[0].kind == HookKind::Keyboard);
    CHECK(events[0].action == KeyAction::Down);
    CHECK(events[0].keyCode == VK_F24);
    CHECK(events[0].injected);
    CHECK(events[1].action == KeyAction::Up);
  }

  SECTION("A synthesized right click is observed") {
    clickRight();
    auto events = collect(*hook, 2, 2s);
    REQUIRE(events.size() == 2);
    CHECK(events[0].kind == HookKind::Mouse);
    CHECK(events[0].button == MouseButton::Right);
    CHECK(events[0].action == KeyAction::Down);
    CHECK(events[1].action == KeyAction::Up);
  }

  SECTION("A second hook of a live kind is refused") {
    CHECK_FALSE(keyboardHook().has_value());
    CHECK_FALSE(mouseHook().has_value());
    auto shared = activeHook(HookKind::Keyboard);
    CHECK(shared.has_value());
  }

  SECTION("Dropping the hook unregisters it") {
    hook.reset();
    CHECK_FALSE(isHookActive(HookKind::Keyboard));
    CHECK_FALSE(isHookActive(HookKind::Mouse));
    auto again = keyboardHook();
    REQUIRE(again.has_value());
    CHECK(again->isInstalled(HookKind::Keyboard));
  }
}

#else

TEST_CASE("Hook Integration Suite", "[integration]") {
  if (!integrationEnabled()) {
    INFO("Integration tests are disabled; set "
         "HOOKWATCH_RUN_INTEGRATION_TESTS=1 to run them");
    return;
  }
  INFO("low-level hooks are only available on Windows");
  auto hook = keyboardHook();
  REQUIRE(hook.has_value());
  CHECK_FALSE(hook->isInstalled(HookKind::Keyboard));
  CHECK(collect(*hook, 1, 50ms).empty());
}

#endif
