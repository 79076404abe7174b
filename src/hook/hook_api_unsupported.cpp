/**
 * @file hook/hook_api_unsupported.cpp
 * @brief HookApi for platforms without low-level input hooks.
 *
 * Registration always fails, so every hook created on these platforms is
 * inert: `tryRecv` reports Empty while a handle is alive and Disconnected
 * once the last one is gone.
 */

#include "hook/hook_api.hpp"

#ifndef _WIN32

#include <hookwatch/log.hpp>

namespace hookwatch::detail {

namespace {

class UnsupportedHookApi final : public HookApi {
public:
  HookToken install(HookKind kind) override {
    HOOKWATCH_LOG_WARN("low-level %s hooks are only available on Windows",
                       toString(kind));
    return nullptr;
  }

  bool uninstall(HookToken) override { return false; }

  std::intptr_t callNext(int, std::uintptr_t, std::intptr_t) override {
    return 0;
  }

  EventDetails readDetails(HookKind, std::intptr_t) override { return {}; }

  uint32_t currentThreadId() override { return 0; }

  void runMessageLoop() override {}

  bool postQuit(uint32_t) override { return false; }
};

} // namespace

HookApi &nativeHookApi() {
  static UnsupportedHookApi *api = new UnsupportedHookApi;
  return *api;
}

} // namespace hookwatch::detail

#endif // !_WIN32
