/**
 * @file hook/hook_api.cpp
 * @brief Selection of the active HookApi implementation.
 */

#include "hook/hook_api.hpp"

#include <atomic>

namespace hookwatch::detail {

namespace {

std::atomic<HookApi *> g_override{nullptr};

} // namespace

HookApi &hookApi() {
  HookApi *api = g_override.load(std::memory_order_acquire);
  return api ? *api : nativeHookApi();
}

HookApi *setHookApi(HookApi *api) noexcept {
  return g_override.exchange(api, std::memory_order_acq_rel);
}

} // namespace hookwatch::detail
