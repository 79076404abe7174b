/**
 * @file hook/hook_api_windows.cpp
 * @brief user32 implementation of HookApi.
 *
 * Registers WH_KEYBOARD_LL / WH_MOUSE_LL hooks with one callback entry point
 * per hook kind. Low-level hooks are called in the context of the thread that
 * installed them, so that thread has to keep pumping messages for as long as
 * the hook exists; `runMessageLoop` does that until WM_QUIT.
 */

#include "hook/hook_api.hpp"

#ifdef _WIN32
#include <Windows.h>

#include <hookwatch/log.hpp>

#include "hook/hook_procedure.hpp"

namespace hookwatch::detail {

static_assert(kWmKeyDown == WM_KEYDOWN && kWmKeyUp == WM_KEYUP);
static_assert(kWmSysKeyDown == WM_SYSKEYDOWN && kWmSysKeyUp == WM_SYSKEYUP);
static_assert(kWmMouseMove == WM_MOUSEMOVE);
static_assert(kWmLButtonDown == WM_LBUTTONDOWN && kWmLButtonUp == WM_LBUTTONUP);
static_assert(kWmRButtonDown == WM_RBUTTONDOWN && kWmRButtonUp == WM_RBUTTONUP);
static_assert(kWmMButtonDown == WM_MBUTTONDOWN && kWmMButtonUp == WM_MBUTTONUP);
static_assert(kWmXButtonDown == WM_XBUTTONDOWN && kWmXButtonUp == WM_XBUTTONUP);
static_assert(kWmMouseWheel == WM_MOUSEWHEEL && kWmMouseHWheel == WM_MOUSEHWHEEL);
static_assert(kXButton1 == XBUTTON1 && kXButton2 == XBUTTON2);

namespace {

LRESULT CALLBACK lowLevelKeyboardProc(int nCode, WPARAM wParam,
                                      LPARAM lParam) {
  return static_cast<LRESULT>(
      hookProcedure(HookKind::Keyboard, nCode, static_cast<std::uintptr_t>(wParam),
                    static_cast<std::intptr_t>(lParam)));
}

LRESULT CALLBACK lowLevelMouseProc(int nCode, WPARAM wParam, LPARAM lParam) {
  return static_cast<LRESULT>(
      hookProcedure(HookKind::Mouse, nCode, static_cast<std::uintptr_t>(wParam),
                    static_cast<std::intptr_t>(lParam)));
}

class WindowsHookApi final : public HookApi {
public:
  HookToken install(HookKind kind) override {
    const int hookId = kind == HookKind::Keyboard ? WH_KEYBOARD_LL : WH_MOUSE_LL;
    HOOKPROC proc = kind == HookKind::Keyboard ? &lowLevelKeyboardProc
                                               : &lowLevelMouseProc;
    HHOOK hook = SetWindowsHookExW(hookId, proc, GetModuleHandleW(nullptr), 0);
    if (hook == nullptr) {
      HOOKWATCH_LOG_ERROR("SetWindowsHookExW(%s) failed: error=%lu",
                          toString(kind),
                          static_cast<unsigned long>(GetLastError()));
    }
    return static_cast<HookToken>(hook);
  }

  bool uninstall(HookToken token) override {
    if (!UnhookWindowsHookEx(static_cast<HHOOK>(token))) {
      HOOKWATCH_LOG_WARN("UnhookWindowsHookEx failed: error=%lu",
                         static_cast<unsigned long>(GetLastError()));
      return false;
    }
    return true;
  }

  std::intptr_t callNext(int code, std::uintptr_t message,
                         std::intptr_t details) override {
    // The hook handle argument is ignored for low-level hooks.
    return static_cast<std::intptr_t>(
        CallNextHookEx(nullptr, code, static_cast<WPARAM>(message),
                       static_cast<LPARAM>(details)));
  }

  EventDetails readDetails(HookKind kind, std::intptr_t details) override {
    EventDetails out;
    if (details == 0)
      return out;
    if (kind == HookKind::Keyboard) {
      const auto *kbd = reinterpret_cast<const KBDLLHOOKSTRUCT *>(details);
      out.keyCode = static_cast<uint32_t>(kbd->vkCode);
      out.scanCode = static_cast<uint32_t>(kbd->scanCode);
      out.injected = (kbd->flags & LLKHF_INJECTED) != 0;
    } else {
      const auto *ms = reinterpret_cast<const MSLLHOOKSTRUCT *>(details);
      out.mouseData = static_cast<uint32_t>(ms->mouseData);
      out.injected = (ms->flags & LLMHF_INJECTED) != 0;
    }
    return out;
  }

  uint32_t currentThreadId() override {
    // Force creation of this thread's message queue so a WM_QUIT posted
    // before the first GetMessageW call is kept.
    MSG msg;
    PeekMessageW(&msg, nullptr, WM_USER, WM_USER, PM_NOREMOVE);
    return static_cast<uint32_t>(GetCurrentThreadId());
  }

  void runMessageLoop() override {
    MSG msg;
    BOOL ret;
    while ((ret = GetMessageW(&msg, nullptr, 0, 0)) != 0) {
      if (ret == -1) {
        HOOKWATCH_LOG_ERROR("GetMessageW failed: error=%lu",
                            static_cast<unsigned long>(GetLastError()));
        break;
      }
      TranslateMessage(&msg);
      DispatchMessageW(&msg);
    }
  }

  bool postQuit(uint32_t threadId) override {
    if (threadId == 0)
      return false;
    if (!PostThreadMessageW(static_cast<DWORD>(threadId), WM_QUIT, 0, 0)) {
      HOOKWATCH_LOG_WARN("PostThreadMessageW(WM_QUIT) to thread %lu failed: "
                         "error=%lu",
                         static_cast<unsigned long>(threadId),
                         static_cast<unsigned long>(GetLastError()));
      return false;
    }
    return true;
  }
};

} // namespace

HookApi &nativeHookApi() {
  static WindowsHookApi *api = new WindowsHookApi;
  return *api;
}

} // namespace hookwatch::detail

#endif // _WIN32
