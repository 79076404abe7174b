/*
 * Simple example for hookwatch showing basic usage.
 *
 * Build with:
 *   cmake -DHOOKWATCH_BUILD_EXAMPLES=ON ..
 *   cmake --build .
 *
 * Run:
 *   ./hookwatch-example --help
 *
 * Note: global hooks are only delivered on Windows. Elsewhere the hooks are
 * created but stay inert.
 */

#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

#include <hookwatch/core.hpp>
#include <hookwatch/hook.hpp>
#include <hookwatch/log.hpp>

static void printEvent(const hookwatch::InputEvent &ev) {
  std::cout << (ev.action == hookwatch::KeyAction::Down ? "[down] " : "[up]   ");
  if (ev.kind == hookwatch::HookKind::Keyboard) {
    std::cout << "key vk=0x" << std::hex << ev.keyCode << " scan=0x"
              << ev.scanCode << std::dec;
  } else {
    std::cout << "mouse " << hookwatch::toString(ev.button);
  }
  if (ev.injected)
    std::cout << " (injected)";
  std::cout << "\n";
}

static void printUsage() {
  std::cout
      << "Usage:\n"
      << "  --listen N        : print keyboard and mouse events for N seconds\n"
      << "  --keyboard N      : print keyboard events only for N seconds\n"
      << "  --help            : show this text\n";
}

int main(int argc, char **argv) {
  using namespace std::chrono_literals;

  std::cout << "hookwatch example " << hookwatch::libraryVersion() << "\n";
  HOOKWATCH_LOG_INFO("example: startup argc=%d", argc);

  if (argc <= 1) {
    printUsage();
    return 0;
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help") {
      printUsage();

    } else if (arg == "--listen" || arg == "--keyboard") {
      if (i + 1 >= argc) {
        std::cerr << arg << " requires a duration in seconds\n";
        return 1;
      }
      int seconds = 0;
      try {
        seconds = std::stoi(argv[++i]);
      } catch (const std::exception &) {
        std::cerr << "invalid duration: " << argv[i] << "\n";
        return 1;
      }

      const bool keyboardOnly = arg == "--keyboard";
      auto hook = keyboardOnly ? hookwatch::keyboardHook() : hookwatch::willhook();
      if (!hook) {
        std::cerr << "A hook of the requested kind is already active\n";
        return 1;
      }
      if (!hook->isInstalled(hookwatch::HookKind::Keyboard)) {
        std::cerr << "Hooks are inert on this platform; no events will arrive\n";
      }

      HOOKWATCH_LOG_INFO("example: listening for %d seconds", seconds);
      std::cout << "Listening for " << seconds << " seconds...\n";
      const auto deadline =
          std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
      hookwatch::InputEvent ev;
      while (std::chrono::steady_clock::now() < deadline) {
        hookwatch::RecvStatus status = hook->tryRecv(ev);
        if (status == hookwatch::RecvStatus::Received) {
          printEvent(ev);
        } else if (status == hookwatch::RecvStatus::Disconnected) {
          break;
        } else {
          std::this_thread::sleep_for(10ms);
        }
      }
      HOOKWATCH_LOG_INFO("example: listening finished");

    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
    }
  }

  return 0;
}
