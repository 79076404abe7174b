#pragma once
/**
 * @file core.hpp
 * @brief Library version and export macros for hookwatch.
 *
 * Event types live in `<hookwatch/event.hpp>`, the hook handle and builder in
 * `<hookwatch/hook.hpp>`.
 */

#ifndef HOOKWATCH_VERSION
// CMake may override these through -DHOOKWATCH_VERSION_* definitions.
#define HOOKWATCH_VERSION "0.2.0"
#define HOOKWATCH_VERSION_MAJOR 0
#define HOOKWATCH_VERSION_MINOR 2
#define HOOKWATCH_VERSION_PATCH 0
#endif

// Symbol export macro for shared builds on Windows.
// CMake defines `hookwatch_EXPORTS` when building the shared target; static
// consumers define `HOOKWATCH_STATIC` so no __declspec(dllimport) is applied.
#ifndef HOOKWATCH_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(hookwatch_EXPORTS)
#define HOOKWATCH_API __declspec(dllexport)
#elif defined(HOOKWATCH_STATIC)
#define HOOKWATCH_API
#else
#define HOOKWATCH_API __declspec(dllimport)
#endif
#else
#if defined(__GNUC__) && (__GNUC__ >= 4)
#define HOOKWATCH_API __attribute__((visibility("default")))
#else
#define HOOKWATCH_API
#endif
#endif
#endif

namespace hookwatch {

/**
 * @brief Library version string (mirrors HOOKWATCH_VERSION).
 * @return const char* Statically allocated, null-terminated version string.
 */
inline const char *libraryVersion() noexcept { return HOOKWATCH_VERSION; }

} // namespace hookwatch
