#pragma once

/**
 * @file log.hpp
 * @brief Logging facility used by the hook runtime.
 *
 * Usage:
 *   @code{.cpp}
 *   #include <hookwatch/log.hpp>
 *   HOOKWATCH_LOG_INFO("hook installed for %s", toString(kind));
 *   @endcode
 *
 * Runtime configuration comes from the environment:
 *  - HOOKWATCH_LOG_LEVEL: "debug", "info", "warn" or "error" (default info).
 *  - HOOKWATCH_FORCE_COLORS: non-empty -> always emit ANSI colors.
 *  - HOOKWATCH_NO_COLOR: non-empty -> never emit ANSI colors.
 *
 * Lines go to stderr unless a sink is installed with `setSink`. Writes are
 * serialized and never throw, so the macros are usable from noexcept
 * teardown paths and from the hook worker threads.
 */

#include <cstdarg>

#include <hookwatch/core.hpp>

#if defined(__GNUC__) || defined(__clang__)
#define HOOKWATCH_PRINTF_FORMAT(fmt_index, args_index)                        \
  __attribute__((format(printf, fmt_index, args_index)))
#else
#define HOOKWATCH_PRINTF_FORMAT(fmt_index, args_index)
#endif

namespace hookwatch::log {

/**
 * @enum Level
 * @brief Logging severity. Lower values are more verbose.
 */
enum class Level : int {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

HOOKWATCH_API const char *levelToString(Level level) noexcept;

/**
 * @brief Parse a level name ("debug", "w", "3", ...), case-insensitively.
 * @return `fallback` when `text` is null, empty or unrecognized.
 */
HOOKWATCH_API Level parseLevel(const char *text, Level fallback) noexcept;

/// Current threshold; initialized from HOOKWATCH_LOG_LEVEL on first use.
HOOKWATCH_API Level getLevel() noexcept;
HOOKWATCH_API void setLevel(Level level) noexcept;
HOOKWATCH_API bool isEnabled(Level level) noexcept;

/**
 * @brief Receives each formatted line (without color codes or trailing
 * newline). Called with the output lock held; must not log.
 */
using Sink = void (*)(Level level, const char *line);

/**
 * @brief Route output to `sink`, or back to stderr when `sink` is null.
 * @return The previously installed sink.
 */
HOOKWATCH_API Sink setSink(Sink sink) noexcept;

/// Format and emit one line: `[hookwatch] time.ms [LEVEL] file:line: msg`.
HOOKWATCH_API void vlog(Level level, const char *file, int line,
                        const char *fmt, va_list ap) noexcept;

HOOKWATCH_API void log(Level level, const char *file, int line,
                       const char *fmt, ...) noexcept
    HOOKWATCH_PRINTF_FORMAT(4, 5);

} // namespace hookwatch::log

#define HOOKWATCH_LOG_DEBUG(fmt, ...)                                          \
  ::hookwatch::log::log(::hookwatch::log::Level::Debug, __FILE__, __LINE__,    \
                        fmt, ##__VA_ARGS__)
#define HOOKWATCH_LOG_INFO(fmt, ...)                                           \
  ::hookwatch::log::log(::hookwatch::log::Level::Info, __FILE__, __LINE__,     \
                        fmt, ##__VA_ARGS__)
#define HOOKWATCH_LOG_WARN(fmt, ...)                                           \
  ::hookwatch::log::log(::hookwatch::log::Level::Warn, __FILE__, __LINE__,     \
                        fmt, ##__VA_ARGS__)
#define HOOKWATCH_LOG_ERROR(fmt, ...)                                          \
  ::hookwatch::log::log(::hookwatch::log::Level::Error, __FILE__, __LINE__,    \
                        fmt, ##__VA_ARGS__)
