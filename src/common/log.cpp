/**
 * @file common/log.cpp
 * @brief Formatting, level threshold and output routing for hookwatch::log.
 */

#include <hookwatch/log.hpp>

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <initializer_list>
#include <mutex>
#include <system_error>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace hookwatch::log {

namespace {

constexpr std::size_t kLineCapacity = 1024;

bool envSet(const char *name) {
  const char *v = std::getenv(name);
  return v && v[0] != '\0';
}

std::atomic<Level> &threshold() {
  static std::atomic<Level> level(
      parseLevel(std::getenv("HOOKWATCH_LOG_LEVEL"), Level::Info));
  return level;
}

std::atomic<Sink> &currentSink() {
  static std::atomic<Sink> sink(nullptr);
  return sink;
}

// Never destroyed so hook teardown during static destruction can still log.
std::mutex &outputMutex() {
  static std::mutex *m = new std::mutex;
  return *m;
}

bool stderrIsTerminal() {
#if defined(_WIN32)
  return _isatty(_fileno(stderr)) != 0;
#else
  return isatty(fileno(stderr)) != 0;
#endif
}

bool useColors() {
  if (envSet("HOOKWATCH_FORCE_COLORS"))
    return true;
  if (envSet("HOOKWATCH_NO_COLOR"))
    return false;
  return stderrIsTerminal();
}

const char *colorOf(Level level) {
  switch (level) {
  case Level::Debug:
    return "\x1b[33m";
  case Level::Info:
    return "\x1b[34m";
  case Level::Warn:
    return "\x1b[38;5;208m";
  case Level::Error:
    return "\x1b[31m";
  }
  return "\x1b[0m";
}

bool isSeparator(char c) { return c == '/' || c == '\\'; }

// Keep the path from the last src/, include/, tests/ or examples/ component,
// else just the basename.
const char *shortPath(const char *path) {
  if (!path)
    return "?";
  const char *base = path;
  const char *anchor = nullptr;
  for (const char *p = path; *p; ++p) {
    if (!isSeparator(*p))
      continue;
    base = p + 1;
    for (const char *dir : {"src", "include", "tests", "examples"}) {
      const std::size_t n = std::strlen(dir);
      if (std::strncmp(p + 1, dir, n) == 0 && isSeparator(p[1 + n]))
        anchor = p + 1;
    }
  }
  return anchor ? anchor : base;
}

void formatTimestamp(char *out, std::size_t size, int &millis) {
  using namespace std::chrono;
  const auto now = system_clock::now();
  millis = static_cast<int>(
      (duration_cast<milliseconds>(now.time_since_epoch()) % 1000).count());
  const std::time_t t = system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  if (std::strftime(out, size, "%Y-%m-%d %H:%M:%S", &tm) == 0)
    std::snprintf(out, size, "%lld", static_cast<long long>(t));
}

} // namespace

const char *levelToString(Level level) noexcept {
  switch (level) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warn:
    return "WARN";
  case Level::Error:
    return "ERROR";
  }
  return "UNKNOWN";
}

Level parseLevel(const char *text, Level fallback) noexcept {
  if (!text || text[0] == '\0')
    return fallback;
  char lowered[16] = {};
  std::size_t n = 0;
  for (; text[n] && n + 1 < sizeof(lowered); ++n)
    lowered[n] = static_cast<char>(
        std::tolower(static_cast<unsigned char>(text[n])));
  if (text[n])
    return fallback;

  struct Alias {
    const char *name;
    Level level;
  };
  static const Alias aliases[] = {
      {"debug", Level::Debug}, {"d", Level::Debug},   {"0", Level::Debug},
      {"info", Level::Info},   {"i", Level::Info},    {"1", Level::Info},
      {"warn", Level::Warn},   {"warning", Level::Warn},
      {"w", Level::Warn},      {"2", Level::Warn},    {"error", Level::Error},
      {"e", Level::Error},     {"3", Level::Error},
  };
  for (const Alias &a : aliases) {
    if (std::strcmp(lowered, a.name) == 0)
      return a.level;
  }
  return fallback;
}

Level getLevel() noexcept { return threshold().load(); }

void setLevel(Level level) noexcept { threshold().store(level); }

bool isEnabled(Level level) noexcept {
  return static_cast<int>(level) >= static_cast<int>(getLevel());
}

Sink setSink(Sink sink) noexcept { return currentSink().exchange(sink); }

void vlog(Level level, const char *file, int line, const char *fmt,
          va_list ap) noexcept {
  if (!fmt || !isEnabled(level))
    return;

  char message[kLineCapacity];
  if (std::vsnprintf(message, sizeof(message), fmt, ap) < 0)
    std::snprintf(message, sizeof(message), "(unformattable: %s)", fmt);

  char stamp[32];
  int millis = 0;
  formatTimestamp(stamp, sizeof(stamp), millis);

  try {
    std::lock_guard<std::mutex> lk(outputMutex());
    if (Sink sink = currentSink().load()) {
      char text[kLineCapacity + 128];
      std::snprintf(text, sizeof(text), "[hookwatch] %s.%03d [%s] %s:%d: %s",
                    stamp, millis, levelToString(level), shortPath(file), line,
                    message);
      sink(level, text);
      return;
    }

    const bool colors = useColors();
    const char *reset = colors ? "\x1b[0m" : "";
    std::fprintf(stderr, "[hookwatch] %s.%03d [%s%s%s] %s%s:%d:%s %s\n", stamp,
                 millis, colors ? colorOf(level) : "", levelToString(level),
                 reset, colors ? "\x1b[90m" : "", shortPath(file), line, reset,
                 message);
    std::fflush(stderr);
  } catch (const std::system_error &) {
    // The output lock is unavailable; drop the line.
  }
}

void log(Level level, const char *file, int line, const char *fmt,
         ...) noexcept {
  if (!isEnabled(level))
    return;
  va_list ap;
  va_start(ap, fmt);
  vlog(level, file, line, fmt, ap);
  va_end(ap);
}

} // namespace hookwatch::log
