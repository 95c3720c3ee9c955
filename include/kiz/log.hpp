/**
 * @file log.hpp
 * @brief Leveled, printf-style logging to stderr.
 *
 * Output format:
 *   [2026-10-19 12:00:00.123] [INFO] [Session] handshake acknowledged (session.hpp:210)
 *
 * Two filters apply:
 *   - KIZ_LOG_MIN_LEVEL: compile-time floor (0=DEBUG .. 4=FATAL, 5=OFF).
 *   - SetLevel(): runtime threshold, defaults to kDebug (kInfo with NDEBUG).
 *
 * FATAL logs and then calls std::abort(); reserve it for broken invariants.
 */

#ifndef KIZ_LOG_HPP_
#define KIZ_LOG_HPP_

#include "kiz/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#if defined(KIZ_PLATFORM_LINUX) || defined(KIZ_PLATFORM_MACOS)
#include <sys/time.h>
#include <time.h>
#endif

#ifndef KIZ_LOG_MIN_LEVEL
#define KIZ_LOG_MIN_LEVEL 0
#endif

namespace kiz {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

#ifdef NDEBUG
inline constexpr Level kDefaultLevel = Level::kInfo;
#else
inline constexpr Level kDefaultLevel = Level::kDebug;
#endif

inline std::atomic<uint8_t>& LevelRef() noexcept {
  static std::atomic<uint8_t> level{static_cast<uint8_t>(kDefaultLevel)};
  return level;
}

inline std::atomic<bool>& InitRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

/// Serialises writers so lines from concurrent threads never interleave.
inline std::mutex& WriteMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LevelRef().store(static_cast<uint8_t>(level),
                           std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::LevelRef().load(std::memory_order_relaxed));
}

/// Parses "debug", "info", "warn", "error", "fatal", "off" (case-insensitive).
inline bool ParseLevel(const char* str, Level& out) noexcept {
  if (str == nullptr) return false;
  static constexpr struct {
    const char* name;
    Level level;
  } kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"warning", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal},
      {"off", Level::kOff},
  };
  for (const auto& n : kNames) {
    const char* a = str;
    const char* b = n.name;
    while (*a != '\0' && *b != '\0') {
      char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
      if (la != *b) break;
      ++a;
      ++b;
    }
    if (*a == '\0' && *b == '\0') {
      out = n.level;
      return true;
    }
  }
  return false;
}

inline void Init(Level level = detail::kDefaultLevel) noexcept {
  SetLevel(level);
  detail::InitRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  std::fflush(stderr);
  detail::InitRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitRef().load(std::memory_order_acquire);
}

// ============================================================================
// Write Path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char msg[512];
  std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts[32] = "";
#if defined(KIZ_PLATFORM_LINUX) || defined(KIZ_PLATFORM_MACOS)
  struct timeval tv;
  ::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  time_t secs = tv.tv_sec;
  ::localtime_r(&secs, &tm_buf);
  char date[24];
  std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
  std::snprintf(ts, sizeof(ts), "%s.%03ld", date,
                static_cast<long>(tv.tv_usec / 1000));
#endif

  std::lock_guard<std::mutex> lock(detail::WriteMutex());
  std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
               detail::LevelTag(level),
               (category != nullptr) ? category : "-", msg,
               detail::Basename(file), line);
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace kiz

// ============================================================================
// Macros
// ============================================================================

#define KIZ_LOG_DEBUG(cat, fmt, ...)                                      \
  do {                                                                    \
    if (KIZ_LOG_MIN_LEVEL <= 0) {                                         \
      ::kiz::log::LogWrite(::kiz::log::Level::kDebug, cat, __FILE__,      \
                           __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                     \
  } while (0)

#define KIZ_LOG_INFO(cat, fmt, ...)                                       \
  do {                                                                    \
    if (KIZ_LOG_MIN_LEVEL <= 1) {                                         \
      ::kiz::log::LogWrite(::kiz::log::Level::kInfo, cat, __FILE__,       \
                           __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                     \
  } while (0)

#define KIZ_LOG_WARN(cat, fmt, ...)                                       \
  do {                                                                    \
    if (KIZ_LOG_MIN_LEVEL <= 2) {                                         \
      ::kiz::log::LogWrite(::kiz::log::Level::kWarn, cat, __FILE__,       \
                           __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                     \
  } while (0)

#define KIZ_LOG_ERROR(cat, fmt, ...)                                      \
  do {                                                                    \
    if (KIZ_LOG_MIN_LEVEL <= 3) {                                         \
      ::kiz::log::LogWrite(::kiz::log::Level::kError, cat, __FILE__,      \
                           __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                     \
  } while (0)

#define KIZ_LOG_FATAL(cat, fmt, ...)                                      \
  do {                                                                    \
    ::kiz::log::LogWrite(::kiz::log::Level::kFatal, cat, __FILE__,        \
                         __LINE__, fmt, ##__VA_ARGS__);                   \
    std::abort();                                                         \
  } while (0)

#endif  // KIZ_LOG_HPP_
