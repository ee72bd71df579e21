/**
 * @file log.hpp
 * @brief Synchronous printf-style logger with runtime and compile-time
 *        level filtering.
 *
 * Output format (stderr):
 *   [2026-10-18 13:01:02.345] [INFO] [Router] message (router.hpp:120)
 *
 * The file:line suffix is omitted in NDEBUG builds.
 *
 * Compile-time configuration:
 *   XLINK_LOG_MIN_LEVEL -- 0=DEBUG .. 4=FATAL, 5=OFF. Statements below the
 *                          floor compile to nothing.
 *
 * Header-only, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef XLINK_LOG_HPP_
#define XLINK_LOG_HPP_

#include "xlink/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

#if defined(XLINK_PLATFORM_LINUX) || defined(XLINK_PLATFORM_MACOS)
#include <sys/time.h>
#include <time.h>
#endif

#ifndef XLINK_LOG_MIN_LEVEL
#ifdef NDEBUG
#define XLINK_LOG_MIN_LEVEL 1
#else
#define XLINK_LOG_MIN_LEVEL 0
#endif
#endif

namespace xlink {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

/// Serializes lines from concurrent threads.
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
    case Level::kOff:   return "OFF";
  }
  return "?";
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "";
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') base = p + 1;
  }
  return base;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
#if defined(XLINK_PLATFORM_LINUX) || defined(XLINK_PLATFORM_MACOS)
  struct timeval tv;
  ::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  time_t sec = tv.tv_sec;
  ::localtime_r(&sec, &tm_buf);
  (void)std::snprintf(buf, size, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                      tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                      tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                      static_cast<int>(tv.tv_usec / 1000));
#else
  (void)std::snprintf(buf, size, "-");
#endif
}

}  // namespace detail

// ============================================================================
// Public API
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/// @brief Mark the logger ready. Logging works without Init(); Init() only
///        exists so applications can pair it with Shutdown().
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/// @brief Flush stderr and mark the logger shut down.
inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/// @brief Parse "debug" / "info" / "warn" / "error" / "fatal" / "off"
///        (case-insensitive). Returns false for anything else.
inline bool ParseLevel(const char* str, Level& out) noexcept {
  if (str == nullptr) return false;
  char lower[8];
  uint32_t i = 0;
  for (; str[i] != '\0'; ++i) {
    if (i >= sizeof(lower) - 1U) return false;
    char c = str[i];
    lower[i] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
  }
  lower[i] = '\0';

  if (std::strcmp(lower, "debug") == 0) { out = Level::kDebug; return true; }
  if (std::strcmp(lower, "info") == 0)  { out = Level::kInfo;  return true; }
  if (std::strcmp(lower, "warn") == 0)  { out = Level::kWarn;  return true; }
  if (std::strcmp(lower, "error") == 0) { out = Level::kError; return true; }
  if (std::strcmp(lower, "fatal") == 0) { out = Level::kFatal; return true; }
  if (std::strcmp(lower, "off") == 0)   { out = Level::kOff;   return true; }
  return false;
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      static_cast<uint8_t>(detail::LogLevelRef().load(std::memory_order_relaxed))) {
    return;
  }

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  std::lock_guard<std::mutex> lock(detail::WriteMutex());
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace xlink

// ============================================================================
// Macros
// ============================================================================

#define XLINK_LOG_DEBUG(cat, fmt, ...)                                     \
  do {                                                                     \
    if (XLINK_LOG_MIN_LEVEL <= 0) {                                        \
      ::xlink::log::LogWrite(::xlink::log::Level::kDebug, cat, __FILE__,   \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define XLINK_LOG_INFO(cat, fmt, ...)                                      \
  do {                                                                     \
    if (XLINK_LOG_MIN_LEVEL <= 1) {                                        \
      ::xlink::log::LogWrite(::xlink::log::Level::kInfo, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define XLINK_LOG_WARN(cat, fmt, ...)                                      \
  do {                                                                     \
    if (XLINK_LOG_MIN_LEVEL <= 2) {                                        \
      ::xlink::log::LogWrite(::xlink::log::Level::kWarn, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define XLINK_LOG_ERROR(cat, fmt, ...)                                     \
  do {                                                                     \
    if (XLINK_LOG_MIN_LEVEL <= 3) {                                        \
      ::xlink::log::LogWrite(::xlink::log::Level::kError, cat, __FILE__,   \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define XLINK_LOG_FATAL(cat, fmt, ...)                                     \
  do {                                                                     \
    ::xlink::log::LogWrite(::xlink::log::Level::kFatal, cat, __FILE__,     \
                           __LINE__, fmt, ##__VA_ARGS__);                  \
    std::abort();                                                          \
  } while (0)

#endif  // XLINK_LOG_HPP_
