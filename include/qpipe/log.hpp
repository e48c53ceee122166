/**
 * @file log.hpp
 * @brief Lightweight printf-style category logging to stderr.
 *
 * Two gates:
 *   - Compile time: QPIPE_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL, 5=OFF) removes
 *     call sites below the threshold entirely.
 *   - Run time: SetLevel() / GetLevel() filters what reaches the sink.
 *
 * Output format:
 *   [YYYY-MM-DD HH:MM:SS.mmm] [LVL] [category] message (file:line)
 * The file:line suffix is omitted in NDEBUG builds.
 *
 * Usage:
 * @code
 *   QPIPE_LOG_INFO("Pipe", "stage started workers=%u", n);
 * @endcode
 */

#ifndef QPIPE_LOG_HPP_
#define QPIPE_LOG_HPP_

#include "qpipe/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>

#if defined(QPIPE_PLATFORM_LINUX) || defined(QPIPE_PLATFORM_MACOS)
#include <time.h>
#endif

#ifndef QPIPE_LOG_MIN_LEVEL
#ifdef NDEBUG
#define QPIPE_LOG_MIN_LEVEL 1
#else
#define QPIPE_LOG_MIN_LEVEL 0
#endif
#endif

namespace qpipe {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
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

/// @brief Serializes whole lines so concurrent workers do not interleave.
inline std::mutex& SinkMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DBG";
    case Level::kInfo:
      return "INF";
    case Level::kWarn:
      return "WRN";
    case Level::kError:
      return "ERR";
    case Level::kFatal:
      return "FTL";
    case Level::kOff:
      break;
  }
  return "???";
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
#if defined(QPIPE_PLATFORM_LINUX) || defined(QPIPE_PLATFORM_MACOS)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec, ts.tv_nsec / 1000000L);
#else
  std::time_t t = std::time(nullptr);
  struct std::tm* tm_local = std::localtime(&t);
  if (tm_local != nullptr) {
    (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.000",
                        tm_local->tm_year + 1900, tm_local->tm_mon + 1,
                        tm_local->tm_mday, tm_local->tm_hour,
                        tm_local->tm_min, tm_local->tm_sec);
  } else {
    (void)std::snprintf(buf, bufsz, "0000-00-00 00:00:00.000");
  }
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

/// @brief Mark the logger initialized. Logging works without it.
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/// @brief Flush stderr and mark the logger uninitialized.
inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/**
 * @brief Format and write one line to stderr (va_list form).
 */
inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts_buf[32];
  detail::FormatTimestamp(ts_buf, sizeof(ts_buf));

  std::lock_guard<std::mutex> lk(detail::SinkMutex());
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

/**
 * @brief Format and write one line to stderr.
 */
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace qpipe

// ============================================================================
// Macros
// ============================================================================

#define QPIPE_LOG_DEBUG(cat, fmt, ...)                                     \
  do {                                                                     \
    if (QPIPE_LOG_MIN_LEVEL <= 0) {                                        \
      ::qpipe::log::LogWrite(::qpipe::log::Level::kDebug, cat, __FILE__,   \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define QPIPE_LOG_INFO(cat, fmt, ...)                                      \
  do {                                                                     \
    if (QPIPE_LOG_MIN_LEVEL <= 1) {                                        \
      ::qpipe::log::LogWrite(::qpipe::log::Level::kInfo, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define QPIPE_LOG_WARN(cat, fmt, ...)                                      \
  do {                                                                     \
    if (QPIPE_LOG_MIN_LEVEL <= 2) {                                        \
      ::qpipe::log::LogWrite(::qpipe::log::Level::kWarn, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define QPIPE_LOG_ERROR(cat, fmt, ...)                                     \
  do {                                                                     \
    if (QPIPE_LOG_MIN_LEVEL <= 3) {                                        \
      ::qpipe::log::LogWrite(::qpipe::log::Level::kError, cat, __FILE__,   \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define QPIPE_LOG_FATAL(cat, fmt, ...)                                     \
  do {                                                                     \
    ::qpipe::log::LogWrite(::qpipe::log::Level::kFatal, cat, __FILE__,     \
                           __LINE__, fmt, ##__VA_ARGS__);                  \
    std::abort();                                                          \
  } while (0)

#endif  // QPIPE_LOG_HPP_
