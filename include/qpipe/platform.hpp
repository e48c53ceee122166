/**
 * @file platform.hpp
 * @brief Platform detection, monotonic clock and the internal assert macro.
 */

#ifndef QPIPE_PLATFORM_HPP_
#define QPIPE_PLATFORM_HPP_

#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <chrono>

namespace qpipe {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define QPIPE_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define QPIPE_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define QPIPE_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Monotonic Clock
// ============================================================================

/// @brief Monotonic time in nanoseconds (steady_clock).
inline uint64_t SteadyNowNs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/// @brief Monotonic time in microseconds (steady_clock).
inline uint64_t SteadyNowUs() noexcept { return SteadyNowNs() / 1000U; }

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 * Reserved for internal contract violations, never for user input.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "QPIPE_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define QPIPE_ASSERT(cond) ((void)0)
#else
#define QPIPE_ASSERT(cond)                                                 \
  ((cond) ? ((void)0)                                                      \
          : ::qpipe::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace qpipe

#endif  // QPIPE_PLATFORM_HPP_
