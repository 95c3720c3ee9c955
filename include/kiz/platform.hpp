/**
 * @file platform.hpp
 * @brief Platform detection, assertion and monotonic clock helpers.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef KIZ_PLATFORM_HPP_
#define KIZ_PLATFORM_HPP_

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define KIZ_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define KIZ_PLATFORM_MACOS 1
#endif

// ============================================================================
// Branch Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define KIZ_LIKELY(x) __builtin_expect(!!(x), 1)
#define KIZ_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define KIZ_LIKELY(x) (x)
#define KIZ_UNLIKELY(x) (x)
#endif

// ============================================================================
// Assertion
// ============================================================================

namespace kiz {
namespace detail {

[[noreturn]] inline void AssertFail(const char* expr, const char* file,
                                    int line) noexcept {
  std::fprintf(stderr, "KIZ_ASSERT failed: %s (%s:%d)\n", expr, file, line);
  std::abort();
}

}  // namespace detail
}  // namespace kiz

/// Programming-error check. Compiled out with NDEBUG.
#ifdef NDEBUG
#define KIZ_ASSERT(cond) ((void)0)
#else
#define KIZ_ASSERT(cond)                                        \
  (KIZ_LIKELY(cond) ? (void)0                                   \
                    : ::kiz::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

namespace kiz {

// ============================================================================
// Monotonic Clock
// ============================================================================

/// @brief Monotonic timestamp in microseconds (steady_clock).
inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/// @brief Monotonic timestamp in milliseconds (steady_clock).
inline uint64_t SteadyNowMs() noexcept { return SteadyNowUs() / 1000U; }

}  // namespace kiz

#endif  // KIZ_PLATFORM_HPP_
