/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, clock helpers and assertion macros.
 */

#ifndef PDFMERGE_PLATFORM_HPP_
#define PDFMERGE_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace pdfmerge {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define PDFMERGE_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define PDFMERGE_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define PDFMERGE_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

// ============================================================================
// Size Helpers
// ============================================================================

static constexpr uint64_t kKiB = 1024ULL;
static constexpr uint64_t kMiB = 1024ULL * 1024ULL;

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define PDFMERGE_LIKELY(x) __builtin_expect(!!(x), 1)
#define PDFMERGE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define PDFMERGE_UNUSED __attribute__((unused))
#else
#define PDFMERGE_LIKELY(x) (x)
#define PDFMERGE_UNLIKELY(x) (x)
#define PDFMERGE_UNUSED
#endif

// ============================================================================
// Monotonic Clock
// ============================================================================

/// Monotonic time in microseconds (steady_clock).
inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/// Monotonic time in milliseconds (steady_clock).
inline uint64_t SteadyNowMs() noexcept { return SteadyNowUs() / 1000U; }

// ============================================================================
// Memory Sampling Hook
// ============================================================================

/// Returns current process memory usage in bytes. Injected wherever memory
/// pressure is consulted so tests can script usage.
using MemorySampleFn = uint64_t (*)(void* ctx);

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "PDFMERGE_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define PDFMERGE_ASSERT(cond) ((void)0)
#else
#define PDFMERGE_ASSERT(cond) \
  ((cond) ? ((void)0) : ::pdfmerge::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace pdfmerge

#endif  // PDFMERGE_PLATFORM_HPP_
