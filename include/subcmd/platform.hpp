/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, assertion macro and
 *        compile-time tunables.
 */

#ifndef SUBCMD_PLATFORM_HPP_
#define SUBCMD_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace subcmd {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define SUBCMD_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define SUBCMD_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define SUBCMD_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define SUBCMD_LIKELY(x) __builtin_expect(!!(x), 1)
#define SUBCMD_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define SUBCMD_LIKELY(x) (x)
#define SUBCMD_UNLIKELY(x) (x)
#endif

// ============================================================================
// Tunables
// ============================================================================

/// Chunk size used when draining a pipe into a Broadcaster.
#ifndef SUBCMD_COPY_BUF_SIZE
#define SUBCMD_COPY_BUF_SIZE 32768U
#endif

static constexpr size_t kCopyBufSize = SUBCMD_COPY_BUF_SIZE;

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
  (void)std::fprintf(stderr, "SUBCMD_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define SUBCMD_ASSERT(cond) ((void)0)
#else
#define SUBCMD_ASSERT(cond)                                                    \
  ((cond) ? ((void)0) : ::subcmd::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace subcmd

#endif  // SUBCMD_PLATFORM_HPP_
