/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file log.hpp
 * @brief Synchronous printf-style logger.
 *
 * Output format:
 *   [2024-01-15 10:30:45.123] [INFO] [Process] spawned pid 4242 (command.hpp:310)
 *
 * - Compile-time floor: SUBCMD_LOG_MIN_LEVEL (0=debug .. 4=fatal, 5=off)
 * - Runtime level: log::SetLevel() / log::GetLevel()
 * - log::Init() reads the SUBCMD_LOG_LEVEL environment variable
 *   (debug|info|warn|error|off)
 * - Lines are written to stderr under a mutex, so drain threads and the
 *   caller never interleave within one line.
 */

#ifndef SUBCMD_LOG_HPP_
#define SUBCMD_LOG_HPP_

#include "subcmd/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <strings.h>
#include <sys/time.h>
#include <time.h>

#ifndef SUBCMD_LOG_MIN_LEVEL
#ifdef NDEBUG
#define SUBCMD_LOG_MIN_LEVEL 1
#else
#define SUBCMD_LOG_MIN_LEVEL 0
#endif
#endif

namespace subcmd {
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

#ifdef NDEBUG
static constexpr Level kDefaultLevel = Level::kInfo;
#else
static constexpr Level kDefaultLevel = Level::kDebug;
#endif

inline std::atomic<uint8_t>& LevelStorage() {
  static std::atomic<uint8_t> level{static_cast<uint8_t>(kDefaultLevel)};
  return level;
}

inline std::atomic<bool>& InitFlag() {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline std::mutex& OutputMutex() {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "?";
  }
}

/// @brief Strip directories from __FILE__.
inline const char* ShortFile(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

}  // namespace detail

// ============================================================================
// Level control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LevelStorage().store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(detail::LevelStorage().load(std::memory_order_relaxed));
}

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "fatal", "off").
 * @return true and writes @p out on a recognised name.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  struct Entry {
    const char* name;
    Level level;
  };
  static const Entry kTable[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},   {"warn", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal}, {"off", Level::kOff},
  };
  for (const Entry& e : kTable) {
    if (strcasecmp(name, e.name) == 0) {
      out = e.level;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Lifecycle
// ============================================================================

/**
 * @brief Mark the logger initialised and apply SUBCMD_LOG_LEVEL if set.
 *
 * Logging works without Init(); Init() only adds the environment override.
 */
inline void Init() noexcept {
  Level env_level;
  if (ParseLevel(std::getenv("SUBCMD_LOG_LEVEL"), env_level)) {
    SetLevel(env_level);
  }
  detail::InitFlag().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  std::lock_guard<std::mutex> lock(detail::OutputMutex());
  (void)std::fflush(stderr);
  detail::InitFlag().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitFlag().load(std::memory_order_acquire);
}

// ============================================================================
// Write
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file, int line,
                       const char* fmt, va_list args) {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  struct timeval tv;
  gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  localtime_r(&tv.tv_sec, &tm_buf);
  char ts[32];
  (void)std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  std::lock_guard<std::mutex> lock(detail::OutputMutex());
  (void)std::fprintf(stderr, "[%s.%03d] [%s] [%s] %s (%s:%d)\n", ts,
                     static_cast<int>(tv.tv_usec / 1000), detail::LevelTag(level),
                     category, msg, detail::ShortFile(file), line);
}

inline void LogWrite(Level level, const char* category, const char* file, int line,
                     const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace subcmd

// ============================================================================
// Macros
// ============================================================================

#define SUBCMD_LOG_DEBUG(cat, fmt, ...)                                       \
  do {                                                                        \
    if (SUBCMD_LOG_MIN_LEVEL <= 0) {                                          \
      ::subcmd::log::LogWrite(::subcmd::log::Level::kDebug, cat, __FILE__,    \
                              __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                         \
  } while (0)

#define SUBCMD_LOG_INFO(cat, fmt, ...)                                        \
  do {                                                                        \
    if (SUBCMD_LOG_MIN_LEVEL <= 1) {                                          \
      ::subcmd::log::LogWrite(::subcmd::log::Level::kInfo, cat, __FILE__,     \
                              __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                         \
  } while (0)

#define SUBCMD_LOG_WARN(cat, fmt, ...)                                        \
  do {                                                                        \
    if (SUBCMD_LOG_MIN_LEVEL <= 2) {                                          \
      ::subcmd::log::LogWrite(::subcmd::log::Level::kWarn, cat, __FILE__,     \
                              __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                         \
  } while (0)

#define SUBCMD_LOG_ERROR(cat, fmt, ...)                                       \
  do {                                                                        \
    if (SUBCMD_LOG_MIN_LEVEL <= 3) {                                          \
      ::subcmd::log::LogWrite(::subcmd::log::Level::kError, cat, __FILE__,    \
                              __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                         \
  } while (0)

/// Logs and aborts. Reserved for broken invariants, never for I/O failures.
#define SUBCMD_LOG_FATAL(cat, fmt, ...)                                       \
  do {                                                                        \
    ::subcmd::log::LogWrite(::subcmd::log::Level::kFatal, cat, __FILE__,      \
                            __LINE__, fmt, ##__VA_ARGS__);                    \
    std::abort();                                                             \
  } while (0)

#endif  // SUBCMD_LOG_HPP_
