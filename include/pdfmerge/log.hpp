/**
 * MIT License
 *
 * Copyright (c) 2024 pdfmerge contributors
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
 * @brief Synchronous category logger with printf-style macros.
 *
 * Usage:
 *   PDFMERGE_LOG_INFO("Pool", "worker %u spawned", id);
 *
 * Output line: "[YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [Category] message".
 * Debug builds append "(file:line)".
 *
 * Compile-time floor: PDFMERGE_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL). Calls below
 * the floor are compiled out. The runtime level filters the rest.
 */

#ifndef PDFMERGE_LOG_HPP_
#define PDFMERGE_LOG_HPP_

#include "pdfmerge/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#if defined(PDFMERGE_PLATFORM_LINUX) || defined(PDFMERGE_PLATFORM_MACOS)
#include <time.h>
#endif

#ifndef PDFMERGE_LOG_MIN_LEVEL
#define PDFMERGE_LOG_MIN_LEVEL 0
#endif

namespace pdfmerge {
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

struct LogState {
#ifdef NDEBUG
  std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  std::atomic<bool> initialized{false};
  std::mutex write_mutex;

  static LogState& Instance() noexcept {
    static LogState state;
    return state;
  }
};

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo: return "INFO";
    case Level::kWarn: return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default: return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/// @brief Format the current wall clock as "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatNow(char* buf, size_t bufsz) noexcept {
#if defined(PDFMERGE_PLATFORM_LINUX) || defined(PDFMERGE_PLATFORM_MACOS)
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
// Runtime control
// ============================================================================

inline void Init() noexcept {
  detail::LogState::Instance().initialized.store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  auto& st = detail::LogState::Instance();
  {
    std::lock_guard<std::mutex> lock(st.write_mutex);
    (void)std::fflush(stderr);
  }
  st.initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::LogState::Instance().initialized.load(std::memory_order_acquire);
}

inline void SetLevel(Level level) noexcept {
  detail::LogState::Instance().level.store(static_cast<uint8_t>(level),
                                           std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::LogState::Instance().level.load(std::memory_order_relaxed));
}

/// @brief Parse "debug" / "info" / "warn" / "error" / "fatal" / "off".
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  struct Entry {
    const char* name;
    Level level;
  };
  static constexpr Entry kTable[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"error", Level::kError},
      {"fatal", Level::kFatal}, {"off", Level::kOff},
  };
  for (const auto& e : kTable) {
    if (std::strcmp(name, e.name) == 0) {
      out = e.level;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Write path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  auto& st = detail::LogState::Instance();
  if (static_cast<uint8_t>(level) < st.level.load(std::memory_order_relaxed)) {
    return;
  }

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  char ts[32];
  detail::FormatNow(ts, sizeof(ts));

  std::lock_guard<std::mutex> lock(st.write_mutex);
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
}  // namespace pdfmerge

// ============================================================================
// Macros
// ============================================================================

#define PDFMERGE_LOG_DEBUG(cat, fmt, ...)                                   \
  do {                                                                      \
    if (PDFMERGE_LOG_MIN_LEVEL <= 0) {                                      \
      ::pdfmerge::log::LogWrite(::pdfmerge::log::Level::kDebug, cat,        \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                       \
  } while (0)

#define PDFMERGE_LOG_INFO(cat, fmt, ...)                                    \
  do {                                                                      \
    if (PDFMERGE_LOG_MIN_LEVEL <= 1) {                                      \
      ::pdfmerge::log::LogWrite(::pdfmerge::log::Level::kInfo, cat,         \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                       \
  } while (0)

#define PDFMERGE_LOG_WARN(cat, fmt, ...)                                    \
  do {                                                                      \
    if (PDFMERGE_LOG_MIN_LEVEL <= 2) {                                      \
      ::pdfmerge::log::LogWrite(::pdfmerge::log::Level::kWarn, cat,         \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                       \
  } while (0)

#define PDFMERGE_LOG_ERROR(cat, fmt, ...)                                   \
  do {                                                                      \
    if (PDFMERGE_LOG_MIN_LEVEL <= 3) {                                      \
      ::pdfmerge::log::LogWrite(::pdfmerge::log::Level::kError, cat,        \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                       \
  } while (0)

#define PDFMERGE_LOG_FATAL(cat, fmt, ...)                                   \
  do {                                                                      \
    ::pdfmerge::log::LogWrite(::pdfmerge::log::Level::kFatal, cat,          \
                              __FILE__, __LINE__, fmt, ##__VA_ARGS__);      \
    std::abort();                                                           \
  } while (0)

#endif  // PDFMERGE_LOG_HPP_
