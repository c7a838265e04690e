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
 * @brief Leveled, printf-style logging to stderr.
 *
 * Every line carries wall-clock time, level, category and source location:
 *
 *   [2024-05-01 12:00:00.123] [WARN ] [Service] put timed out (service.hpp:210)
 *
 * Two filters apply:
 *   - RECYCLE_LOG_MIN_LEVEL  compile-time floor (0=DEBUG .. 4=FATAL)
 *   - SetLevel()             runtime threshold
 *
 * FATAL logs flush and then abort the process.
 */

#ifndef RECYCLE_LOG_HPP_
#define RECYCLE_LOG_HPP_

#include "recycle/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <time.h>

// ============================================================================
// Compile-Time Configuration
// ============================================================================

#ifndef RECYCLE_LOG_MIN_LEVEL
#ifdef NDEBUG
#define RECYCLE_LOG_MIN_LEVEL 1
#else
#define RECYCLE_LOG_MIN_LEVEL 0
#endif
#endif

namespace recycle {
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

#ifdef NDEBUG
static constexpr Level kDefaultLevel = Level::kInfo;
#else
static constexpr Level kDefaultLevel = Level::kDebug;
#endif

inline std::atomic<Level>& LogLevelRef() noexcept {
  static std::atomic<Level> level{kDefaultLevel};
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

// Serializes whole lines so concurrent actors never interleave output.
inline std::mutex& WriteMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO ";
    case Level::kWarn:  return "WARN ";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "?????";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "";
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') base = p + 1;
  }
  return base;
}

inline void FormatWallclock(char* buf, size_t size) noexcept {
  struct timespec ts;
  (void)clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_buf;
  (void)localtime_r(&ts.tv_sec, &tm_buf);
  (void)std::snprintf(buf, size, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_buf.tm_year + 1900, tm_buf.tm_mon + 1,
                      tm_buf.tm_mday, tm_buf.tm_hour, tm_buf.tm_min,
                      tm_buf.tm_sec, ts.tv_nsec / 1000000L);
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/**
 * @brief Mark the logger ready. Logging works without Init(); the flag
 *        exists so applications can pair it with Shutdown().
 */
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/** @brief Flush stderr and clear the initialized flag. */
inline void Shutdown() noexcept {
  {
    std::lock_guard<std::mutex> lock(detail::WriteMutex());
    (void)std::fflush(stderr);
  }
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/**
 * @brief Parse a level name ("debug", "INFO", "warn", ...).
 * @return true and sets @p out on a recognised name.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  struct Entry {
    const char* name;
    Level level;
  };
  static constexpr Entry kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"warning", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal},
      {"off", Level::kOff},
  };
  for (const Entry& e : kNames) {
    const char* a = name;
    const char* b = e.name;
    while (*a != '\0' && *b != '\0') {
      char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
      if (la != *b) break;
      ++a;
      ++b;
    }
    if (*a == '\0' && *b == '\0') {
      out = e.level;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Write Path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char timestamp[32];
  detail::FormatWallclock(timestamp, sizeof(timestamp));

  char message[512];
  (void)std::vsnprintf(message, sizeof(message), fmt, args);

  std::lock_guard<std::mutex> lock(detail::WriteMutex());
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", timestamp,
                     detail::LevelTag(level),
                     (category != nullptr) ? category : "", message,
                     detail::Basename(file), line);
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

RECYCLE_PRINTF_FORMAT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace recycle

// ============================================================================
// Macros
// ============================================================================

#define RECYCLE_LOG_DEBUG(cat, fmt, ...)                                   \
  do {                                                                     \
    if (RECYCLE_LOG_MIN_LEVEL <= 0) {                                      \
      ::recycle::log::LogWrite(::recycle::log::Level::kDebug, cat,         \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define RECYCLE_LOG_INFO(cat, fmt, ...)                                    \
  do {                                                                     \
    if (RECYCLE_LOG_MIN_LEVEL <= 1) {                                      \
      ::recycle::log::LogWrite(::recycle::log::Level::kInfo, cat,          \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define RECYCLE_LOG_WARN(cat, fmt, ...)                                    \
  do {                                                                     \
    if (RECYCLE_LOG_MIN_LEVEL <= 2) {                                      \
      ::recycle::log::LogWrite(::recycle::log::Level::kWarn, cat,          \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define RECYCLE_LOG_ERROR(cat, fmt, ...)                                   \
  do {                                                                     \
    if (RECYCLE_LOG_MIN_LEVEL <= 3) {                                      \
      ::recycle::log::LogWrite(::recycle::log::Level::kError, cat,         \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define RECYCLE_LOG_FATAL(cat, fmt, ...)                                   \
  do {                                                                     \
    ::recycle::log::LogWrite(::recycle::log::Level::kFatal, cat, __FILE__, \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    std::abort();                                                          \
  } while (0)

#endif  // RECYCLE_LOG_HPP_
