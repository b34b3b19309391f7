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
 * @brief Process-wide synchronous log sink with printf-style macros.
 *
 * Every record is formatted on the caller's stack and written with a single
 * fprintf under a mutex, so lines from concurrent workers never interleave.
 *
 * Output format:
 *   [2024-05-01 12:00:00.123] [I] [Stage] message (stage.hpp:120)
 *
 * Compile-time configuration:
 *   SLUICE_LOG_MIN_LEVEL -- records below this level compile to nothing
 *                           (0=DEBUG .. 4=FATAL, default 0)
 *
 * Runtime configuration:
 *   sluice::log::SetLevel(sluice::log::Level::kWarn);
 */

#ifndef SLUICE_LOG_HPP_
#define SLUICE_LOG_HPP_

#include "sluice/platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#ifndef SLUICE_LOG_MIN_LEVEL
#define SLUICE_LOG_MIN_LEVEL 0
#endif

namespace sluice {
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

struct SinkState {
  std::mutex mtx;
  FILE* out{nullptr};
  bool initialized{false};
};

inline SinkState& Sink() noexcept {
  static SinkState state;
  return state;
}

inline char LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return 'D';
    case Level::kInfo:
      return 'I';
    case Level::kWarn:
      return 'W';
    case Level::kError:
      return 'E';
    case Level::kFatal:
      return 'F';
    default:
      return '?';
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
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
 * @brief Route records to @p out (stderr when nullptr).
 */
inline void Init(FILE* out = nullptr) noexcept {
  auto& sink = detail::Sink();
  std::lock_guard<std::mutex> lk(sink.mtx);
  sink.out = out;
  sink.initialized = true;
}

/**
 * @brief Flush and fall back to stderr.
 */
inline void Shutdown() noexcept {
  auto& sink = detail::Sink();
  std::lock_guard<std::mutex> lk(sink.mtx);
  if (sink.out != nullptr) {
    (void)std::fflush(sink.out);
  }
  sink.out = nullptr;
  sink.initialized = false;
}

inline bool IsInitialized() noexcept {
  auto& sink = detail::Sink();
  std::lock_guard<std::mutex> lk(sink.mtx);
  return sink.initialized;
}

/**
 * @brief Parse a level name ("debug", "INFO", "warn", "warning", "error",
 *        "fatal", "off"). Unknown or null names yield @p fallback.
 */
inline Level ParseLevel(const char* name, Level fallback = Level::kInfo) noexcept {
  if (name == nullptr) return fallback;
  if (detail::CaseEqual(name, "debug")) return Level::kDebug;
  if (detail::CaseEqual(name, "info")) return Level::kInfo;
  if (detail::CaseEqual(name, "warn") || detail::CaseEqual(name, "warning")) {
    return Level::kWarn;
  }
  if (detail::CaseEqual(name, "error")) return Level::kError;
  if (detail::CaseEqual(name, "fatal")) return Level::kFatal;
  if (detail::CaseEqual(name, "off")) return Level::kOff;
  return fallback;
}

// ============================================================================
// Write Path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char message[512];
  (void)std::vsnprintf(message, sizeof(message), fmt, args);

  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const auto ms = static_cast<int>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch())
          .count() %
      1000);
  std::tm tm_buf{};
#if defined(SLUICE_PLATFORM_WINDOWS)
  (void)localtime_s(&tm_buf, &secs);
#else
  (void)localtime_r(&secs, &tm_buf);
#endif
  char stamp[32];
  (void)std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

  auto& sink = detail::Sink();
  std::lock_guard<std::mutex> lk(sink.mtx);
  FILE* out = (sink.out != nullptr) ? sink.out : stderr;
  (void)std::fprintf(out, "[%s.%03d] [%c] [%s] %s (%s:%d)\n", stamp, ms,
                     detail::LevelTag(level),
                     (category != nullptr) ? category : "-", message,
                     detail::Basename(file), line);
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(out);
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
}  // namespace sluice

// ============================================================================
// Macros
// ============================================================================

#define SLUICE_LOG_DEBUG(cat, fmt, ...)                                      \
  do {                                                                       \
    if (SLUICE_LOG_MIN_LEVEL <= 0) {                                         \
      ::sluice::log::LogWrite(::sluice::log::Level::kDebug, cat, __FILE__,   \
                              __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                        \
  } while (0)

#define SLUICE_LOG_INFO(cat, fmt, ...)                                       \
  do {                                                                       \
    if (SLUICE_LOG_MIN_LEVEL <= 1) {                                         \
      ::sluice::log::LogWrite(::sluice::log::Level::kInfo, cat, __FILE__,    \
                              __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                        \
  } while (0)

#define SLUICE_LOG_WARN(cat, fmt, ...)                                       \
  do {                                                                       \
    if (SLUICE_LOG_MIN_LEVEL <= 2) {                                         \
      ::sluice::log::LogWrite(::sluice::log::Level::kWarn, cat, __FILE__,    \
                              __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                        \
  } while (0)

#define SLUICE_LOG_ERROR(cat, fmt, ...)                                      \
  do {                                                                       \
    if (SLUICE_LOG_MIN_LEVEL <= 3) {                                         \
      ::sluice::log::LogWrite(::sluice::log::Level::kError, cat, __FILE__,   \
                              __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                        \
  } while (0)

/// FATAL always writes and then aborts.
#define SLUICE_LOG_FATAL(cat, fmt, ...)                                      \
  do {                                                                       \
    ::sluice::log::LogWrite(::sluice::log::Level::kFatal, cat, __FILE__,     \
                            __LINE__, fmt, ##__VA_ARGS__);                   \
    std::abort();                                                            \
  } while (0)

#endif  // SLUICE_LOG_HPP_
