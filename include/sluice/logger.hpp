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
 * @file logger.hpp
 * @brief Structured per-stage event logger.
 *
 * Stages report lifecycle and failure events through a Logger injected at
 * construction. Two implementations ship with the library:
 *   - NullLogger: drops everything, the per-stage default.
 *   - SinkLogger: forwards into the process sink of log.hpp.
 *
 * Implementations must not throw and should not block for long; a Logger is
 * called from worker threads on the hot path.
 */

#ifndef SLUICE_LOGGER_HPP_
#define SLUICE_LOGGER_HPP_

#include "sluice/failure.hpp"
#include "sluice/log.hpp"

#include <cstdio>

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace sluice {

// ============================================================================
// Field
// ============================================================================

/**
 * @brief One key/value pair attached to a log event.
 */
struct Field {
  std::string key;
  std::string value;

  Field(std::string k, std::string v) : key(std::move(k)), value(std::move(v)) {}
  Field(std::string k, const char* v) : key(std::move(k)), value(v != nullptr ? v : "") {}

  template <typename T, typename = typename std::enable_if<std::is_arithmetic<T>::value>::type>
  Field(std::string k, T v) : key(std::move(k)), value(ToString(v)) {}

 private:
  static std::string ToString(bool v) { return v ? "true" : "false"; }

  template <typename T>
  static std::string ToString(T v) {
    return std::to_string(v);
  }
};

using Fields = std::vector<Field>;

// ============================================================================
// Logger
// ============================================================================

class Logger {
 public:
  virtual ~Logger() = default;

  /// Informational event.
  virtual void Log(const char* component, const char* event, const std::string& message,
                   const Fields& fields) noexcept = 0;

  /// Failure event.
  virtual void Error(const char* component, const char* event, const Failure& failure, const std::string& message,
                     const Fields& fields) noexcept = 0;

  /// False when every call would be discarded; callers skip building fields.
  virtual bool Enabled() const noexcept { return true; }
};

// ============================================================================
// NullLogger
// ============================================================================

class NullLogger final : public Logger {
 public:
  void Log(const char*, const char*, const std::string&, const Fields&) noexcept override {}
  void Error(const char*, const char*, const Failure&, const std::string&, const Fields&) noexcept override {}
  bool Enabled() const noexcept override { return false; }
};

// ============================================================================
// SinkLogger
// ============================================================================

/**
 * @brief Writes events to the process sink as "event: message key=value ...".
 *
 * Log() goes out at DEBUG, Error() at ERROR with the failure kind and message
 * appended.
 */
class SinkLogger final : public Logger {
 public:
  void Log(const char* component, const char* event, const std::string& message,
           const Fields& fields) noexcept override {
    if (log::GetLevel() > log::Level::kDebug) return;
    char line[384];
    Format(line, sizeof(line), event, message, fields);
    SLUICE_LOG_DEBUG(component, "%s", line);
  }

  void Error(const char* component, const char* event, const Failure& failure, const std::string& message,
             const Fields& fields) noexcept override {
    if (log::GetLevel() > log::Level::kError) return;
    char line[384];
    size_t n = Format(line, sizeof(line), event, message, fields);
    if (n < sizeof(line)) {
      (void)std::snprintf(line + n, sizeof(line) - n, " failure=%s(%s)", FailureKindName(failure.Kind()),
                          failure.Message().c_str());
    }
    SLUICE_LOG_ERROR(component, "%s", line);
  }

 private:
  static size_t Format(char* buf, size_t size, const char* event, const std::string& message,
                       const Fields& fields) noexcept {
    int w = std::snprintf(buf, size, "%s: %s", event != nullptr ? event : "-", message.c_str());
    size_t n = (w < 0) ? 0U : static_cast<size_t>(w);
    for (const auto& f : fields) {
      if (n >= size) break;
      w = std::snprintf(buf + n, size - n, " %s=%s", f.key.c_str(), f.value.c_str());
      if (w < 0) break;
      n += static_cast<size_t>(w);
    }
    return (n < size) ? n : size;
  }
};

}  // namespace sluice

#endif  // SLUICE_LOGGER_HPP_
