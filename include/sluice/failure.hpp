/**
 * @file failure.hpp
 * @brief Error value carried along the error path of a pipeline.
 */

#ifndef SLUICE_FAILURE_HPP_
#define SLUICE_FAILURE_HPP_

#include <cstdint>

#include <string>
#include <utility>

namespace sluice {

enum class FailureKind : uint8_t {
  kNone = 0,
  kReported,   ///< Processor returned a failure.
  kFault,      ///< Processor threw.
  kCancelled,  ///< Work abandoned because its context expired.
  kUpstream    ///< Injected by a caller through Stage::Error.
};

inline const char* FailureKindName(FailureKind kind) noexcept {
  switch (kind) {
    case FailureKind::kNone:
      return "none";
    case FailureKind::kReported:
      return "reported";
    case FailureKind::kFault:
      return "fault";
    case FailureKind::kCancelled:
      return "cancelled";
    case FailureKind::kUpstream:
      return "upstream";
    default:
      return "unknown";
  }
}

/**
 * @brief Kind plus human-readable message.
 *
 * A default-constructed Failure means "no failure" and converts to false.
 */
class Failure {
 public:
  Failure() = default;
  Failure(FailureKind kind, std::string message) : kind_(kind), message_(std::move(message)) {}

  FailureKind Kind() const noexcept { return kind_; }
  const std::string& Message() const noexcept { return message_; }
  bool IsSet() const noexcept { return kind_ != FailureKind::kNone; }
  explicit operator bool() const noexcept { return IsSet(); }

  bool operator==(const Failure& other) const noexcept {
    return kind_ == other.kind_ && message_ == other.message_;
  }
  bool operator!=(const Failure& other) const noexcept { return !(*this == other); }

 private:
  FailureKind kind_ = FailureKind::kNone;
  std::string message_;
};

}  // namespace sluice

#endif  // SLUICE_FAILURE_HPP_
