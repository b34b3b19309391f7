/**
 * @file vocabulary.hpp
 * @brief Error-returning result type and fixed-capacity string.
 *
 * expected<V, E> is the library-wide way to report failure from an
 * operation: nothing in the public API throws. FixedString<N> holds short
 * identifiers (stage names) without heap allocation.
 */

#ifndef SLUICE_VOCABULARY_HPP_
#define SLUICE_VOCABULARY_HPP_

#include "sluice/platform.hpp"

#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace sluice {

namespace detail {

struct ValueTag {};
struct ErrorTag {};

}  // namespace detail

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Built only through success() / error(). V may be move-only.
 *
 * Usage:
 * @code
 *   sluice::expected<int, MyError> Parse(const char* s) {
 *     if (s == nullptr) return sluice::expected<int, MyError>::error(MyError::kNull);
 *     return sluice::expected<int, MyError>::success(42);
 *   }
 * @endcode
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& value) {
    return expected(detail::ValueTag{}, value);
  }
  static expected success(V&& value) {
    return expected(detail::ValueTag{}, std::move(value));
  }
  static expected error(const E& err) { return expected(detail::ErrorTag{}, err); }
  static expected error(E&& err) {
    return expected(detail::ErrorTag{}, std::move(err));
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.value)) V(other.storage_.value);
    } else {
      ::new (static_cast<void*>(&storage_.err)) E(other.storage_.err);
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.value)) V(std::move(other.storage_.value));
    } else {
      ::new (static_cast<void*>(&storage_.err)) E(std::move(other.storage_.err));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&storage_.value)) V(other.storage_.value);
      } else {
        ::new (static_cast<void*>(&storage_.err)) E(other.storage_.err);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&storage_.value)) V(std::move(other.storage_.value));
      } else {
        ::new (static_cast<void*>(&storage_.err)) E(std::move(other.storage_.err));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    SLUICE_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    SLUICE_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    SLUICE_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  const E& get_error() const& {
    SLUICE_ASSERT(!has_value_);
    return storage_.err;
  }

  template <typename U>
  V value_or(U&& default_value) const& {
    return has_value_ ? storage_.value : static_cast<V>(std::forward<U>(default_value));
  }

 private:
  template <typename... Args>
  expected(detail::ValueTag, Args&&... args) : has_value_(true) {
    ::new (static_cast<void*>(&storage_.value)) V(std::forward<Args>(args)...);
  }

  template <typename... Args>
  expected(detail::ErrorTag, Args&&... args) : has_value_(false) {
    ::new (static_cast<void*>(&storage_.err)) E(std::forward<Args>(args)...);
  }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    } else {
      storage_.err.~E();
    }
  }

  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

// ============================================================================
// expected<void, E>
// ============================================================================

template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(); }
  static expected error(const E& err) { return expected(err); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const& {
    SLUICE_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_(), has_value_(true) {}
  explicit expected(const E& err) : err_(err), has_value_(false) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/// @brief Tag selecting the truncating FixedString constructor.
struct TruncateToCapacity_t {
  explicit TruncateToCapacity_t() = default;
};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Null-terminated string stored inline, at most Capacity chars.
 *
 * String literals longer than Capacity are rejected at compile time; runtime
 * strings must go through the TruncateToCapacity overloads.
 */
template <uint32_t Capacity>
class FixedString {
 public:
  FixedString() noexcept : size_(0U) { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&str)[N]) noexcept : size_(N - 1U) {  // NOLINT
    static_assert(N - 1U <= Capacity, "String literal exceeds FixedString capacity");
    std::memcpy(buf_, str, N - 1U);
    buf_[size_] = '\0';
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0U) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t count) noexcept
      : size_(0U) {
    assign(TruncateToCapacity, str, count);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    assign(TruncateToCapacity, str,
           (str == nullptr) ? 0U : static_cast<uint32_t>(std::strlen(str)));
  }

  void assign(TruncateToCapacity_t, const char* str, uint32_t count) noexcept {
    if (str == nullptr) {
      count = 0U;
    }
    size_ = (count > Capacity) ? Capacity : count;
    if (size_ > 0U) {
      std::memcpy(buf_, str, size_);
    }
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  bool empty() const noexcept { return size_ == 0U; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  template <uint32_t M>
  bool operator==(const FixedString<M>& other) const noexcept {
    return size_ == other.size() && std::memcmp(buf_, other.c_str(), size_) == 0;
  }

  template <uint32_t M>
  bool operator!=(const FixedString<M>& other) const noexcept {
    return !(*this == other);
  }

  bool operator==(const char* str) const noexcept {
    return str != nullptr && std::strcmp(buf_, str) == 0;
  }

  bool operator!=(const char* str) const noexcept { return !(*this == str); }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_;
};

}  // namespace sluice

#endif  // SLUICE_VOCABULARY_HPP_
