/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp types
 */

#include "sluice/vocabulary.hpp"

#include <catch2/catch.hpp>

#include <cstring>
#include <memory>
#include <string>
#include <utility>

namespace {

enum class TestError : uint8_t { kBad = 0, kWorse };

}  // namespace

// ============================================================================
// expected<V, E> tests
// ============================================================================

TEST_CASE("expected success path", "[vocabulary][expected]") {
  auto r = sluice::expected<int, TestError>::success(42);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42);
}

TEST_CASE("expected error path", "[vocabulary][expected]") {
  auto r = sluice::expected<int, TestError>::error(TestError::kWorse);
  REQUIRE(!r.has_value());
  REQUIRE(!static_cast<bool>(r));
  REQUIRE(r.get_error() == TestError::kWorse);
}

TEST_CASE("expected void specialization", "[vocabulary][expected]") {
  auto ok = sluice::expected<void, TestError>::success();
  REQUIRE(ok.has_value());

  auto err = sluice::expected<void, TestError>::error(TestError::kBad);
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error() == TestError::kBad);
}

TEST_CASE("expected value_or", "[vocabulary][expected]") {
  auto ok = sluice::expected<int, TestError>::success(10);
  REQUIRE(ok.value_or(99) == 10);

  auto err = sluice::expected<int, TestError>::error(TestError::kBad);
  REQUIRE(err.value_or(99) == 99);
}

TEST_CASE("expected copy/move", "[vocabulary][expected]") {
  auto r1 = sluice::expected<std::string, TestError>::success(std::string("seven"));
  auto r2 = r1;  // copy
  REQUIRE(r2.value() == "seven");

  auto r3 = std::move(r1);
  REQUIRE(r3.value() == "seven");

  r2 = sluice::expected<std::string, TestError>::error(TestError::kBad);
  REQUIRE(!r2.has_value());
  r2 = r3;
  REQUIRE(r2.value() == "seven");
}

TEST_CASE("expected holds move-only value", "[vocabulary][expected]") {
  auto r = sluice::expected<std::unique_ptr<int>, TestError>::success(std::make_unique<int>(5));
  REQUIRE(r.has_value());
  std::unique_ptr<int> p = std::move(r).value();
  REQUIRE(*p == 5);
}

TEST_CASE("expected with class error type", "[vocabulary][expected]") {
  auto r = sluice::expected<int, std::string>::error(std::string("boom"));
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == "boom");
}

// ============================================================================
// FixedString tests
// ============================================================================

TEST_CASE("FixedString default empty", "[vocabulary][fixed_string]") {
  sluice::FixedString<32> s;
  REQUIRE(s.empty());
  REQUIRE(s.size() == 0);
  REQUIRE(s.capacity() == 32);
}

TEST_CASE("FixedString from literal", "[vocabulary][fixed_string]") {
  sluice::FixedString<32> s("hello");
  REQUIRE(s.size() == 5);
  REQUIRE(s == "hello");
  REQUIRE(s != "world");
}

TEST_CASE("FixedString truncation", "[vocabulary][fixed_string]") {
  sluice::FixedString<5> s(sluice::TruncateToCapacity, "hello world");
  REQUIRE(s.size() == 5);
  REQUIRE(std::memcmp(s.c_str(), "hello", 5) == 0);
  REQUIRE(s.c_str()[5] == '\0');
}

TEST_CASE("FixedString assign", "[vocabulary][fixed_string]") {
  sluice::FixedString<32> s;
  s.assign(sluice::TruncateToCapacity, "test");
  REQUIRE(s.size() == 4);
  REQUIRE(s == "test");

  s.assign(sluice::TruncateToCapacity, nullptr);
  REQUIRE(s.empty());
}

TEST_CASE("FixedString clear", "[vocabulary][fixed_string]") {
  sluice::FixedString<32> s("data");
  s.clear();
  REQUIRE(s.empty());
  REQUIRE(std::strcmp(s.c_str(), "") == 0);
}

TEST_CASE("FixedString equality across capacities", "[vocabulary][fixed_string]") {
  sluice::FixedString<8> s1("abc");
  sluice::FixedString<32> s2("abc");
  sluice::FixedString<32> s3("abd");
  REQUIRE(s1 == s2);
  REQUIRE(s1 != s3);
}
