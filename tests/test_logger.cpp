/**
 * @file test_logger.cpp
 * @brief Tests for logger.hpp
 */

#include "sluice/logger.hpp"

#include <catch2/catch.hpp>

#include <cstdio>
#include <string>

namespace {

std::string ReadAll(FILE* f) {
  std::string out;
  std::fflush(f);
  std::rewind(f);
  char buf[512];
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
    out.append(buf, n);
  }
  return out;
}

}  // namespace

TEST_CASE("Field converts values to text", "[logger]") {
  sluice::Field s("name", "ingest");
  REQUIRE(s.key == "name");
  REQUIRE(s.value == "ingest");

  sluice::Field str("id", std::string("abc"));
  REQUIRE(str.value == "abc");

  sluice::Field i("workers", 4);
  REQUIRE(i.value == "4");

  sluice::Field u("count", static_cast<uint64_t>(12345678901ULL));
  REQUIRE(u.value == "12345678901");

  sluice::Field b("closed", true);
  REQUIRE(b.value == "true");

  sluice::Field null_str("empty", static_cast<const char*>(nullptr));
  REQUIRE(null_str.value.empty());
}

TEST_CASE("NullLogger is disabled and silent", "[logger]") {
  sluice::NullLogger logger;
  REQUIRE_FALSE(logger.Enabled());
  logger.Log("c", "e", "message", {{"k", 1}});
  logger.Error("c", "e", sluice::Failure(sluice::FailureKind::kFault, "x"), "message", {});
}

TEST_CASE("SinkLogger writes events to the process sink", "[logger]") {
  FILE* f = std::tmpfile();
  REQUIRE(f != nullptr);
  sluice::log::Init(f);
  sluice::log::SetLevel(sluice::log::Level::kDebug);

  sluice::SinkLogger logger;
  REQUIRE(logger.Enabled());
  logger.Log("ingest", "started", "workers running", {{"workers", 4}, {"id", "abc"}});
  logger.Error("ingest", "processor_fault", sluice::Failure(sluice::FailureKind::kFault, "boom"), "recovered", {});

  sluice::log::Shutdown();
  std::string text = ReadAll(f);
  std::fclose(f);

  REQUIRE(text.find("[D] [ingest] started: workers running workers=4 id=abc") != std::string::npos);
  REQUIRE(text.find("[E] [ingest] processor_fault: recovered failure=fault(boom)") != std::string::npos);
}

TEST_CASE("SinkLogger respects the sink level", "[logger]") {
  FILE* f = std::tmpfile();
  REQUIRE(f != nullptr);
  sluice::log::Init(f);
  sluice::log::SetLevel(sluice::log::Level::kInfo);

  sluice::SinkLogger logger;
  logger.Log("ingest", "started", "hidden", {});
  logger.Error("ingest", "fault", sluice::Failure(sluice::FailureKind::kReported, "shown"), "visible", {});

  sluice::log::SetLevel(sluice::log::Level::kDebug);
  sluice::log::Shutdown();
  std::string text = ReadAll(f);
  std::fclose(f);

  REQUIRE(text.find("hidden") == std::string::npos);
  REQUIRE(text.find("visible failure=reported(shown)") != std::string::npos);
}
