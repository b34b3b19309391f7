/**
 * @file test_config.cpp
 * @brief Tests for config.hpp and LoadStageConfig.
 */

#include "sluice/config.hpp"
#include "sluice/stage.hpp"

#include <catch2/catch.hpp>

#include <cstdio>
#include <cstring>

// ============================================================================
// Backend-independent Tests
// ============================================================================

TEST_CASE("Config empty store returns defaults", "[config]") {
  sluice::Config<sluice::IniBackend> cfg;
  REQUIRE(cfg.EntryCount() == 0);
  REQUIRE(std::strcmp(cfg.GetString("x", "y", "default"), "default") == 0);
  REQUIRE(cfg.GetInt("x", "y", 42) == 42);
  REQUIRE(cfg.GetBool("x", "y", true));
  REQUIRE(cfg.GetDouble("x", "y", 1.5) == 1.5);
  REQUIRE_FALSE(cfg.HasSection("x"));

  auto missing = cfg.FindInt("x", "y");
  REQUIRE(!missing.has_value());
  REQUIRE(missing.get_error() == sluice::ConfigError::kKeyNotFound);
  REQUIRE(cfg.FindBool("x", "y").get_error() == sluice::ConfigError::kKeyNotFound);
}

TEST_CASE("Config format not compiled in returns error", "[config]") {
  sluice::Config<sluice::JsonBackend> cfg;
  auto result = cfg.LoadBuffer("[s]\nk = v\n", 10, sluice::ConfigFormat::kIni);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == sluice::ConfigError::kFormatNotSupported);
}

TEST_CASE("LoadStageConfig keeps defaults for missing keys", "[config][stage]") {
  sluice::Config<sluice::IniBackend> cfg;
  sluice::StageConfig defaults;
  defaults.name = "fallback";
  defaults.worker_num = 3;

  auto sc = sluice::LoadStageConfig(cfg, "ingest", defaults);
  REQUIRE(sc.name == "fallback");
  REQUIRE(sc.worker_num == 3);
  REQUIRE(sc.fanout_worker_num == 1);
  REQUIRE(sc.fanout_queue_depth == sluice::kDefaultFanoutQueueDepth);
}

// ============================================================================
// INI Backend Tests
// ============================================================================

#ifdef SLUICE_CONFIG_INI_ENABLED

using IniCfg = sluice::Config<sluice::IniBackend>;

TEST_CASE("INI LoadBuffer basic", "[config][ini]") {
  const char* ini_data =
      "[ingest]\n"
      "workers = 4\n"
      "name = ingest\n"
      "[log]\n"
      "level = INFO\n";

  IniCfg cfg;
  auto result = cfg.LoadBuffer(ini_data, static_cast<uint32_t>(std::strlen(ini_data)), sluice::ConfigFormat::kIni);
  REQUIRE(result.has_value());

  REQUIRE(cfg.GetInt("ingest", "workers", 0) == 4);
  REQUIRE(std::strcmp(cfg.GetString("ingest", "name"), "ingest") == 0);
  REQUIRE(std::strcmp(cfg.GetString("log", "level"), "INFO") == 0);
}

TEST_CASE("INI GetBool", "[config][ini]") {
  const char* ini_data =
      "[flags]\n"
      "debug = true\n"
      "verbose = 1\n"
      "quiet = false\n"
      "enabled = yes\n"
      "active = on\n";

  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer(ini_data, static_cast<uint32_t>(std::strlen(ini_data)), sluice::ConfigFormat::kIni)
              .has_value());

  REQUIRE(cfg.GetBool("flags", "debug"));
  REQUIRE(cfg.GetBool("flags", "verbose"));
  REQUIRE_FALSE(cfg.GetBool("flags", "quiet"));
  REQUIRE(cfg.GetBool("flags", "enabled"));
  REQUIRE(cfg.GetBool("flags", "active"));
}

TEST_CASE("INI FindInt distinguishes missing and invalid", "[config][ini]") {
  const char* ini_data = "[data]\ncount = 100\nlabel = many\n";
  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer(ini_data, static_cast<uint32_t>(std::strlen(ini_data)), sluice::ConfigFormat::kIni)
              .has_value());

  auto found = cfg.FindInt("data", "count");
  REQUIRE(found.has_value());
  REQUIRE(found.value() == 100);

  auto missing = cfg.FindInt("data", "nope");
  REQUIRE(missing.get_error() == sluice::ConfigError::kKeyNotFound);

  auto invalid = cfg.FindInt("data", "label");
  REQUIRE(invalid.get_error() == sluice::ConfigError::kInvalidValue);
}

TEST_CASE("INI override on reload", "[config][ini]") {
  const char* ini1 = "[s]\nk = v1\n";
  const char* ini2 = "[s]\nk = v2\n";
  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer(ini1, static_cast<uint32_t>(std::strlen(ini1)), sluice::ConfigFormat::kIni).has_value());
  REQUIRE(cfg.LoadBuffer(ini2, static_cast<uint32_t>(std::strlen(ini2)), sluice::ConfigFormat::kIni).has_value());

  REQUIRE(std::strcmp(cfg.GetString("s", "k"), "v2") == 0);
  REQUIRE(cfg.EntryCount() == 1);
}

TEST_CASE("INI LoadFile nonexistent", "[config][ini]") {
  IniCfg cfg;
  auto result = cfg.LoadFile("/tmp/__nonexistent_file__.ini");
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == sluice::ConfigError::kFileNotFound);
}

TEST_CASE("INI LoadFile from disk", "[config][ini]") {
  const char* path = "/tmp/__sluice_test_config__.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, "[parse]\nworkers = 6\nfanout_workers = 2\nfanout_queue_depth = 16\nname = parser\n");
  std::fclose(f);

  IniCfg cfg;
  auto result = cfg.LoadFile(path);
  REQUIRE(result.has_value());

  auto sc = sluice::LoadStageConfig(cfg, "parse");
  REQUIRE(sc.name == "parser");
  REQUIRE(sc.worker_num == 6);
  REQUIRE(sc.fanout_worker_num == 2);
  REQUIRE(sc.fanout_queue_depth == 16U);

  std::remove(path);
}

TEST_CASE("INI case insensitive keys", "[config][ini]") {
  const char* ini_data = "[Ingest]\nWorkers = 8\n";
  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer(ini_data, static_cast<uint32_t>(std::strlen(ini_data)), sluice::ConfigFormat::kIni)
              .has_value());

  REQUIRE(cfg.GetInt("ingest", "workers", 0) == 8);
  REQUIRE(cfg.GetInt("INGEST", "WORKERS", 0) == 8);
  REQUIRE(cfg.HasSection("ingest"));
}

#endif  // SLUICE_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend Tests
// ============================================================================

#ifdef SLUICE_CONFIG_JSON_ENABLED

using JsonCfg = sluice::Config<sluice::JsonBackend>;

TEST_CASE("JSON LoadBuffer sections", "[config][json]") {
  const char* json_data = R"({
    "ingest": {
      "workers": 4,
      "name": "ingest"
    },
    "log_level": "warn"
  })";

  JsonCfg cfg;
  auto result = cfg.LoadBuffer(json_data, static_cast<uint32_t>(std::strlen(json_data)), sluice::ConfigFormat::kJson);
  REQUIRE(result.has_value());

  REQUIRE(cfg.GetInt("ingest", "workers", 0) == 4);
  REQUIRE(std::strcmp(cfg.GetString("ingest", "name"), "ingest") == 0);
  REQUIRE(std::strcmp(cfg.GetString("", "log_level"), "warn") == 0);
}

TEST_CASE("JSON boolean and numeric values", "[config][json]") {
  const char* json_data = R"({"flags": {"debug": true, "verbose": false}, "math": {"ratio": 0.5, "neg": -10}})";

  JsonCfg cfg;
  REQUIRE(cfg.LoadBuffer(json_data, static_cast<uint32_t>(std::strlen(json_data)), sluice::ConfigFormat::kJson)
              .has_value());

  REQUIRE(cfg.GetBool("flags", "debug"));
  REQUIRE_FALSE(cfg.GetBool("flags", "verbose"));
  REQUIRE(cfg.GetDouble("math", "ratio", 0.0) == 0.5);
  REQUIRE(cfg.GetInt("math", "neg", 0) == -10);
}

TEST_CASE("JSON parse error", "[config][json]") {
  const char* bad = "{not json";
  JsonCfg cfg;
  auto result = cfg.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)), sluice::ConfigFormat::kJson);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == sluice::ConfigError::kParseError);
}

TEST_CASE("JSON LoadFile auto-detects extension", "[config][json]") {
  const char* path = "/tmp/__sluice_test_config__.json";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, R"({"emit": {"workers": 2, "fanout_workers": 3}})");
  std::fclose(f);

  JsonCfg cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  auto sc = sluice::LoadStageConfig(cfg, "emit");
  REQUIRE(sc.worker_num == 2);
  REQUIRE(sc.fanout_worker_num == 3);

  std::remove(path);
}

#endif  // SLUICE_CONFIG_JSON_ENABLED
