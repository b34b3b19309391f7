// Copyright (c) 2024 liudegui. MIT License.
//
// config_demo.cpp -- Stages configured from an INI or JSON document.
//
// Usage: config_demo [path]
//   Without a path an embedded INI (or JSON) buffer is used. The file
//   describes one section per stage plus a top-level log level.

#include "sluice/combinators.hpp"
#include "sluice/config.hpp"
#include "sluice/log.hpp"
#include "sluice/logger.hpp"
#include "sluice/stage.hpp"

#include <any>
#include <cstdio>
#include <cstring>
#include <memory>
#include <thread>

#if defined(SLUICE_CONFIG_INI_ENABLED) && defined(SLUICE_CONFIG_JSON_ENABLED)
using DemoConfig = sluice::Config<sluice::IniBackend, sluice::JsonBackend>;
#elif defined(SLUICE_CONFIG_INI_ENABLED)
using DemoConfig = sluice::Config<sluice::IniBackend>;
#elif defined(SLUICE_CONFIG_JSON_ENABLED)
using DemoConfig = sluice::Config<sluice::JsonBackend>;
#endif

#if defined(SLUICE_CONFIG_INI_ENABLED) || defined(SLUICE_CONFIG_JSON_ENABLED)

#ifdef SLUICE_CONFIG_INI_ENABLED
static const char kEmbedded[] =
    "[pipeline]\n"
    "log_level = info\n"
    "[parse]\n"
    "name = parse\n"
    "workers = 4\n"
    "fanout_workers = 2\n"
    "fanout_queue_depth = 32\n";
static constexpr sluice::ConfigFormat kEmbeddedFormat = sluice::ConfigFormat::kIni;
#else
static const char kEmbedded[] =
    R"({"pipeline": {"log_level": "info"},
        "parse": {"name": "parse", "workers": 4, "fanout_workers": 2, "fanout_queue_depth": 32}})";
static constexpr sluice::ConfigFormat kEmbeddedFormat = sluice::ConfigFormat::kJson;
#endif

int main(int argc, char* argv[]) {
  DemoConfig cfg;
  auto loaded = (argc > 1) ? cfg.LoadFile(argv[1])
                           : cfg.LoadBuffer(kEmbedded, static_cast<uint32_t>(std::strlen(kEmbedded)),
                                            kEmbeddedFormat);
  if (!loaded.has_value()) {
    SLUICE_LOG_ERROR("Demo", "config load failed (error %u)", static_cast<unsigned>(loaded.get_error()));
    return 1;
  }

  sluice::log::SetLevel(sluice::log::ParseLevel(cfg.GetString("pipeline", "log_level", "info")));

  sluice::StageConfig defaults;
  defaults.name = "parse";
  sluice::StageConfig stage_cfg = sluice::LoadStageConfig(cfg, "parse", defaults);
  printf("stage '%s': workers=%d fanout_workers=%d fanout_queue_depth=%u\n", stage_cfg.name.c_str(),
         stage_cfg.worker_num, stage_cfg.fanout_worker_num, stage_cfg.fanout_queue_depth);

  auto stage = sluice::Do(
      nullptr, stage_cfg,
      [](const sluice::Context&, const sluice::Failure& in, const sluice::Value& v) -> sluice::Result {
        if (in) return sluice::Fail(in);
        return sluice::Ok(std::any_cast<int>(v) + 1);
      },
      std::make_shared<sluice::SinkLogger>());
  if (!stage.has_value()) {
    SLUICE_LOG_ERROR("Demo", "stage: %s", sluice::StageErrorName(stage.get_error()));
    return 1;
  }

  auto rx = sluice::Receive(stage.value());
  if (!rx.has_value()) {
    SLUICE_LOG_ERROR("Demo", "receive: %s", sluice::StageErrorName(rx.get_error()));
    return 1;
  }

  std::thread reader([&] {
    int count = 0;
    while (rx.value().Receive().has_value()) {
      ++count;
    }
    printf("received %d values\n", count);
  });

  for (int i = 0; i < 16; ++i) {
    stage.value()->Data(sluice::Context::Background(), i);
  }
  stage.value()->Shutdown();
  reader.join();
  return 0;
}

#else

int main() {
  printf("config_demo: no config backend compiled in (install inih or nlohmann_json)\n");
  return 0;
}

#endif
