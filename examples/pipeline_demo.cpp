// Copyright (c) 2024 liudegui. MIT License.
//
// pipeline_demo.cpp -- Stage pipeline demo.
//
// Demonstrates:
//   1. Fan-out tree built with Identity / Do
//   2. Fault containment (a branch that throws on some inputs)
//   3. Draining results through Receive / ReceiveError
//   4. Context deadlines observed by a processor
//   5. Statistics after shutdown

#include "sluice/combinators.hpp"
#include "sluice/log.hpp"
#include "sluice/logger.hpp"
#include "sluice/stage.hpp"

#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <thread>

using sluice::Context;
using sluice::Failure;
using sluice::FailureKind;
using sluice::Result;
using sluice::Value;

static void PrintStats(const char* label, const sluice::Stage::Ptr& stage) {
  sluice::StageStats s = stage->Stats();
  printf("  %-8s workers=%u/%u completed=%llu failed=%llu faulted=%llu dropped=%llu\n", label,
         s.workers_running, s.total_workers, static_cast<unsigned long long>(s.completed),
         static_cast<unsigned long long>(s.failed), static_cast<unsigned long long>(s.faulted),
         static_cast<unsigned long long>(s.dropped));
}

int main() {
  sluice::log::Init();
  sluice::log::SetLevel(sluice::log::Level::kInfo);
  auto logger = std::make_shared<sluice::SinkLogger>();

  printf("\n=== Demo: fan-out tree ===\n");

  auto source = sluice::Identity(2, logger);

  // Branch 1: square the input.
  auto squares = sluice::Do(source, 4, [](const Context&, const Failure& in, const Value& v) -> Result {
    if (in) return sluice::Fail(in);
    int x = std::any_cast<int>(v);
    return sluice::Ok(x * x);
  });

  // Branch 2: rejects multiples of 5, blows up on multiples of 7.
  auto checked = sluice::Do(source, 2, [](const Context& ctx, const Failure& in, const Value& v) -> Result {
    if (in) return sluice::Fail(in);
    if (ctx.IsExpired()) return sluice::Fail(Failure(FailureKind::kCancelled, "deadline passed"));
    int x = std::any_cast<int>(v);
    if (x % 7 == 0) throw std::runtime_error("seven is unlucky");
    if (x % 5 == 0) return sluice::Fail("multiple of five");
    return sluice::Ok(x);
  });

  if (!squares.has_value() || !checked.has_value()) {
    SLUICE_LOG_ERROR("Demo", "failed to build branches");
    return 1;
  }

  auto square_rx = sluice::Receive(squares.value());
  auto checked_err = sluice::ReceiveError(checked.value());
  if (!square_rx.has_value() || !checked_err.has_value()) {
    SLUICE_LOG_ERROR("Demo", "failed to attach receivers");
    return 1;
  }

  std::atomic<long> square_sum{0};
  std::thread square_reader([&] {
    while (true) {
      auto item = square_rx.value().Receive();
      if (!item.has_value()) break;
      square_sum.fetch_add(std::any_cast<int>(item.value()));
    }
  });
  std::thread error_reader([&] {
    while (true) {
      auto f = checked_err.value().Receive();
      if (!f.has_value()) break;
      printf("  error  kind=%-9s message=%s\n", sluice::FailureKindName(f.value().Kind()),
             f.value().Message().c_str());
    }
  });

  auto ctx = Context::Background().WithTimeout(std::chrono::seconds(5));
  for (int i = 1; i <= 20; ++i) {
    source->Data(ctx, i);
  }

  source->Shutdown();
  squares.value()->Shutdown();
  checked.value()->Shutdown();
  square_reader.join();
  error_reader.join();

  printf("  sum of squares 1..20 = %ld\n", square_sum.load());
  printf("\n=== Statistics ===\n");
  PrintStats("head", source);
  PrintStats("squares", squares.value());
  PrintStats("checked", checked.value());

  // Submissions after shutdown are dropped, never an error.
  source->Data(ctx, 99);
  PrintStats("head", source);

  sluice::log::Shutdown();
  return 0;
}
