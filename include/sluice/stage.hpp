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
 * @file stage.hpp
 * @brief Concurrent pipeline stage: worker pool, intake and subscriber fan-out.
 *
 * Architecture:
 *   Data()/Error() -> intake Channel (unbuffered handoff)
 *                          |
 *                  Worker[0..N-1] -> Processor::Do (guarded)
 *                          | one Delivery per subscriber
 *                  fan-out Channel (bounded, fanout_queue_depth)
 *                          |
 *                  Dispatcher[0..M-1] -> subscriber->Data()/Error()
 *
 * Features:
 * - Workers start on construction
 * - Processor exceptions become FailureKind::kFault, the worker keeps going
 * - Bounded fan-out: M dispatcher threads, bounded delivery queue
 * - Cycle-free topology enforced at Subscribe()
 * - Idempotent Shutdown() that drains in-flight work before notifying
 *
 * Usage:
 *   sluice::StageConfig cfg;
 *   cfg.name = "parse";
 *   cfg.worker_num = 4;
 *
 *   auto stage = sluice::Stage::Create(cfg, sluice::MakeProcessor(
 *       [](const sluice::Context&, const sluice::Failure&, const sluice::Value& v) {
 *         return sluice::Ok(v);
 *       }));
 *   stage->Stream(next_stage);
 *   stage->Data(sluice::Context::Background(), std::any(1));
 *   stage->Shutdown();
 */

#ifndef SLUICE_STAGE_HPP_
#define SLUICE_STAGE_HPP_

#include "sluice/channel.hpp"
#include "sluice/config.hpp"
#include "sluice/context.hpp"
#include "sluice/failure.hpp"
#include "sluice/log.hpp"
#include "sluice/logger.hpp"
#include "sluice/notifier.hpp"
#include "sluice/processor.hpp"
#include "sluice/vocabulary.hpp"

#include <cstdint>
#include <cstdio>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

namespace sluice {

// ============================================================================
// StageConfig
// ============================================================================

static constexpr uint32_t kDefaultFanoutQueueDepth = 64U;

struct StageConfig {
  FixedString<32> name{"stage"};
  int32_t worker_num{1};          ///< <= 0 is clamped to 1.
  int32_t fanout_worker_num{1};   ///< <= 0 is clamped to 1.
  uint32_t fanout_queue_depth{kDefaultFanoutQueueDepth};  ///< 0 selects the default.
};

/**
 * @brief Read a StageConfig from @p section of @p store.
 *
 * Keys: name, workers, fanout_workers, fanout_queue_depth. Missing keys keep
 * the value from @p defaults.
 */
inline StageConfig LoadStageConfig(const ConfigStore& store, const char* section,
                                   const StageConfig& defaults = StageConfig{}) {
  StageConfig cfg = defaults;
  if (store.HasKey(section, "name")) {
    cfg.name.assign(TruncateToCapacity, store.GetString(section, "name"));
  }
  cfg.worker_num = store.GetInt(section, "workers", defaults.worker_num);
  cfg.fanout_worker_num = store.GetInt(section, "fanout_workers", defaults.fanout_worker_num);
  auto depth = store.FindInt(section, "fanout_queue_depth");
  if (depth.has_value() && depth.value() >= 0) {
    cfg.fanout_queue_depth = static_cast<uint32_t>(depth.value());
  }
  return cfg;
}

// ============================================================================
// StageError / StageState / StageStats
// ============================================================================

enum class StageError : uint8_t {
  kNullSubscriber = 0,
  kSelfSubscription,
  kCycleDetected,
  kNullUpstream
};

inline const char* StageErrorName(StageError err) noexcept {
  switch (err) {
    case StageError::kNullSubscriber:
      return "null subscriber";
    case StageError::kSelfSubscription:
      return "self subscription";
    case StageError::kCycleDetected:
      return "cycle detected";
    case StageError::kNullUpstream:
      return "null upstream";
    default:
      return "unknown";
  }
}

enum class StageState : uint8_t { kRunning = 0, kDraining, kClosed };

struct StageStats {
  uint32_t workers_running;  ///< Worker threads that have not exited yet.
  uint32_t total_workers;    ///< worker_num + fanout_worker_num.
  uint64_t pending;          ///< Submissions blocked in the intake handoff.
  uint64_t completed;        ///< Payloads processed, any outcome.
  uint64_t failed;           ///< Processor returned a failure.
  uint64_t faulted;          ///< Processor threw.
  uint64_t dropped;          ///< Submissions rejected because the stage closed.
  bool closed;
};

// ============================================================================
// Payload
// ============================================================================

/// Envelope handed from a submitter to exactly one worker.
struct Payload {
  Value value;
  Failure failure;
  Context context;
};

namespace detail {

/// Serialises every topology change so cycle checks see a stable graph.
inline std::mutex& TopologyMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline std::string MakeUuidV4() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  uint64_t hi = rng();
  uint64_t lo = rng();
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
  char buf[37];
  (void)std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<uint32_t>(hi >> 32),
                      static_cast<uint32_t>((hi >> 16) & 0xFFFFU), static_cast<uint32_t>(hi & 0xFFFFU),
                      static_cast<uint32_t>(lo >> 48), static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return std::string(buf);
}

}  // namespace detail

// ============================================================================
// Stage
// ============================================================================

class Stage final {
 public:
  using Ptr = std::shared_ptr<Stage>;

  /**
   * @brief Build a stage and start its workers.
   *
   * @param cfg       Worker counts and name.
   * @param processor Work executed per payload. A null processor is a
   *                  programming error and aborts the process in every build.
   * @param logger    Event sink; nullptr installs a NullLogger for this stage.
   */
  static Ptr Create(const StageConfig& cfg, std::shared_ptr<Processor> processor,
                    std::shared_ptr<Logger> logger = nullptr) {
    if (processor == nullptr) {
      SLUICE_LOG_FATAL("Stage", "stage '%s' constructed with a null processor", cfg.name.c_str());
    }
    if (logger == nullptr) {
      logger = std::make_shared<NullLogger>();
    }
    return Ptr(new Stage(cfg, std::move(processor), std::move(logger)));
  }

  ~Stage() { Shutdown(); }

  Stage(const Stage&) = delete;
  Stage& operator=(const Stage&) = delete;
  Stage(Stage&&) = delete;
  Stage& operator=(Stage&&) = delete;

  // ======================== Submission ========================

  /**
   * @brief Hand @p value to a worker, blocking until one takes it.
   *
   * Dropped (and counted) once the stage is closed.
   */
  void Data(const Context& ctx, Value value) { Submit(Payload{std::move(value), Failure(), ctx}); }

  /**
   * @brief Hand @p failure to a worker. An unset failure is sent as kUpstream.
   */
  void Error(const Context& ctx, Failure failure) {
    if (!failure.IsSet()) {
      failure = Failure(FailureKind::kUpstream, "unspecified failure");
    }
    Submit(Payload{Value(), std::move(failure), ctx});
  }

  // ======================== Topology ========================

  /**
   * @brief Register @p subscriber and return it for chaining.
   *
   * A rejected registration is logged and the subscriber is returned
   * unregistered.
   */
  Ptr Stream(Ptr subscriber) {
    auto r = Subscribe(subscriber);
    if (!r.has_value() && logger_->Enabled()) {
      logger_->Log(name_.c_str(), "stream_rejected", StageErrorName(r.get_error()), {{"id", id_}});
    }
    return subscriber;
  }

  /**
   * @brief Checked registration.
   * @return kNullSubscriber, kSelfSubscription or kCycleDetected on rejection.
   */
  expected<void, StageError> Subscribe(const Ptr& subscriber) {
    if (subscriber == nullptr) {
      return Reject(StageError::kNullSubscriber);
    }
    if (subscriber.get() == this) {
      return Reject(StageError::kSelfSubscription);
    }

    std::lock_guard<std::mutex> topo(detail::TopologyMutex());
    if (Reaches(subscriber.get(), this)) {
      return Reject(StageError::kCycleDetected);
    }
    {
      std::unique_lock<std::shared_mutex> lk(subscribers_mtx_);
      subscribers_.push_back(subscriber);
    }
    if (logger_->Enabled()) {
      logger_->Log(name_.c_str(), "subscribed", "subscriber registered",
                   {{"id", id_}, {"subscriber", subscriber->Id()}});
    }
    return expected<void, StageError>::success();
  }

  // ======================== Lifecycle ========================

  /**
   * @brief Stop intake, drain in-flight work, join every thread, then fire
   *        CloseNotify().
   *
   * Later calls wait for the first one to finish and return. Must not be
   * called from this stage's own processor.
   */
  void Shutdown() {
    bool expected_open = false;
    if (!closed_.compare_exchange_strong(expected_open, true)) {
      if (logger_->Enabled()) {
        logger_->Log(name_.c_str(), "shutdown", "previously done", {{"id", id_}});
      }
      close_notify_.Wait();
      return;
    }

    state_.store(StageState::kDraining, std::memory_order_release);
    if (logger_->Enabled()) {
      logger_->Log(name_.c_str(), "shutdown", "draining", {{"id", id_}});
    }

    auto closed = intake_.Close();
    SLUICE_ASSERT(closed.has_value());
    (void)closed;

    // Senders woken by the close return immediately.
    {
      std::unique_lock<std::mutex> lk(pending_mtx_);
      pending_cv_.wait(lk, [this] { return pending_.load() == 0U; });
    }

    for (auto& t : worker_threads_) {
      if (t.joinable()) {
        t.join();
      }
    }

    auto fanout_closed = fanout_.Close();
    SLUICE_ASSERT(fanout_closed.has_value());
    (void)fanout_closed;
    for (auto& t : dispatcher_threads_) {
      if (t.joinable()) {
        t.join();
      }
    }

    state_.store(StageState::kClosed, std::memory_order_release);
    if (logger_->Enabled()) {
      logger_->Log(name_.c_str(), "shutdown", "closed",
                   {{"id", id_}, {"completed", completed_.load(std::memory_order_relaxed)}});
    }
    (void)close_notify_.Fire();
  }

  /// Fires once, after the first Shutdown() has drained.
  const Notifier& CloseNotify() const noexcept { return close_notify_; }

  // ======================== Query ========================

  StageStats Stats() const noexcept {
    StageStats s;
    s.workers_running = workers_running_.load(std::memory_order_relaxed);
    s.total_workers = worker_num_ + fanout_worker_num_;
    s.pending = pending_.load(std::memory_order_relaxed);
    s.completed = completed_.load(std::memory_order_relaxed);
    s.failed = failed_.load(std::memory_order_relaxed);
    s.faulted = faulted_.load(std::memory_order_relaxed);
    s.dropped = dropped_.load(std::memory_order_relaxed);
    s.closed = closed_.load(std::memory_order_acquire);
    return s;
  }

  const std::string& Id() const noexcept { return id_; }
  const char* Name() const noexcept { return name_.c_str(); }
  uint32_t WorkerCount() const noexcept { return worker_num_; }
  StageState State() const noexcept { return state_.load(std::memory_order_acquire); }
  const std::shared_ptr<Logger>& GetLogger() const noexcept { return logger_; }

  uint32_t SubscriberCount() const {
    std::shared_lock<std::shared_mutex> lk(subscribers_mtx_);
    return static_cast<uint32_t>(subscribers_.size());
  }

 private:
  struct Delivery {
    Ptr target;
    Payload payload;
  };

  Stage(const StageConfig& cfg, std::shared_ptr<Processor> processor, std::shared_ptr<Logger> logger)
      : name_(cfg.name),
        id_(detail::MakeUuidV4()),
        worker_num_(cfg.worker_num > 0 ? static_cast<uint32_t>(cfg.worker_num) : 1U),
        fanout_worker_num_(cfg.fanout_worker_num > 0 ? static_cast<uint32_t>(cfg.fanout_worker_num) : 1U),
        processor_(std::move(processor)),
        logger_(std::move(logger)),
        fanout_(cfg.fanout_queue_depth > 0U ? cfg.fanout_queue_depth : kDefaultFanoutQueueDepth) {
    workers_running_.store(worker_num_, std::memory_order_relaxed);
    dispatcher_threads_.reserve(fanout_worker_num_);
    for (uint32_t i = 0U; i < fanout_worker_num_; ++i) {
      dispatcher_threads_.emplace_back(&Stage::DispatcherLoop, this);
    }
    worker_threads_.reserve(worker_num_);
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      worker_threads_.emplace_back(&Stage::WorkerLoop, this);
    }
    if (logger_->Enabled()) {
      logger_->Log(name_.c_str(), "started", "workers running",
                   {{"id", id_}, {"workers", worker_num_}, {"fanout_workers", fanout_worker_num_}});
    }
  }

  void Submit(Payload&& payload) {
    // pending_ is raised before the closed check so Shutdown() can wait it out.
    pending_.fetch_add(1U);
    if (closed_.load()) {
      ReleasePending();
      dropped_.fetch_add(1U, std::memory_order_relaxed);
      return;
    }
    auto r = intake_.Send(std::move(payload));
    ReleasePending();
    if (!r.has_value()) {
      dropped_.fetch_add(1U, std::memory_order_relaxed);
    }
  }

  /// Seq-cst pairs with the closed_ CAS in Shutdown(): one side always sees the other.
  void ReleasePending() {
    if (pending_.fetch_sub(1U) == 1U && closed_.load()) {
      std::lock_guard<std::mutex> lk(pending_mtx_);
      pending_cv_.notify_all();
    }
  }

  expected<void, StageError> Reject(StageError err) {
    if (logger_->Enabled()) {
      logger_->Error(name_.c_str(), "subscribe_rejected", Failure(FailureKind::kReported, StageErrorName(err)),
                     "subscription rejected", {{"id", id_}});
    }
    return expected<void, StageError>::error(err);
  }

  /// True when @p target is reachable from @p from. Caller holds TopologyMutex().
  static bool Reaches(const Stage* from, const Stage* target) {
    std::vector<const Stage*> stack{from};
    std::unordered_set<const Stage*> visited;
    while (!stack.empty()) {
      const Stage* s = stack.back();
      stack.pop_back();
      if (s == target) return true;
      if (!visited.insert(s).second) continue;
      std::shared_lock<std::shared_mutex> lk(s->subscribers_mtx_);
      for (const auto& sub : s->subscribers_) {
        stack.push_back(sub.get());
      }
    }
    return false;
  }

  // ======================== Worker thread ========================

  void WorkerLoop() {
    while (true) {
      auto r = intake_.Receive();
      if (!r.has_value()) {
        break;
      }
      Process(r.value());
    }
    workers_running_.fetch_sub(1U, std::memory_order_release);
  }

  void Process(const Payload& payload) {
    bool faulted = false;
    Result result = Invoke(payload, faulted);
    completed_.fetch_add(1U, std::memory_order_relaxed);

    if (result.has_value()) {
      Broadcast(payload.context, result.value(), Failure());
      return;
    }

    const Failure& failure = result.get_error();
    if (faulted) {
      faulted_.fetch_add(1U, std::memory_order_relaxed);
      if (logger_->Enabled()) {
        logger_->Error(name_.c_str(), "processor_fault", failure, "recovered from processor fault", {{"id", id_}});
      }
    } else {
      failed_.fetch_add(1U, std::memory_order_relaxed);
    }
    Broadcast(payload.context, Value(), failure);
  }

  /// The one call site of Processor::Do. Any exception becomes kFault; an
  /// unset returned failure becomes kReported.
  Result Invoke(const Payload& payload, bool& faulted) {
    try {
      Result r = processor_->Do(payload.context, payload.failure, payload.value);
      if (!r.has_value() && !r.get_error().IsSet()) {
        return Fail(Failure(FailureKind::kReported, "unspecified failure"));
      }
      return r;
    } catch (const std::exception& e) {
      faulted = true;
      return Fail(Failure(FailureKind::kFault, e.what()));
    } catch (...) {
      faulted = true;
      return Fail(Failure(FailureKind::kFault, "unknown exception"));
    }
  }

  /// Queues one delivery per subscriber. @p failure set selects the Error path.
  void Broadcast(const Context& ctx, const Value& value, const Failure& failure) {
    std::vector<Ptr> targets;
    {
      std::shared_lock<std::shared_mutex> lk(subscribers_mtx_);
      targets = subscribers_;
    }
    for (auto& target : targets) {
      Delivery d{std::move(target), Payload{failure.IsSet() ? Value() : value, failure, ctx}};
      auto r = fanout_.Send(std::move(d));
      if (!r.has_value() && logger_->Enabled()) {
        logger_->Error(name_.c_str(), "delivery_lost", Failure(FailureKind::kCancelled, "fan-out queue closed"),
                       "delivery dropped", {{"id", id_}});
      }
    }
  }

  // ======================== Dispatcher thread ========================

  void DispatcherLoop() {
    while (true) {
      auto r = fanout_.Receive();
      if (!r.has_value()) {
        break;
      }
      Delivery& d = r.value();
      if (d.payload.failure.IsSet()) {
        d.target->Error(d.payload.context, std::move(d.payload.failure));
      } else {
        d.target->Data(d.payload.context, std::move(d.payload.value));
      }
    }
  }

  FixedString<32> name_;
  std::string id_;
  uint32_t worker_num_;
  uint32_t fanout_worker_num_;
  std::shared_ptr<Processor> processor_;
  std::shared_ptr<Logger> logger_;

  Channel<Payload> intake_;
  Channel<Delivery> fanout_;
  Notifier close_notify_;

  mutable std::shared_mutex subscribers_mtx_;
  std::vector<Ptr> subscribers_;

  std::atomic<bool> closed_{false};
  std::atomic<StageState> state_{StageState::kRunning};
  std::atomic<uint32_t> workers_running_{0U};
  std::atomic<uint64_t> pending_{0U};
  std::mutex pending_mtx_;
  std::condition_variable pending_cv_;
  std::atomic<uint64_t> completed_{0U};
  std::atomic<uint64_t> failed_{0U};
  std::atomic<uint64_t> faulted_{0U};
  std::atomic<uint64_t> dropped_{0U};

  std::vector<std::thread> worker_threads_;
  std::vector<std::thread> dispatcher_threads_;
};

}  // namespace sluice

#endif  // SLUICE_STAGE_HPP_
