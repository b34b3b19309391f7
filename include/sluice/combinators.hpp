/**
 * @file combinators.hpp
 * @brief Shorthand stage builders and the blocking-channel bridge.
 *
 * Usage:
 * @code
 *   auto head = sluice::Identity(2);
 *   auto twice = sluice::Do(head, 4, [](const sluice::Context&, const sluice::Failure& in,
 *                                       const sluice::Value& v) -> sluice::Result {
 *     if (in) return sluice::Fail(in);
 *     return sluice::Ok(std::any_cast<int>(v) * 2);
 *   }).value();
 *
 *   auto rx = sluice::Receive(twice);
 *   std::thread consumer([&] {
 *     while (true) {
 *       auto item = rx.value().Receive();
 *       if (!item.has_value()) break;  // channel closed
 *     }
 *   });
 *   head->Data(sluice::Context::Background(), 21);
 *   head->Shutdown();
 *   twice->Shutdown();
 *   consumer.join();
 * @endcode
 */

#ifndef SLUICE_COMBINATORS_HPP_
#define SLUICE_COMBINATORS_HPP_

#include "sluice/channel.hpp"
#include "sluice/notifier.hpp"
#include "sluice/processor.hpp"
#include "sluice/stage.hpp"
#include "sluice/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <memory>
#include <thread>
#include <utility>

namespace sluice {

// ============================================================================
// Do / Identity
// ============================================================================

/**
 * @brief Build a stage from @p fn and subscribe it to @p upstream (if any).
 *
 * A null @p logger inherits the upstream's logger. An empty @p fn aborts,
 * like any null processor.
 */
inline expected<Stage::Ptr, StageError> Do(const Stage::Ptr& upstream, const StageConfig& cfg, ProcessorFn fn,
                                           std::shared_ptr<Logger> logger = nullptr) {
  if (logger == nullptr && upstream != nullptr) {
    logger = upstream->GetLogger();
  }
  Stage::Ptr stage = Stage::Create(cfg, MakeProcessor(std::move(fn)), std::move(logger));
  if (upstream != nullptr) {
    auto sub = upstream->Subscribe(stage);
    if (!sub.has_value()) {
      stage->Shutdown();
      return expected<Stage::Ptr, StageError>::error(sub.get_error());
    }
  }
  return expected<Stage::Ptr, StageError>::success(std::move(stage));
}

inline expected<Stage::Ptr, StageError> Do(const Stage::Ptr& upstream, int32_t workers, ProcessorFn fn,
                                           std::shared_ptr<Logger> logger = nullptr) {
  StageConfig cfg;
  cfg.name = "do";
  cfg.worker_num = workers;
  return Do(upstream, cfg, std::move(fn), std::move(logger));
}

/// Pass-through tap: values stay values, failures stay failures.
inline Stage::Ptr Identity(int32_t workers, std::shared_ptr<Logger> logger = nullptr) {
  StageConfig cfg;
  cfg.name = "identity";
  cfg.worker_num = workers;
  return Stage::Create(cfg,
                       MakeProcessor([](const Context&, const Failure& in, const Value& v) -> Result {
                         if (in.IsSet()) return Fail(in);
                         return Ok(v);
                       }),
                       std::move(logger));
}

// ============================================================================
// Receiver<T>
// ============================================================================

/**
 * @brief Synchronous read side of a stage.
 *
 * Owns a single-worker bridge stage subscribed to the upstream and a watcher
 * thread. The watcher sleeps until the upstream's CloseNotify() fires or the
 * receiver is torn down. On upstream close it shuts the bridge down (so
 * everything in flight reaches the channel) and then closes the channel,
 * which ends Receive() loops with ChannelError::kClosed.
 *
 * Items are handed off unbuffered: keep a consumer running while the
 * upstream shuts down, or the drain waits for one.
 */
template <typename T>
class Receiver final {
 public:
  /// Picks the item to forward; false skips the payload.
  using Selector = bool (*)(const Failure& in, const Value& value, T& out);

  static expected<Receiver, StageError> Attach(const Stage::Ptr& upstream, const char* name, Selector select) {
    if (upstream == nullptr) {
      return expected<Receiver, StageError>::error(StageError::kNullUpstream);
    }

    auto channel = std::make_shared<Channel<T>>();
    StageConfig cfg;
    cfg.name.assign(TruncateToCapacity, name);
    cfg.worker_num = 1;
    auto forward = MakeProcessor([channel, select](const Context&, const Failure& in, const Value& v) -> Result {
      T item{};
      if (!select(in, v, item)) return Ok(Value());
      auto sent = channel->Send(std::move(item));
      if (!sent.has_value()) {
        return Fail(Failure(FailureKind::kCancelled, "receiver closed"));
      }
      return Ok(Value());
    });
    Stage::Ptr bridge = Stage::Create(cfg, std::move(forward), upstream->GetLogger());

    auto sub = upstream->Subscribe(bridge);
    if (!sub.has_value()) {
      bridge->Shutdown();
      return expected<Receiver, StageError>::error(sub.get_error());
    }
    return expected<Receiver, StageError>::success(Receiver(upstream, std::move(bridge), std::move(channel)));
  }

  Receiver(Receiver&& other) noexcept = default;

  Receiver& operator=(Receiver&& other) {
    if (this != &other) {
      Stop();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  Receiver(const Receiver&) = delete;
  Receiver& operator=(const Receiver&) = delete;

  ~Receiver() { Stop(); }

  /// Blocks for the next item; kClosed once the upstream has closed and drained.
  expected<T, ChannelError> Receive() { return state_->channel->Receive(); }

  expected<T, ChannelError> ReceiveFor(uint64_t timeout_us) { return state_->channel->ReceiveFor(timeout_us); }

  expected<T, ChannelError> TryReceive() { return state_->channel->TryReceive(); }

  bool IsClosed() const noexcept { return state_->channel->IsClosed(); }

  const Stage::Ptr& Bridge() const noexcept { return state_->bridge; }

 private:
  struct State {
    Stage::Ptr upstream;
    Stage::Ptr bridge;
    std::shared_ptr<Channel<T>> channel;
    std::shared_ptr<Notifier> wake;  ///< Fired by upstream close or by Stop().
    std::atomic<bool> stop{false};
    std::thread watcher;
  };

  Receiver(Stage::Ptr upstream, Stage::Ptr bridge, std::shared_ptr<Channel<T>> channel)
      : state_(std::make_unique<State>()) {
    state_->upstream = std::move(upstream);
    state_->bridge = std::move(bridge);
    state_->channel = std::move(channel);
    state_->wake = std::make_shared<Notifier>();
    // The callback owns its own reference: the upstream may outlive this receiver.
    std::shared_ptr<Notifier> wake = state_->wake;
    state_->upstream->CloseNotify().OnFire([wake] { (void)wake->Fire(); });
    state_->watcher = std::thread(&Receiver::Watch, state_.get());
  }

  static void Watch(State* s) {
    s->wake->Wait();
    if (s->stop.load(std::memory_order_acquire)) {
      return;
    }
    s->bridge->Shutdown();
    // kAlreadyClosed when Stop() got there first.
    (void)s->channel->Close();
  }

  /// Early teardown: close the channel first so a blocked bridge worker returns.
  void Stop() {
    if (state_ == nullptr) {
      return;
    }
    state_->stop.store(true, std::memory_order_release);
    // kAlreadyClosed when the upstream closed first.
    (void)state_->channel->Close();
    (void)state_->wake->Fire();
    if (state_->watcher.joinable()) {
      state_->watcher.join();
    }
    state_->bridge->Shutdown();
    state_.reset();
  }

  std::unique_ptr<State> state_;
};

/// Bridge successful values of @p upstream onto a blocking channel.
inline expected<Receiver<Value>, StageError> Receive(const Stage::Ptr& upstream) {
  return Receiver<Value>::Attach(upstream, "receive", [](const Failure& in, const Value& v, Value& out) {
    if (in.IsSet()) return false;
    out = v;
    return true;
  });
}

/// Bridge failures of @p upstream onto a blocking channel.
inline expected<Receiver<Failure>, StageError> ReceiveError(const Stage::Ptr& upstream) {
  return Receiver<Failure>::Attach(upstream, "receive_error", [](const Failure& in, const Value&, Failure& out) {
    if (!in.IsSet()) return false;
    out = in;
    return true;
  });
}

}  // namespace sluice

#endif  // SLUICE_COMBINATORS_HPP_
