/**
 * @file notifier.hpp
 * @brief One-shot event that any number of threads can wait on.
 */

#ifndef SLUICE_NOTIFIER_HPP_
#define SLUICE_NOTIFIER_HPP_

#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace sluice {

/**
 * @brief Latched flag: once fired it stays fired and releases every waiter.
 *
 * Usage:
 * @code
 *   stage->CloseNotify().Wait();
 * @endcode
 */
class Notifier final {
 public:
  Notifier() = default;
  ~Notifier() = default;

  Notifier(const Notifier&) = delete;
  Notifier& operator=(const Notifier&) = delete;
  Notifier(Notifier&&) = delete;
  Notifier& operator=(Notifier&&) = delete;

  /**
   * @brief Fire and wake all waiters.
   * @return true for the call that actually fired, false afterwards.
   */
  bool Fire() noexcept {
    std::vector<std::function<void()>> callbacks;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (fired_) return false;
      fired_ = true;
      callbacks.swap(callbacks_);
    }
    cv_.notify_all();
    for (auto& cb : callbacks) {
      cb();
    }
    return true;
  }

  /**
   * @brief Run @p cb once the notifier fires, on the firing thread.
   *
   * Runs @p cb immediately on the caller's thread if already fired.
   * @p cb must not throw.
   */
  void OnFire(std::function<void()> cb) const {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (!fired_) {
        callbacks_.push_back(std::move(cb));
        return;
      }
    }
    cb();
  }

  bool IsFired() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return fired_;
  }

  void Wait() const noexcept {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return fired_; });
  }

  /**
   * @brief Timed wait with microsecond timeout.
   * @return true if fired before the timeout.
   */
  bool WaitFor(uint64_t timeout_us) const noexcept {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, std::chrono::microseconds(timeout_us), [this] { return fired_; });
  }

 private:
  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;
  mutable std::vector<std::function<void()>> callbacks_;
  bool fired_ = false;
};

}  // namespace sluice

#endif  // SLUICE_NOTIFIER_HPP_
