/**
 * @file context.hpp
 * @brief Execution context: cancellation, deadline and request-scoped values.
 *
 * A Context is a cheap copyable handle onto an immutable chain of nodes. The
 * pipeline forwards it to processors untouched; processors that care about
 * timeouts poll IsExpired().
 *
 * Usage:
 * @code
 *   auto ctx = sluice::Context::Background()
 *                  .WithTimeout(std::chrono::milliseconds(200))
 *                  .WithValue("request_id", std::string("r-17"));
 *   stage->Data(ctx, std::any(42));
 * @endcode
 */

#ifndef SLUICE_CONTEXT_HPP_
#define SLUICE_CONTEXT_HPP_

#include <any>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace sluice {

class Context {
 public:
  using Clock = std::chrono::steady_clock;

  /// Root context. Never expires, carries no values.
  static Context Background() { return Context(); }

  Context() = default;

  /**
   * @brief Child that expires when Cancel() is called on it or any copy.
   */
  Context WithCancel() const {
    auto node = std::make_shared<Node>();
    node->parent = node_;
    return Context(std::move(node));
  }

  /**
   * @brief Child that expires @p timeout from now (or earlier via parent).
   */
  template <typename Rep, typename Period>
  Context WithTimeout(std::chrono::duration<Rep, Period> timeout) const {
    auto node = std::make_shared<Node>();
    node->parent = node_;
    node->has_deadline = true;
    node->deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(timeout);
    return Context(std::move(node));
  }

  Context WithValue(std::string key, std::any value) const {
    auto node = std::make_shared<Node>();
    node->parent = node_;
    node->has_value = true;
    node->key = std::move(key);
    node->value = std::move(value);
    return Context(std::move(node));
  }

  /// Cancels this context and every context derived from it. No-op on Background.
  void Cancel() const noexcept {
    if (node_ != nullptr) {
      node_->cancelled.store(true, std::memory_order_release);
    }
  }

  bool IsExpired() const noexcept {
    const auto now = Clock::now();
    for (const Node* n = node_.get(); n != nullptr; n = n->parent.get()) {
      if (n->cancelled.load(std::memory_order_acquire)) return true;
      if (n->has_deadline && now >= n->deadline) return true;
    }
    return false;
  }

  bool HasDeadline() const noexcept { return EarliestDeadline() != nullptr; }

  /**
   * @brief Time until the nearest deadline in the chain, zero once passed.
   *        Returns Clock::duration::max() when no deadline is set.
   */
  Clock::duration TimeRemaining() const noexcept {
    const Clock::time_point* dl = EarliestDeadline();
    if (dl == nullptr) return Clock::duration::max();
    const auto now = Clock::now();
    return (*dl > now) ? (*dl - now) : Clock::duration::zero();
  }

  /// Innermost value stored under @p key, nullptr if absent.
  const std::any* Get(const std::string& key) const noexcept {
    for (const Node* n = node_.get(); n != nullptr; n = n->parent.get()) {
      if (n->has_value && n->key == key) return &n->value;
    }
    return nullptr;
  }

 private:
  struct Node {
    std::shared_ptr<const Node> parent;
    mutable std::atomic<bool> cancelled{false};
    bool has_deadline = false;
    Clock::time_point deadline{};
    bool has_value = false;
    std::string key;
    std::any value;
  };

  explicit Context(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

  const Clock::time_point* EarliestDeadline() const noexcept {
    const Clock::time_point* best = nullptr;
    for (const Node* n = node_.get(); n != nullptr; n = n->parent.get()) {
      if (n->has_deadline && (best == nullptr || n->deadline < *best)) {
        best = &n->deadline;
      }
    }
    return best;
  }

  std::shared_ptr<const Node> node_;
};

}  // namespace sluice

#endif  // SLUICE_CONTEXT_HPP_
