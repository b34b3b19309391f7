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
 * @file channel.hpp
 * @brief Blocking multi-producer multi-consumer channel.
 *
 * Capacity 0 gives an unbuffered handoff: Send() returns only once a receiver
 * has taken the item (or is about to). A positive capacity allows that many
 * items to wait in the queue.
 *
 * Usage:
 * @code
 *   sluice::Channel<int> ch;              // rendezvous
 *   std::thread rx([&] {
 *     while (true) {
 *       auto r = ch.Receive();
 *       if (!r.has_value()) break;        // closed and drained
 *       Use(r.value());
 *     }
 *   });
 *   (void)ch.Send(1);
 *   (void)ch.Close();
 *   rx.join();
 * @endcode
 */

#ifndef SLUICE_CHANNEL_HPP_
#define SLUICE_CHANNEL_HPP_

#include "sluice/vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace sluice {

// ============================================================================
// ChannelError
// ============================================================================

enum class ChannelError : uint8_t { kClosed = 0, kTimeout, kEmpty, kAlreadyClosed };

// ============================================================================
// Channel<T>
// ============================================================================

template <typename T>
class Channel final {
 public:
  explicit Channel(uint32_t capacity = 0U) noexcept : capacity_(capacity) {}

  ~Channel() = default;

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;
  Channel(Channel&&) = delete;
  Channel& operator=(Channel&&) = delete;

  // ==========================================================================
  // Producer side
  // ==========================================================================

  /**
   * @brief Block until the item is accepted or the channel closes.
   * @return kClosed if the channel was (or became) closed; the item is dropped.
   */
  expected<void, ChannelError> Send(T item) {
    std::unique_lock<std::mutex> lk(mtx_);
    send_cv_.wait(lk, [this] { return closed_ || HasRoom(); });
    if (closed_) {
      return expected<void, ChannelError>::error(ChannelError::kClosed);
    }
    queue_.push_back(std::move(item));
    lk.unlock();
    recv_cv_.notify_one();
    return expected<void, ChannelError>::success();
  }

  /**
   * @brief Stop accepting items and wake every blocked sender and receiver.
   *
   * Items already queued are still delivered to receivers.
   * @return kAlreadyClosed on every call after the first.
   */
  expected<void, ChannelError> Close() noexcept {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (closed_) {
        return expected<void, ChannelError>::error(ChannelError::kAlreadyClosed);
      }
      closed_ = true;
    }
    send_cv_.notify_all();
    recv_cv_.notify_all();
    return expected<void, ChannelError>::success();
  }

  // ==========================================================================
  // Consumer side
  // ==========================================================================

  /**
   * @brief Block until an item arrives or the channel is closed and empty.
   */
  expected<T, ChannelError> Receive() {
    std::unique_lock<std::mutex> lk(mtx_);
    ++waiting_receivers_;
    send_cv_.notify_one();
    recv_cv_.wait(lk, [this] { return closed_ || !queue_.empty(); });
    --waiting_receivers_;
    return PopLocked(lk);
  }

  /**
   * @brief Timed receive with microsecond timeout.
   */
  expected<T, ChannelError> ReceiveFor(uint64_t timeout_us) {
    std::unique_lock<std::mutex> lk(mtx_);
    ++waiting_receivers_;
    send_cv_.notify_one();
    bool ready = recv_cv_.wait_for(lk, std::chrono::microseconds(timeout_us),
                                   [this] { return closed_ || !queue_.empty(); });
    --waiting_receivers_;
    if (!ready) {
      return expected<T, ChannelError>::error(ChannelError::kTimeout);
    }
    return PopLocked(lk);
  }

  /**
   * @brief Take a queued item without blocking.
   * @return kEmpty if nothing is queued, kClosed if closed and drained.
   */
  expected<T, ChannelError> TryReceive() {
    std::unique_lock<std::mutex> lk(mtx_);
    if (queue_.empty()) {
      return expected<T, ChannelError>::error(closed_ ? ChannelError::kClosed : ChannelError::kEmpty);
    }
    return PopLocked(lk);
  }

  // ==========================================================================
  // Query
  // ==========================================================================

  bool IsClosed() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
  }

  uint32_t Size() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<uint32_t>(queue_.size());
  }

  uint32_t Capacity() const noexcept { return capacity_; }

 private:
  // A waiting receiver reserves one slot, so capacity 0 still admits a
  // handoff to a receiver that is already blocked.
  bool HasRoom() const noexcept {
    return queue_.size() < static_cast<size_t>(capacity_) + static_cast<size_t>(waiting_receivers_);
  }

  expected<T, ChannelError> PopLocked(std::unique_lock<std::mutex>& lk) {
    if (queue_.empty()) {
      return expected<T, ChannelError>::error(ChannelError::kClosed);
    }
    T item = std::move(queue_.front());
    queue_.pop_front();
    lk.unlock();
    send_cv_.notify_one();
    return expected<T, ChannelError>::success(std::move(item));
  }

  mutable std::mutex mtx_;
  std::condition_variable send_cv_;
  std::condition_variable recv_cv_;
  std::deque<T> queue_;
  uint32_t capacity_;
  uint32_t waiting_receivers_ = 0U;
  bool closed_ = false;
};

}  // namespace sluice

#endif  // SLUICE_CHANNEL_HPP_
