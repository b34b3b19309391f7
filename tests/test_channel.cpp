/**
 * @file test_channel.cpp
 * @brief Tests for channel.hpp
 */

#include "sluice/channel.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

// ============================================================================
// Unbuffered (rendezvous)
// ============================================================================

TEST_CASE("Channel rendezvous send blocks until received", "[channel]") {
  sluice::Channel<int> ch;
  std::atomic<bool> sent{false};

  std::thread sender([&] { sent.store(ch.Send(5).has_value()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  REQUIRE_FALSE(sent.load());

  auto item = ch.Receive();
  sender.join();
  REQUIRE(item.has_value());
  REQUIRE(item.value() == 5);
  REQUIRE(sent.load());
}

TEST_CASE("Channel TryReceive on empty", "[channel]") {
  sluice::Channel<int> ch;
  auto r = ch.TryReceive();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == sluice::ChannelError::kEmpty);
}

TEST_CASE("Channel ReceiveFor times out", "[channel]") {
  sluice::Channel<int> ch;
  auto r = ch.ReceiveFor(5000);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == sluice::ChannelError::kTimeout);
}

// ============================================================================
// Close semantics
// ============================================================================

TEST_CASE("Channel close wakes blocked sender", "[channel]") {
  sluice::Channel<int> ch;
  std::atomic<int> result{-1};

  std::thread sender([&] {
    auto r = ch.Send(1);
    result.store(r.has_value() ? 0 : static_cast<int>(r.get_error()));
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  REQUIRE(ch.Close().has_value());
  sender.join();
  REQUIRE(result.load() == static_cast<int>(sluice::ChannelError::kClosed));
}

TEST_CASE("Channel close wakes blocked receiver", "[channel]") {
  sluice::Channel<std::string> ch;
  std::atomic<bool> closed_seen{false};

  std::thread receiver([&] {
    auto r = ch.Receive();
    closed_seen.store(!r.has_value() && r.get_error() == sluice::ChannelError::kClosed);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  REQUIRE(ch.Close().has_value());
  receiver.join();
  REQUIRE(closed_seen.load());
}

TEST_CASE("Channel second close reports already closed", "[channel]") {
  sluice::Channel<int> ch;
  REQUIRE(ch.Close().has_value());
  auto again = ch.Close();
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == sluice::ChannelError::kAlreadyClosed);
  REQUIRE(ch.IsClosed());
}

TEST_CASE("Channel send after close fails", "[channel]") {
  sluice::Channel<int> ch(4);
  REQUIRE(ch.Close().has_value());
  auto r = ch.Send(1);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == sluice::ChannelError::kClosed);
}

// ============================================================================
// Buffered
// ============================================================================

TEST_CASE("Channel buffered queued items drain after close", "[channel]") {
  sluice::Channel<int> ch(3);
  REQUIRE(ch.Capacity() == 3U);
  REQUIRE(ch.Send(1).has_value());
  REQUIRE(ch.Send(2).has_value());
  REQUIRE(ch.Send(3).has_value());
  REQUIRE(ch.Size() == 3U);
  REQUIRE(ch.Close().has_value());

  REQUIRE(ch.Receive().value() == 1);
  REQUIRE(ch.Receive().value() == 2);
  REQUIRE(ch.TryReceive().value() == 3);

  auto end = ch.Receive();
  REQUIRE(!end.has_value());
  REQUIRE(end.get_error() == sluice::ChannelError::kClosed);
  REQUIRE(ch.TryReceive().get_error() == sluice::ChannelError::kClosed);
}

TEST_CASE("Channel buffered send blocks when full", "[channel]") {
  sluice::Channel<int> ch(1);
  REQUIRE(ch.Send(1).has_value());

  std::atomic<bool> second_sent{false};
  std::thread sender([&] { second_sent.store(ch.Send(2).has_value()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  REQUIRE_FALSE(second_sent.load());

  REQUIRE(ch.Receive().value() == 1);
  sender.join();
  REQUIRE(second_sent.load());
  REQUIRE(ch.Receive().value() == 2);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("Channel multi producer multi consumer delivers everything", "[channel]") {
  sluice::Channel<int> ch;
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 250;
  std::atomic<long> sum{0};
  std::atomic<int> count{0};

  std::vector<std::thread> consumers;
  for (int c = 0; c < 3; ++c) {
    consumers.emplace_back([&] {
      while (true) {
        auto r = ch.Receive();
        if (!r.has_value()) break;
        sum.fetch_add(r.value());
        count.fetch_add(1);
      }
    });
  }

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        (void)ch.Send(p * kPerProducer + i);
      }
    });
  }
  for (auto& t : producers) {
    t.join();
  }
  REQUIRE(ch.Close().has_value());
  for (auto& t : consumers) {
    t.join();
  }

  constexpr int kTotal = kProducers * kPerProducer;
  REQUIRE(count.load() == kTotal);
  REQUIRE(sum.load() == static_cast<long>(kTotal) * (kTotal - 1) / 2);
}
