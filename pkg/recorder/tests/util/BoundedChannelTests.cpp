// Repository: Capkit-recorder
// Component: BoundedChannel Tests
// Purpose: FIFO order, capacity blocking and close/drain semantics of the
//          channel every pipeline stage is connected through.
// Copyright (c) 2025 Capkit

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "capkit/util/BoundedChannel.hpp"

namespace capkit::tests {
namespace {

using util::BoundedChannel;

TEST(BoundedChannelTest, DeliversInFifoOrder) {
  BoundedChannel<int> ch(4);
  ASSERT_TRUE(ch.Send(1));
  ASSERT_TRUE(ch.Send(2));
  ASSERT_TRUE(ch.Send(3));

  EXPECT_EQ(ch.Recv(), 1);
  EXPECT_EQ(ch.Recv(), 2);
  EXPECT_EQ(ch.Recv(), 3);
  EXPECT_EQ(ch.Size(), 0u);
}

TEST(BoundedChannelTest, TrySendFailsWhenFull) {
  BoundedChannel<int> ch(2);
  EXPECT_TRUE(ch.TrySend(1));
  EXPECT_TRUE(ch.TrySend(2));
  EXPECT_FALSE(ch.TrySend(3));
  EXPECT_EQ(ch.Size(), 2u);
}

TEST(BoundedChannelTest, SendForTimesOutWhenFull) {
  BoundedChannel<int> ch(1);
  ASSERT_TRUE(ch.Send(1));
  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_FALSE(ch.SendFor(2, std::chrono::milliseconds(20)));
  EXPECT_GE(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(15));
}

TEST(BoundedChannelTest, ZeroCapacityBecomesOne) {
  BoundedChannel<int> ch(0);
  EXPECT_EQ(ch.Capacity(), 1u);
  EXPECT_TRUE(ch.TrySend(7));
  EXPECT_FALSE(ch.TrySend(8));
}

// -----------------------------------------------------------------------------
// Close semantics
// -----------------------------------------------------------------------------

TEST(BoundedChannelTest, CloseLetsReceiverDrainQueuedItems) {
  BoundedChannel<int> ch(4);
  ch.Send(10);
  ch.Send(11);
  ch.Close();

  EXPECT_TRUE(ch.IsClosed());
  EXPECT_FALSE(ch.IsDrained());
  EXPECT_EQ(ch.Recv(), 10);
  EXPECT_EQ(ch.TryRecv(), 11);
  EXPECT_TRUE(ch.IsDrained());
  EXPECT_EQ(ch.Recv(), std::nullopt);
}

TEST(BoundedChannelTest, SendAfterCloseFails) {
  BoundedChannel<int> ch(4);
  ch.Close();
  EXPECT_FALSE(ch.Send(1));
  EXPECT_FALSE(ch.TrySend(1));
  EXPECT_FALSE(ch.SendFor(1, std::chrono::milliseconds(1)));
  EXPECT_EQ(ch.Size(), 0u);
}

TEST(BoundedChannelTest, CloseWakesBlockedSender) {
  BoundedChannel<int> ch(1);
  ch.Send(1);
  std::atomic<bool> result{true};
  std::thread sender([&] { result = ch.Send(2); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  ch.Close();
  sender.join();
  EXPECT_FALSE(result.load());
}

TEST(BoundedChannelTest, CloseWakesBlockedReceiver) {
  BoundedChannel<int> ch(1);
  std::optional<int> received = 42;
  std::thread receiver([&] { received = ch.Recv(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  ch.Close();
  receiver.join();
  EXPECT_EQ(received, std::nullopt);
}

// -----------------------------------------------------------------------------
// Backpressure
// -----------------------------------------------------------------------------

TEST(BoundedChannelTest, BlockedSendCompletesWhenReceiverPops) {
  BoundedChannel<int> ch(1);
  ch.Send(1);
  std::atomic<bool> sent{false};
  std::thread sender([&] {
    ch.Send(2);
    sent = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(sent.load());

  EXPECT_EQ(ch.Recv(), 1);
  sender.join();
  EXPECT_TRUE(sent.load());
  EXPECT_EQ(ch.Recv(), 2);
}

TEST(BoundedChannelTest, RecvForReturnsNulloptOnTimeout) {
  BoundedChannel<int> ch(1);
  EXPECT_EQ(ch.RecvFor(std::chrono::milliseconds(5)), std::nullopt);
  EXPECT_FALSE(ch.IsDrained());
}

}  // namespace
}  // namespace capkit::tests
