// =============================================================================
// event_loop_thread_test.cpp
// =============================================================================
// Unit tests for riskguard::EventLoopThread.
//
// Validates:
//   - Events pushed from the test thread are published on the loop thread
//   - Arrival order is preserved
//   - stop() drains everything accepted before it
//   - A bounded loop drops and counts overflow instead of blocking
//   - start() / stop() are idempotent
// =============================================================================

#include "riskguard/concurrent/event_loop_thread.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <string>
#include <thread>
#include <vector>

using riskguard::AlertEvent;
using riskguard::EventLoopThread;

namespace {

AlertEvent makeAlert(std::uint64_t seq) {
  AlertEvent e;
  e.account_id = "acct-1";
  e.alert.title = "alert " + std::to_string(seq);
  e.sequence_id = seq;
  return e;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Subscribers run on the loop thread, not the pushing thread.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, PublishesOnWorkerThread) {
  EventLoopThread loop("test-loop");
  std::promise<std::thread::id> seen;
  auto future = seen.get_future();
  loop.eventBus().subscribe<AlertEvent>([&seen](const AlertEvent&) {
    seen.set_value(std::this_thread::get_id());
  });

  loop.start();
  EXPECT_TRUE(loop.isRunning());
  ASSERT_TRUE(loop.push(makeAlert(1)));

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_NE(future.get(), std::this_thread::get_id());
  loop.stop();
}

// -----------------------------------------------------------------------------
// 2. One worker means one event at a time, in arrival order.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, PreservesOrder) {
  constexpr int kCount = 200;
  EventLoopThread loop("order-loop");
  std::vector<std::uint64_t> received;
  loop.eventBus().subscribe<AlertEvent>(
      [&received](const AlertEvent& e) { received.push_back(e.sequence_id); });

  loop.start();
  for (int i = 1; i <= kCount; ++i) {
    loop.push(makeAlert(static_cast<std::uint64_t>(i)));
  }
  loop.stop();

  ASSERT_EQ(received.size(), static_cast<std::size_t>(kCount));
  for (int i = 0; i < kCount; ++i) {
    EXPECT_EQ(received[i], static_cast<std::uint64_t>(i + 1));
  }
}

// -----------------------------------------------------------------------------
// 3. stop() publishes whatever is still queued before joining.
// Why: an alert accepted just before shutdown must still reach the
//      rebalancer; a silent drop there would skip a stop loss.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, StopDrainsPendingEvents) {
  EventLoopThread loop("drain-loop");
  std::atomic<int> handled{0};
  std::promise<void> first_started;
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();

  loop.eventBus().subscribe<AlertEvent>(
      [&, released](const AlertEvent& e) {
        if (e.sequence_id == 1) {
          first_started.set_value();
          released.wait();
        }
        ++handled;
      });

  loop.start();
  loop.push(makeAlert(1));
  first_started.get_future().wait();

  // The worker is busy with #1; these sit in the queue.
  for (std::uint64_t i = 2; i <= 5; ++i) {
    loop.push(makeAlert(i));
  }
  EXPECT_EQ(loop.pendingCount(), 4u);

  std::thread stopper([&loop] { loop.stop(); });
  release.set_value();
  stopper.join();

  EXPECT_EQ(handled.load(), 5);
  EXPECT_EQ(loop.pendingCount(), 0u);
  EXPECT_FALSE(loop.isRunning());
}

// -----------------------------------------------------------------------------
// 4. A bounded loop refuses overflow and counts it.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, BoundedLoopDropsOverflow) {
  // Not started: nothing is consumed, so the third push overflows.
  EventLoopThread loop("notification-loop", 2);

  testing::internal::CaptureStderr();
  EXPECT_TRUE(loop.push(makeAlert(1)));
  EXPECT_TRUE(loop.push(makeAlert(2)));
  EXPECT_FALSE(loop.push(makeAlert(3)));
  const std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(loop.droppedCount(), 1u);
  EXPECT_EQ(loop.pendingCount(), 2u);
  EXPECT_NE(err.find("[notification-loop] Queue full"), std::string::npos);

  // Events accepted before start() are delivered once the loop runs.
  std::atomic<int> handled{0};
  loop.eventBus().subscribe<AlertEvent>(
      [&handled](const AlertEvent&) { ++handled; });
  loop.start();
  loop.stop();
  EXPECT_EQ(handled.load(), 2);
}

TEST(EventLoopThreadTest, StartAndStopAreIdempotent) {
  EventLoopThread loop;
  loop.start();
  loop.start();
  loop.stop();
  loop.stop();
  EXPECT_FALSE(loop.isRunning());
}
