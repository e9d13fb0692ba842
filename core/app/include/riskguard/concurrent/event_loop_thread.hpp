#pragma once

#include "riskguard/concurrent/thread_safe_queue.hpp"
#include "riskguard/eventbus/event_bus.hpp"
#include "riskguard/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

namespace riskguard {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its own EventBus. Subscribers therefore run
// one event at a time on the loop thread.
//
// RebalancingSystem owns two of these:
//   rebalance loop     unbounded, serializes alert handling for the account
//   notification loop  bounded, fans trades and alerts out to listeners
//
// Shutdown: stop() lets the worker finish the event it is handling and then
// publishes everything still queued before the thread exits, so events
// accepted by push() are never silently dropped by a shutdown.
//
// Thread model: start(), stop() and push() are safe from any thread.
// Subscriber callbacks run on the loop thread only.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  // name is used as the log prefix ("[rebalance-loop] ...").
  explicit EventLoopThread(std::string name = "event-loop",
                           std::size_t capacity = 0);

  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Idempotent. Drains the queue, then joins the worker.
  void stop();

  // -------------------------------------------------------------------------
  // push(event)
  // -------------------------------------------------------------------------
  // Output: false when the queue is bounded and full. The event is dropped,
  // the drop is logged and counted in droppedCount().
  // -------------------------------------------------------------------------
  bool push(Event event);

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool isRunning() const { return running_.load(); }
  std::size_t pendingCount() const { return queue_.size(); }
  std::size_t droppedCount() const { return dropped_.load(); }

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> dropped_{0};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;  // Wakes the idle worker on stop()
  std::thread thread_;
};

}  // namespace riskguard
