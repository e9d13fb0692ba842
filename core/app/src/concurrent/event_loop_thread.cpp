#include "riskguard/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>

namespace riskguard {

namespace {

// How long the idle worker waits before re-checking running_.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name, std::size_t capacity)
    : name_(std::move(name)), queue_(capacity) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  stop_cv_.notify_all();
  thread_.join();
}

bool EventLoopThread::push(Event event) {
  if (queue_.push(std::move(event))) {
    // Wake the worker instead of letting it sit out the idle timeout.
    stop_cv_.notify_all();
    return true;
  }
  const std::size_t dropped = ++dropped_;
  std::cerr << "[" << name_ << "] Queue full (capacity "
            << queue_.capacity() << "), event dropped (total dropped: "
            << dropped << ")\n";
  return false;
}

void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();
    if (event) {
      bus_.publish(*event);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout, [this] {
      return !running_.load() || !queue_.empty();
    });
  }

  // Drain whatever was accepted before stop().
  while (std::optional<Event> event = queue_.try_pop()) {
    bus_.publish(*event);
  }
}

}  // namespace riskguard
