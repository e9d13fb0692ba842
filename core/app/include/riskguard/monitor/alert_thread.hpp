#pragma once

#include "riskguard/monitor/alert_gateway.hpp"

#include <memory>
#include <string>
#include <thread>

namespace riskguard {

// -----------------------------------------------------------------------------
// AlertThread — dedicated I/O thread for the monitor feed
// -----------------------------------------------------------------------------
//
// @brief  RAII wrapper running AlertGateway::run() on its own std::thread.
//
// @details
// The gateway is created in start(), not in the constructor, so
// RebalancingSystem can build this early and open the socket only once the
// event loops it feeds are running.
//
// AlertGateway has its own blocking recv loop and does not consume a queue,
// hence a plain std::thread rather than an EventLoopThread.
//
// Thread model: start()/stop() from the owning thread. Both idempotent.
// Ownership:    Owned by RebalancingSystem. Owns the gateway and thread.
// -----------------------------------------------------------------------------
class AlertThread {
 public:
  AlertThread(std::string account_id, AlertGateway::AlertSink alert_sink,
              AlertGateway::SnapshotSink snapshot_sink, std::string endpoint);
  ~AlertThread();

  AlertThread(const AlertThread&) = delete;
  AlertThread& operator=(const AlertThread&) = delete;
  AlertThread(AlertThread&&) = delete;
  AlertThread& operator=(AlertThread&&) = delete;

  void start();
  void stop();

  bool isRunning() const { return thread_.joinable(); }

 private:
  std::string account_id_;
  AlertGateway::AlertSink alert_sink_;
  AlertGateway::SnapshotSink snapshot_sink_;
  std::string endpoint_;

  std::unique_ptr<AlertGateway> gateway_;
  std::thread thread_;
};

}  // namespace riskguard
