#include "riskguard/monitor/alert_thread.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace riskguard {

AlertThread::AlertThread(std::string account_id,
                         AlertGateway::AlertSink alert_sink,
                         AlertGateway::SnapshotSink snapshot_sink,
                         std::string endpoint)
    : account_id_(std::move(account_id)),
      alert_sink_(std::move(alert_sink)),
      snapshot_sink_(std::move(snapshot_sink)),
      endpoint_(std::move(endpoint)) {}

AlertThread::~AlertThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): create gateway and spawn recv thread
// -----------------------------------------------------------------------------
void AlertThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<AlertGateway>(account_id_, alert_sink_,
                                            snapshot_sink_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[AlertThread] listening on " << endpoint_ << "\n";
    try {
      gateway_->run();
    } catch (const std::exception& e) {
      std::cerr << "[AlertThread] recv loop failed: " << e.what() << "\n";
    }
    std::cout << "[AlertThread] recv loop exited.\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): signal gateway and join thread
// -----------------------------------------------------------------------------
void AlertThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  gateway_.reset();
}

}  // namespace riskguard
