#pragma once

#include "riskguard/domain/alert.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

namespace riskguard {

// -----------------------------------------------------------------------------
// AlertGateway — ZeroMQ bridge from the external portfolio monitor
// -----------------------------------------------------------------------------
//
// @brief  Listens on a SUB socket for the monitor's JSON feed and hands each
//         decoded alert or snapshot for this account to a sink.
//
// @details
// Feed messages (see codec::decodeFeedMessage):
//   {"type":"alert",    "account_id":"acct-1", "alert_type":..., ...}
//   {"type":"snapshot", "account_id":"acct-1", ..., "alerts":[...]}
//
// Per message:
//   1. Decode. Malformed payloads are logged to stderr and skipped.
//   2. Filter. A message for another account is dropped silently. A message
//      without an account id is accepted (single-account monitors omit it).
//   3. Dispatch. Alerts go to alert_sink, snapshots to snapshot_sink.
//
// Sinks run on the gateway thread and should return quickly. The system
// binds them to a queue push and a cache update.
//
// Thread model:
//   run() blocks the calling thread (AlertThread's worker). stop() may be
//   called from any thread; the loop notices within kRecvTimeoutMs.
//   running_ starts out true so a stop() issued before run() gets going is
//   never lost.
//
// Ownership:
//   Owns the ZMQ context and socket. Holds copies of both sinks.
// -----------------------------------------------------------------------------
class AlertGateway {
 public:
  using AlertSink = std::function<void(domain::Alert)>;
  using SnapshotSink = std::function<void(domain::PortfolioSnapshot)>;

  static constexpr int kRecvTimeoutMs = 100;

  AlertGateway(std::string account_id, AlertSink alert_sink,
               SnapshotSink snapshot_sink,
               const std::string& endpoint = "tcp://127.0.0.1:5560");

  ~AlertGateway() = default;

  AlertGateway(const AlertGateway&) = delete;
  AlertGateway& operator=(const AlertGateway&) = delete;
  AlertGateway(AlertGateway&&) = delete;
  AlertGateway& operator=(AlertGateway&&) = delete;

  void run();
  void stop();

  // -------------------------------------------------------------------------
  // handlePayload(payload)
  // -------------------------------------------------------------------------
  // Steps 1-3 above for one raw payload. Returns true when the message was
  // dispatched to a sink. Never throws for bad input.
  // -------------------------------------------------------------------------
  bool handlePayload(const std::string& payload);

  std::size_t rejectedCount() const { return rejected_.load(); }

 private:
  const std::string account_id_;
  AlertSink alert_sink_;
  SnapshotSink snapshot_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{true};
  std::atomic<std::size_t> rejected_{0};
};

}  // namespace riskguard
