#include "riskguard/monitor/alert_gateway.hpp"

#include "riskguard/codec/json_codec.hpp"
#include "riskguard/errors.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

namespace riskguard {

// -----------------------------------------------------------------------------
// Constructor: SUB socket, subscribe to everything, receive timeout
// -----------------------------------------------------------------------------
AlertGateway::AlertGateway(std::string account_id, AlertSink alert_sink,
                           SnapshotSink snapshot_sink,
                           const std::string& endpoint)
    : account_id_(std::move(account_id)),
      alert_sink_(std::move(alert_sink)),
      snapshot_sink_(std::move(snapshot_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.set(zmq::sockopt::linger, 0);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void AlertGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;

    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (!result.has_value()) {
      continue;  // timeout, re-check running_
    }
    handlePayload(msg.to_string());
  }
}

void AlertGateway::stop() { running_.store(false); }

// -----------------------------------------------------------------------------
// handlePayload(): decode, filter by account, dispatch
// -----------------------------------------------------------------------------
bool AlertGateway::handlePayload(const std::string& payload) {
  codec::FeedMessage message;
  try {
    message = codec::decodeFeedMessage(payload);
  } catch (const RiskGuardError& e) {
    rejected_.fetch_add(1);
    std::cerr << "[AlertGateway] Skipping malformed message: " << e.what()
              << "\n";
    return false;
  }

  if (!message.account_id.empty() && message.account_id != account_id_) {
    return false;
  }

  if (message.kind == codec::FeedMessage::Kind::Alert && message.alert) {
    if (alert_sink_) {
      alert_sink_(std::move(*message.alert));
    }
    return true;
  }
  if (message.kind == codec::FeedMessage::Kind::Snapshot && message.snapshot) {
    if (snapshot_sink_) {
      snapshot_sink_(std::move(*message.snapshot));
    }
    return true;
  }
  return false;
}

}  // namespace riskguard
