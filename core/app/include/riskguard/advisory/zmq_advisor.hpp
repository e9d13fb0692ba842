#pragma once

#include "riskguard/advisory/i_advisor.hpp"

#include <zmq.hpp>

#include <string>

namespace riskguard {
namespace advisory {

// -----------------------------------------------------------------------------
// ZmqAdvisor — IAdvisor backed by an external oracle on a REQ socket
// -----------------------------------------------------------------------------
//
// @brief  Sends the AdviceRequest as JSON to a REP endpoint and decodes the
//         reply through codec::parseAdvice().
//
// @details
// Wire format:
//   request   codec::toJson(AdviceRequest)
//   reply     {"action":..., "confidence":..., "reasoning":...,
//              "key_points":[...]}   or   {"error":"..."}
//
// Every advise() call opens its own REQ socket, so a timed-out exchange
// never leaves a socket behind that cannot send again.
//
// Thread model:
//   advise() may be called from several threads at once (one per debate
//   stance). Each call owns its socket; only the context is shared, and
//   zmq::context_t is thread-safe. Concurrent calls wait in parallel.
//
// Ownership:
//   Owns the ZMQ context. Sockets live for the duration of one call.
// -----------------------------------------------------------------------------
class ZmqAdvisor final : public IAdvisor {
 public:
  static constexpr int kDefaultTimeoutMs = 5000;

  explicit ZmqAdvisor(std::string endpoint,
                      int timeout_ms = kDefaultTimeoutMs);

  ZmqAdvisor(const ZmqAdvisor&) = delete;
  ZmqAdvisor& operator=(const ZmqAdvisor&) = delete;
  ZmqAdvisor(ZmqAdvisor&&) = delete;
  ZmqAdvisor& operator=(ZmqAdvisor&&) = delete;

  // Throws ExecutionError on timeout, transport failure or an oracle-side
  // {"error"} reply. Throws InvalidInputError when the reply fails
  // validation.
  Advice advise(const AdviceRequest& request) override;

  const std::string& endpoint() const { return endpoint_; }

 private:
  const std::string endpoint_;
  const int timeout_ms_;

  zmq::context_t context_{1};
};

}  // namespace advisory
}  // namespace riskguard
