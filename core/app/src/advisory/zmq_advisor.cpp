#include "riskguard/advisory/zmq_advisor.hpp"

#include "riskguard/codec/json_codec.hpp"
#include "riskguard/errors.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <utility>

namespace riskguard {
namespace advisory {

ZmqAdvisor::ZmqAdvisor(std::string endpoint, int timeout_ms)
    : endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms) {}

// -----------------------------------------------------------------------------
// advise(): one request/reply round trip on a socket owned by this call
// -----------------------------------------------------------------------------
Advice ZmqAdvisor::advise(const AdviceRequest& request) {
  const std::string payload = codec::toJson(request).dump();

  std::string raw;
  try {
    zmq::socket_t socket{context_, zmq::socket_type::req};
    socket.set(zmq::sockopt::rcvtimeo, timeout_ms_);
    socket.set(zmq::sockopt::sndtimeo, timeout_ms_);
    socket.set(zmq::sockopt::linger, 0);
    socket.connect(endpoint_);

    zmq::message_t out(payload.data(), payload.size());
    if (!socket.send(out, zmq::send_flags::none)) {
      throw ExecutionError("Advisor send timed out: " + endpoint_);
    }

    zmq::message_t reply;
    if (!socket.recv(reply, zmq::recv_flags::none)) {
      std::cerr << "[ZmqAdvisor] No reply from " << endpoint_ << " after "
                << timeout_ms_ << " ms\n";
      throw ExecutionError("Advisor timed out after " +
                           std::to_string(timeout_ms_) + " ms");
    }
    raw.assign(static_cast<const char*>(reply.data()), reply.size());
  } catch (const zmq::error_t& e) {
    throw ExecutionError(std::string("Advisor transport error: ") + e.what());
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(raw);
  } catch (const nlohmann::json::exception& e) {
    throw InvalidInputError(std::string("Advisor reply is not JSON: ") +
                            e.what());
  }

  if (j.is_object()) {
    auto err = j.find("error");
    if (err != j.end() && !err->is_null()) {
      throw ExecutionError("Advisor error: " +
                           (err->is_string() ? err->get<std::string>()
                                             : err->dump()));
    }
  }
  return codec::parseAdvice(j);
}

}  // namespace advisory
}  // namespace riskguard
