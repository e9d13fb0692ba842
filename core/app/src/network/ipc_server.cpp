#include "riskguard/network/ipc_server.hpp"

#include "riskguard/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <type_traits>
#include <utility>

namespace riskguard {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets and spawn worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  const bool was_running = running_.exchange(false);

  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): drain queue onto the PUB socket
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    const std::string line = formatTelemetry(*event);
    zmq::message_t msg(line.data(), line.size());
    // PUB never blocks; with no subscriber the message is discarded.
    (void)pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one REP round trip, if a request is waiting
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  const std::string cmd = request.to_string();
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    // REP must answer every request or the socket wedges.
    std::cerr << "[IpcServer] Command '" << cmd << "' failed: " << e.what()
              << "\n";
    nlohmann::json err;
    err["status"] = "error";
    err["error"] = e.what();
    response = err.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): one JSON line per event type
// -----------------------------------------------------------------------------
std::string IpcServer::formatTelemetry(const Event& event) {
  return std::visit(
      [](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        nlohmann::json j;
        if constexpr (std::is_same_v<T, TradeExecutedEvent>) {
          j = codec::toJson(e.trade);
          j["type"] = "trade";
        } else if constexpr (std::is_same_v<T, AlertEvent>) {
          j = codec::toJson(e.alert);
          j["type"] = "alert";
          j["sequence_id"] = e.sequence_id;
        } else {
          j = codec::toJson(e.result);
          j["type"] = "rebalance";
        }
        j["account_id"] = e.account_id;
        return j.dump();
      },
      event);
}

}  // namespace riskguard
