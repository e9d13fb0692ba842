#pragma once

#include "riskguard/concurrent/thread_safe_queue.hpp"
#include "riskguard/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace riskguard {

// -----------------------------------------------------------------------------
// IpcServer — operator command channel and telemetry feed
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving two ZeroMQ sockets: a REP socket for
//         operator commands and a PUB socket broadcasting trade / alert
//         telemetry as JSON.
//
// @details
//   REP (cmd_endpoint)
//     Each request string is handed to the command handler (bound to
//     RebalancingSystem::executeCommand()) and its JSON reply sent back.
//     ZMQ_RCVTIMEO keeps the worker alternating between commands and
//     telemetry.
//
//   PUB (pub_endpoint)
//     Events pushed with pushTelemetry() are formatted on the worker thread:
//       TradeExecutedEvent      {"type":"trade", "account_id":..., ...}
//       AlertEvent              {"type":"alert", "account_id":..., ...}
//       RebalanceCompletedEvent {"type":"rebalance", "account_id":..., ...}
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC worker thread, so everything it
//   touches must be thread-safe.
//
// Ownership:
//   Owned by RebalancingSystem. Owns the ZMQ context, both sockets, the
//   telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Idempotent. Throws
  // zmq::error_t if an endpoint cannot be bound.
  void start();

  // Publishes remaining telemetry, joins the worker and closes the sockets.
  // Idempotent.
  void stop();

  void pushTelemetry(Event event);

  bool isRunning() const { return running_.load(); }

  // JSON line for a telemetry event.
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace riskguard
