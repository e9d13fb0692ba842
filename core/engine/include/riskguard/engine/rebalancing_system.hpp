#pragma once

#include "riskguard/advisory/i_advisor.hpp"
#include "riskguard/advisory/position_debate.hpp"
#include "riskguard/concurrent/event_loop_thread.hpp"
#include "riskguard/config/system_config.hpp"
#include "riskguard/domain/alert.hpp"
#include "riskguard/domain/assessment.hpp"
#include "riskguard/domain/trade_execution.hpp"
#include "riskguard/eventbus/event_bus.hpp"
#include "riskguard/monitor/alert_thread.hpp"
#include "riskguard/monitor/snapshot_cache.hpp"
#include "riskguard/network/ipc_server.hpp"
#include "riskguard/rebalance/rebalancer.hpp"
#include "riskguard/risk/portfolio_risk_service.hpp"
#include "riskguard/store/i_portfolio_store.hpp"
#include "riskguard/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace riskguard {

// -----------------------------------------------------------------------------
// RebalancingSystem
// -----------------------------------------------------------------------------
//
// @brief  Composition root for one account: owns the event loops, network
//         threads and components, and exposes a start/stop lifecycle to
//         main() and tests.
//
// @details
// Thread layout:
//
//   rebalance loop      → Rebalancer::handleAlert(), one alert at a time
//   notification loop   → trade / alert / rebalance listeners (bounded queue)
//   alert thread        → AlertGateway ZMQ SUB recv loop
//   ipc thread          → IpcServer REP commands + PUB telemetry
//   caller threads      → pushAlert(), triggerRebalance(), queries
//
// Flow of one alert:
//   pushAlert() / AlertGateway
//     ├─► notification loop   AlertEvent  (alert listeners, telemetry)
//     └─► rebalance loop      AlertEvent  → Rebalancer
//                                             └─► trade listener
//                                                   └─► notification loop
//                                                       TradeExecutedEvent
//
// Snapshots from the gateway land in the SnapshotCache, which is the
// Rebalancer's alert source for manual rebalances.
//
// Empty alert_endpoint or IPC endpoints in the config skip the matching
// thread, which is how tests run the system without sockets.
//
// stop() order: alert thread, rebalance loop (drains queued alerts),
// rebalancer gate, notification loop (drains queued notifications), IPC
// server. Nothing accepted by pushAlert() before stop() is lost.
//
// Ownership:
//   Holds a reference to the position store; the caller owns it. Owns the
//   clock unless one is injected (tests inject SimulationTimeProvider).
// -----------------------------------------------------------------------------
class RebalancingSystem {
 public:
  using TradeCallback = std::function<void(const domain::TradeExecution&)>;
  using AlertCallback = std::function<void(const domain::Alert&)>;

  RebalancingSystem(SystemConfig config, IPortfolioStore& store,
                    const ITimeProvider* clock = nullptr);
  ~RebalancingSystem();

  RebalancingSystem(const RebalancingSystem&) = delete;
  RebalancingSystem& operator=(const RebalancingSystem&) = delete;
  RebalancingSystem(RebalancingSystem&&) = delete;
  RebalancingSystem& operator=(RebalancingSystem&&) = delete;

  // Idempotent. Throws zmq::error_t if an IPC endpoint cannot be bound.
  void start();

  // Idempotent.
  void stop();

  bool isRunning() const { return running_.load(); }

  // Set by the STOP command. main() polls it; the IPC thread cannot join
  // itself.
  bool stopRequested() const { return stop_requested_.load(); }

  // Queues an alert for the rebalance loop and the notification loop.
  // Returns false (and does nothing) while the system is stopped.
  bool pushAlert(domain::Alert alert);

  // Replaces the cached monitor snapshot used by triggerRebalance().
  void pushSnapshot(domain::PortfolioSnapshot snapshot);

  nlohmann::json getStatus();

  // Runs a manual rebalance synchronously on the caller's thread. Throws
  // NotConnectedError before start().
  domain::RebalanceResult triggerRebalance();

  domain::PortfolioRiskAssessment assessPortfolio() const;

  std::vector<domain::ReallocationSuggestion> getReallocationSuggestions(
      const std::vector<domain::Opportunity>& opportunities = {}) const;

  // Debates every held position through the configured advisor. Blocks
  // until all debates finish.
  advisory::PortfolioAdvice reviewPositions(
      const std::string& market_context = "");

  // Listener channel. Callbacks run on the notification loop; one that
  // throws is logged and does not affect the others.
  EventBus& notificationBus() { return notification_loop_.eventBus(); }
  EventBus::SubscriptionId onTrade(TradeCallback callback);
  EventBus::SubscriptionId onAlert(AlertCallback callback);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // IPC command handler. Returns a JSON document with "status" = "ok" or
  // "error".
  //   PING          {"response":"PONG"}
  //   STATUS        getStatus()
  //   STATS         daily stats
  //   HISTORY [n]   last n trades (default 20)
  //   REBALANCE     manual rebalance result
  //   ASSESS        portfolio risk assessment
  //   ADVISE [ctx]  debate over every position, ctx is the market context
  //   STOP          sets stopRequested()
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  Rebalancer& rebalancer() { return *rebalancer_; }
  const SystemConfig& config() const { return config_; }

 private:
  void publishNotification(Event event);

  const SystemConfig config_;
  IPortfolioStore& store_;

  std::unique_ptr<ITimeProvider> owned_clock_;
  const ITimeProvider& clock_;

  // Declared before the components that publish into them.
  EventLoopThread rebalance_loop_;
  EventLoopThread notification_loop_;

  SnapshotCache snapshot_cache_;
  PortfolioRiskService risk_service_;
  std::unique_ptr<Rebalancer> rebalancer_;

  std::unique_ptr<advisory::IAdvisor> advisor_;
  std::unique_ptr<advisory::PositionDebate> debate_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<AlertThread> alert_thread_;

  std::vector<EventBus::SubscriptionId> rebalance_subs_;
  std::optional<EventBus::SubscriptionId> telemetry_sub_;

  std::atomic<std::uint64_t> next_sequence_{1};
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
};

}  // namespace riskguard
