#include "riskguard/engine/rebalancing_system.hpp"

#include "riskguard/advisory/rule_based_advisor.hpp"
#include "riskguard/advisory/zmq_advisor.hpp"
#include "riskguard/codec/json_codec.hpp"
#include "riskguard/errors.hpp"
#include "riskguard/time/live_time_provider.hpp"

#include <cstddef>
#include <exception>
#include <iostream>
#include <sstream>
#include <utility>

namespace riskguard {

namespace {

std::unique_ptr<advisory::IAdvisor> makeAdvisor(const SystemConfig& config) {
  if (config.advisor_endpoint) {
    return std::make_unique<advisory::ZmqAdvisor>(*config.advisor_endpoint,
                                                  config.advisor_timeout_ms);
  }
  return std::make_unique<advisory::RuleBasedAdvisor>(config.risk);
}

nlohmann::json ok() {
  nlohmann::json j;
  j["status"] = "ok";
  return j;
}

nlohmann::json error(const std::string& message) {
  nlohmann::json j;
  j["status"] = "error";
  j["error"] = message;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build components, wire listeners. No threads yet.
// -----------------------------------------------------------------------------
RebalancingSystem::RebalancingSystem(SystemConfig config,
                                     IPortfolioStore& store,
                                     const ITimeProvider* clock)
    : config_(std::move(config)),
      store_(store),
      owned_clock_(clock ? nullptr : std::make_unique<LiveTimeProvider>()),
      clock_(clock ? *clock : *owned_clock_),
      rebalance_loop_("rebalance-loop"),
      notification_loop_("notification-loop", config_.notification_capacity),
      risk_service_(store_, config_.risk),
      rebalancer_(std::make_unique<Rebalancer>(config_.account_id, store_,
                                               clock_, config_.rebalance)),
      advisor_(makeAdvisor(config_)),
      debate_(std::make_unique<advisory::PositionDebate>(*advisor_)) {
  rebalancer_->setTradeListener([this](const domain::TradeExecution& trade) {
    publishNotification(TradeExecutedEvent{config_.account_id, trade});
  });
  rebalancer_->setRebalanceListener(
      [this](const domain::RebalanceResult& result) {
        publishNotification(RebalanceCompletedEvent{config_.account_id,
                                                    result});
      });
}

RebalancingSystem::~RebalancingSystem() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void RebalancingSystem::start() {
  if (running_.load()) {
    return;
  }
  stop_requested_.store(false);

  // ---  1) Event loops -------------------------------------------------------
  notification_loop_.start();
  rebalance_loop_.start();

  rebalance_subs_.push_back(rebalance_loop_.eventBus().subscribe<AlertEvent>(
      [this](const AlertEvent& e) { rebalancer_->handleAlert(e.alert); }));

  // ---  2) Rebalancer gate opens ---------------------------------------------
  rebalancer_->start(snapshot_cache_);

  // ---  3) IPC server (commands + telemetry) ---------------------------------
  if (!config_.cmd_endpoint.empty() && !config_.pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.cmd_endpoint, config_.pub_endpoint);
    ipc_server_->start();

    telemetry_sub_ = notification_loop_.eventBus().subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  // ---  4) Alert feed LAST, once everything downstream is live ---------------
  if (!config_.alert_endpoint.empty()) {
    alert_thread_ = std::make_unique<AlertThread>(
        config_.account_id,
        [this](domain::Alert alert) { pushAlert(std::move(alert)); },
        [this](domain::PortfolioSnapshot snapshot) {
          pushSnapshot(std::move(snapshot));
        },
        config_.alert_endpoint);
    alert_thread_->start();
  }

  running_.store(true);

  std::cout << "[RebalancingSystem] started for account "
            << config_.account_id << ". Threads: rebalance, notification"
            << (ipc_server_ ? ", ipc" : "")
            << (alert_thread_ ? ", alert_feed" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void RebalancingSystem::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // ---  1) No more inflow ----------------------------------------------------
  alert_thread_.reset();

  // ---  2) Finish queued alerts, then close the gate -------------------------
  rebalance_loop_.stop();
  for (auto id : rebalance_subs_) {
    rebalance_loop_.eventBus().unsubscribe(id);
  }
  rebalance_subs_.clear();
  rebalancer_->stop();

  // ---  3) Deliver outstanding notifications ---------------------------------
  // The loop is joined before the telemetry bridge goes away, so no
  // notification callback can still be touching the IPC server.
  notification_loop_.stop();
  if (telemetry_sub_) {
    notification_loop_.eventBus().unsubscribe(*telemetry_sub_);
    telemetry_sub_.reset();
  }

  // ---  4) IPC last: publishes the final telemetry, then joins ---------------
  ipc_server_.reset();

  std::cout << "[RebalancingSystem] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// Inflow
// -----------------------------------------------------------------------------
bool RebalancingSystem::pushAlert(domain::Alert alert) {
  if (!running_.load()) {
    std::cerr << "[RebalancingSystem] Not running, alert '" << alert.title
              << "' ignored\n";
    return false;
  }

  AlertEvent event{config_.account_id, std::move(alert),
                   next_sequence_.fetch_add(1)};
  publishNotification(event);
  rebalance_loop_.push(std::move(event));
  return true;
}

void RebalancingSystem::pushSnapshot(domain::PortfolioSnapshot snapshot) {
  snapshot_cache_.update(std::move(snapshot));
}

void RebalancingSystem::publishNotification(Event event) {
  notification_loop_.push(std::move(event));
}

EventBus::SubscriptionId RebalancingSystem::onTrade(TradeCallback callback) {
  return notification_loop_.eventBus().subscribe<TradeExecutedEvent>(
      [cb = std::move(callback)](const TradeExecutedEvent& e) {
        cb(e.trade);
      });
}

EventBus::SubscriptionId RebalancingSystem::onAlert(AlertCallback callback) {
  return notification_loop_.eventBus().subscribe<AlertEvent>(
      [cb = std::move(callback)](const AlertEvent& e) { cb(e.alert); });
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
nlohmann::json RebalancingSystem::getStatus() {
  nlohmann::json j;
  j["account_id"] = config_.account_id;
  j["running"] = running_.load();
  j["enabled"] = config_.rebalance.enabled;
  j["dry_run"] = config_.rebalance.dry_run;
  j["daily_stats"] = codec::toJson(rebalancer_->getDailyStats());
  j["pending_alerts"] = rebalance_loop_.pendingCount();
  j["dropped_notifications"] = notification_loop_.droppedCount();

  nlohmann::json cfg;
  cfg["max_daily_trades"] = config_.rebalance.max_daily_trades;
  cfg["max_single_trade_pct"] = config_.rebalance.max_single_trade_pct;
  cfg["min_trade_value"] = config_.rebalance.min_trade_value;
  cfg["cooldown_minutes"] = config_.rebalance.cooldown_minutes;
  j["config"] = std::move(cfg);

  if (auto snapshot = snapshot_cache_.currentSnapshot()) {
    j["snapshot"] = codec::toJson(*snapshot);
  } else {
    j["snapshot"] = nullptr;
  }
  return j;
}

domain::RebalanceResult RebalancingSystem::triggerRebalance() {
  return rebalancer_->manualRebalance();
}

domain::PortfolioRiskAssessment RebalancingSystem::assessPortfolio() const {
  return risk_service_.assessPortfolio(config_.account_id);
}

std::vector<domain::ReallocationSuggestion>
RebalancingSystem::getReallocationSuggestions(
    const std::vector<domain::Opportunity>& opportunities) const {
  return risk_service_.reallocationSuggestions(config_.account_id,
                                               opportunities);
}

advisory::PortfolioAdvice RebalancingSystem::reviewPositions(
    const std::string& market_context) {
  const domain::PortfolioRiskAssessment assessment = assessPortfolio();
  return debate_->portfolioRecommendations(assessment.position_assessments,
                                           market_context);
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC command dispatch
// -----------------------------------------------------------------------------
std::string RebalancingSystem::executeCommand(const std::string& cmd) {
  std::istringstream in(cmd);
  std::string verb;
  in >> verb;

  try {
    nlohmann::json response = ok();

    if (verb == "PING") {
      response["response"] = "PONG";
    } else if (verb == "STATUS") {
      response["system"] = getStatus();
    } else if (verb == "STATS") {
      response["stats"] = codec::toJson(rebalancer_->getDailyStats());
    } else if (verb == "HISTORY") {
      std::size_t limit = Rebalancer::kDefaultHistoryLimit;
      long long requested = 0;
      if (in >> requested) {
        if (requested <= 0) {
          return error("HISTORY limit must be positive").dump();
        }
        limit = static_cast<std::size_t>(requested);
      }
      nlohmann::json trades = nlohmann::json::array();
      for (const auto& t : rebalancer_->getTradeHistory(limit)) {
        trades.push_back(codec::toJson(t));
      }
      response["trades"] = std::move(trades);
    } else if (verb == "REBALANCE") {
      response["result"] = codec::toJson(triggerRebalance());
    } else if (verb == "ASSESS") {
      response["assessment"] = codec::toJson(assessPortfolio());
    } else if (verb == "ADVISE") {
      std::string context;
      std::getline(in >> std::ws, context);
      response["advice"] = codec::toJson(reviewPositions(context));
    } else if (verb == "STOP") {
      stop_requested_.store(true);
      response["response"] = "Shutdown requested";
    } else {
      return error("Unknown command: " + cmd).dump();
    }
    return response.dump();
  } catch (const RiskGuardError& e) {
    std::cerr << "[RebalancingSystem] " << verb << " failed: " << e.what()
              << "\n";
    return error(e.what()).dump();
  }
}

}  // namespace riskguard
