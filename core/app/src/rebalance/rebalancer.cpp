#include "riskguard/rebalance/rebalancer.hpp"

#include "riskguard/domain/order.hpp"
#include "riskguard/errors.hpp"
#include "riskguard/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <iostream>
#include <utility>

namespace riskguard {

namespace {

constexpr double kStopLossReducePct = 50.0;
constexpr double kTakeProfitReducePct = 50.0;

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

std::string format1(double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", value);
  return buf;
}

}  // namespace

Rebalancer::Rebalancer(std::string account_id, IPortfolioStore& store,
                       const ITimeProvider& clock,
                       const domain::RebalanceConfig& config)
    : account_id_(std::move(account_id)),
      store_(store),
      clock_(clock),
      config_(config),
      last_reset_day_(epoch_day(clock.now_ms())) {}

void Rebalancer::setTradeListener(TradeListener listener) {
  on_trade_ = std::move(listener);
}

void Rebalancer::setRebalanceListener(RebalanceListener listener) {
  on_rebalance_ = std::move(listener);
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------
void Rebalancer::start(IAlertSource& source) {
  source_.store(&source);
  if (running_.exchange(true)) {
    return;
  }
  std::cout << "[Rebalancer] Started for account " << account_id_
            << " (mode: " << (config_.dry_run ? "DRY RUN" : "LIVE TRADING")
            << ")\n";
}

void Rebalancer::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  std::cout << "[Rebalancer] Stopped for account " << account_id_ << "\n";
}

// -----------------------------------------------------------------------------
// Alert handling
// -----------------------------------------------------------------------------
void Rebalancer::handleAlert(const domain::Alert& alert) { process(alert); }

bool Rebalancer::urgencyEnabled(domain::ActionUrgency urgency) const {
  switch (urgency) {
    case domain::ActionUrgency::Immediate: return config_.act_on_immediate;
    case domain::ActionUrgency::High:      return config_.act_on_high;
    case domain::ActionUrgency::Medium:    return config_.act_on_medium;
    case domain::ActionUrgency::Low:       return config_.act_on_low;
  }
  return false;
}

std::optional<Rebalancer::Decision> Rebalancer::decide(
    const domain::Alert& alert) const {
  using domain::AlertType;
  using domain::RebalanceAction;

  if (alert.alert_type == AlertType::IdleCapital) {
    std::cout << "[Rebalancer] Idle capital detected: "
              << format1(alert.value("idle_pct"))
              << "% - consider deploying\n";
    return std::nullopt;
  }

  if (!alert.symbol || alert.symbol->empty()) {
    std::cout << "[Rebalancer] Ignoring " << domain::toString(alert.alert_type)
              << " alert without a symbol: " << alert.title << "\n";
    return std::nullopt;
  }

  Decision d;
  d.symbol = *alert.symbol;

  switch (alert.alert_type) {
    case AlertType::StopLossHit: {
      const double pnl = alert.value("pnl_pct");
      if (pnl < config_.auto_exit_loss_pct) {
        d.action = RebalanceAction::SellAll;
        d.reason = "Stop-loss triggered at " + format1(pnl) + "% loss";
      } else {
        d.action = RebalanceAction::Sell;
        d.reduce_pct = kStopLossReducePct;
        d.reason = "Reducing exposure due to " + format1(pnl) + "% loss";
      }
      return d;
    }
    case AlertType::TakeProfit: {
      const double pnl = alert.value("pnl_pct");
      if (pnl <= config_.auto_reduce_gain_pct) {
        return std::nullopt;
      }
      d.action = RebalanceAction::Sell;
      d.reduce_pct = std::min(kTakeProfitReducePct,
                              config_.max_single_trade_pct);
      d.reason = "Taking profits at " + format1(pnl) + "% gain";
      return d;
    }
    case AlertType::Concentration: {
      const double conc = alert.value("concentration_pct");
      if (conc <= config_.auto_reduce_concentration_pct) {
        return std::nullopt;
      }
      const double target = config_.target_position_pct;
      d.action = RebalanceAction::Sell;
      d.reduce_pct = std::min((conc - target) / conc * 100.0,
                              config_.max_single_trade_pct);
      d.reason = "Reducing concentration from " + format1(conc) + "% to ~" +
                 format1(target) + "%";
      return d;
    }
    case AlertType::RiskThreshold:
      d.action = RebalanceAction::SellAll;
      d.reason = "Critical risk threshold exceeded";
      return d;
    case AlertType::IdleCapital:
      break;
  }
  return std::nullopt;
}

std::optional<domain::TradeExecution> Rebalancer::process(
    const domain::Alert& alert) {
  if (!running_.load()) {
    std::cout << "[Rebalancer] Not running, discarding alert: " << alert.title
              << "\n";
    return std::nullopt;
  }
  if (!config_.enabled) {
    std::cout << "[Rebalancer] Disabled, discarding alert: " << alert.title
              << "\n";
    return std::nullopt;
  }
  if (!urgencyEnabled(alert.urgency)) {
    std::cout << "[Rebalancer] Skipping alert (urgency "
              << domain::toString(alert.urgency) << "): " << alert.title
              << "\n";
    return std::nullopt;
  }

  std::optional<Decision> decision = decide(alert);
  if (!decision) {
    return std::nullopt;
  }

  std::optional<domain::TradeExecution> trade;
  {
    std::lock_guard lock(mutex_);
    try {
      trade = executeLocked(*decision, alert);
    } catch (const ThrottledError& e) {
      std::cerr << "[Rebalancer] Cannot trade " << decision->symbol << ": "
                << e.what() << "\n";
    } catch (const NotFoundError& e) {
      std::cerr << "[Rebalancer] " << e.what() << "\n";
    }
  }

  if (trade) {
    notifyTrade(*trade);
  }
  return trade;
}

std::optional<domain::TradeExecution> Rebalancer::executeLocked(
    const Decision& decision, const domain::Alert& alert) {
  using domain::RebalanceAction;

  const std::int64_t now = clock_.now_ms();

  // --- 3. Throttle -----------------------------------------------------------
  checkThrottleLocked(decision.symbol, now);

  // --- 4. Size against the current holding -----------------------------------
  const std::string wanted = upper(decision.symbol);
  std::optional<domain::Position> held;
  for (const auto& p : store_.positions(account_id_)) {
    if (upper(p.symbol) == wanted && p.quantity > 0.0) {
      held = p;
      break;
    }
  }
  if (!held) {
    throw NotFoundError("No position found for " + decision.symbol);
  }

  double quantity = held->quantity;
  if (decision.action == RebalanceAction::Sell) {
    quantity = std::min(held->quantity * decision.reduce_pct / 100.0,
                        held->quantity * config_.max_single_trade_pct / 100.0);
  }

  // --- 5. Minimum notional ---------------------------------------------------
  const double price = alert.value("current_price");
  const double value = price > 0.0 ? quantity * price : 0.0;
  if (value < config_.min_trade_value &&
      decision.action != RebalanceAction::SellAll) {
    std::cout << "[Rebalancer] Trade too small for " << decision.symbol
              << ": $" << value << " < $" << config_.min_trade_value << "\n";
    return std::nullopt;
  }

  // --- 6. Record, and apply in live mode -------------------------------------
  domain::TradeExecution trade;
  trade.timestamp = ms_to_timestamp(now);
  trade.symbol = decision.symbol;
  trade.action = decision.action;
  trade.quantity = quantity;
  trade.price = price;
  trade.total_value = value;
  trade.reason = decision.reason;
  trade.alert_type = alert.alert_type;

  if (config_.dry_run) {
    std::cout << "[Rebalancer] [DRY RUN] Would "
              << domain::toString(trade.action) << " " << quantity << " "
              << trade.symbol << " @ $" << price << " = $" << value << " ("
              << trade.reason << ")\n";
  } else {
    domain::Order order;
    order.account_id = account_id_;
    order.symbol = held->symbol;
    order.side = domain::Side::Sell;
    order.quantity = quantity;
    order.price = price;
    order.timestamp = trade.timestamp;
    try {
      const domain::OrderId id = store_.applyTrade(order);
      std::cout << "[Rebalancer] EXECUTED order " << id << ": "
                << domain::toString(trade.action) << " " << quantity << " "
                << trade.symbol << " @ $" << price << " = $" << value << "\n";
    } catch (const std::exception& e) {
      // ExecutionError normally; a third-party store may throw anything.
      trade.success = false;
      trade.error = e.what();
    }
    if (!trade.success) {
      std::cerr << "[Rebalancer] Trade failed for " << trade.symbol << ": "
                << *trade.error << "\n";
    }
  }

  // --- 7. Throttle bookkeeping, regardless of outcome ------------------------
  ++daily_trade_count_;
  last_trade_ms_[wanted] = now;
  history_.push_back(trade);
  return trade;
}

// -----------------------------------------------------------------------------
// Throttle
// -----------------------------------------------------------------------------
void Rebalancer::resetIfNewDayLocked(std::int64_t now_ms) {
  const std::int64_t today = epoch_day(now_ms);
  if (today > last_reset_day_) {
    if (daily_trade_count_ > 0) {
      std::cout << "[Rebalancer] New trading day, resetting daily count ("
                << daily_trade_count_ << " trades yesterday)\n";
    }
    daily_trade_count_ = 0;
    last_reset_day_ = today;
  }
}

void Rebalancer::checkThrottleLocked(const std::string& symbol,
                                     std::int64_t now_ms) {
  resetIfNewDayLocked(now_ms);

  if (daily_trade_count_ >= config_.max_daily_trades) {
    throw ThrottledError("Daily trade limit reached (" +
                         std::to_string(config_.max_daily_trades) + ")");
  }

  auto it = last_trade_ms_.find(upper(symbol));
  if (it == last_trade_ms_.end()) {
    return;
  }
  const std::int64_t cooldown_ms =
      static_cast<std::int64_t>(config_.cooldown_minutes) * kMillisPerMinute;
  const std::int64_t elapsed = now_ms - it->second;
  if (elapsed < cooldown_ms) {
    const double left =
        static_cast<double>(cooldown_ms - elapsed) / kMillisPerMinute;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "Cooldown active (%.0f min left)", left);
    throw ThrottledError(buf);
  }
}

bool Rebalancer::canTrade(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  try {
    checkThrottleLocked(symbol, clock_.now_ms());
  } catch (const ThrottledError&) {
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// Manual rebalance and queries
// -----------------------------------------------------------------------------
domain::RebalanceResult Rebalancer::manualRebalance() {
  IAlertSource* source = source_.load();
  if (source == nullptr) {
    throw NotConnectedError("Alert source not connected for account " +
                            account_id_ + ". Call start() first.");
  }

  domain::RebalanceResult result;
  result.dry_run = config_.dry_run;
  result.snapshot_before = source->currentSnapshot();

  if (result.snapshot_before) {
    for (const auto& alert : result.snapshot_before->alerts) {
      if (std::optional<domain::TradeExecution> trade = process(alert)) {
        result.trades_executed.push_back(std::move(*trade));
      }
    }
    result.alerts_processed =
        static_cast<int>(result.snapshot_before->alerts.size());
  }

  result.snapshot_after = source->currentSnapshot();
  result.timestamp = ms_to_timestamp(clock_.now_ms());
  std::cout << "[Rebalancer] " << result.summary() << "\n";

  if (on_rebalance_) {
    try {
      on_rebalance_(result);
    } catch (const std::exception& e) {
      std::cerr << "[Rebalancer] Rebalance listener threw: " << e.what()
                << "\n";
    } catch (...) {
      std::cerr << "[Rebalancer] Rebalance listener threw a non-standard "
                   "exception\n";
    }
  }
  return result;
}

domain::DailyStats Rebalancer::getDailyStats() {
  std::lock_guard lock(mutex_);
  const std::int64_t now = clock_.now_ms();
  resetIfNewDayLocked(now);
  const std::int64_t today = epoch_day(now);

  domain::DailyStats stats;
  stats.dry_run = config_.dry_run;
  stats.trades_remaining =
      std::max(0, config_.max_daily_trades - daily_trade_count_);
  for (const auto& t : history_) {
    if (epoch_day(timestamp_to_ms(t.timestamp)) != today) {
      continue;
    }
    ++stats.trades_today;
    if (t.success) {
      ++stats.success_count;
      stats.total_volume += t.total_value;
    } else {
      ++stats.failure_count;
    }
  }
  return stats;
}

std::vector<domain::TradeExecution> Rebalancer::getTradeHistory(
    std::size_t limit) const {
  std::lock_guard lock(mutex_);
  const std::size_t first =
      history_.size() > limit ? history_.size() - limit : 0;
  return std::vector<domain::TradeExecution>(
      history_.begin() + static_cast<std::ptrdiff_t>(first), history_.end());
}

void Rebalancer::notifyTrade(const domain::TradeExecution& trade) const {
  if (!on_trade_) {
    return;
  }
  try {
    on_trade_(trade);
  } catch (const std::exception& e) {
    std::cerr << "[Rebalancer] Trade listener threw: " << e.what() << "\n";
  } catch (...) {
    std::cerr << "[Rebalancer] Trade listener threw a non-standard exception\n";
  }
}

}  // namespace riskguard
