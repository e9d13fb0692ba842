#pragma once

#include "riskguard/domain/alert.hpp"
#include "riskguard/domain/rebalance_config.hpp"
#include "riskguard/domain/trade_execution.hpp"
#include "riskguard/monitor/i_alert_source.hpp"
#include "riskguard/store/i_portfolio_store.hpp"
#include "riskguard/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace riskguard {

// -----------------------------------------------------------------------------
// Rebalancer — alert-to-trade execution pipeline for one account
// -----------------------------------------------------------------------------
//
// @brief  Turns monitor alerts into throttled SELL / SELL_ALL trades, applied
//         to the position store (live) or only logged and recorded (dry run).
//
// @details
// Per alert: Idle → Evaluating → (Throttled | Executing) → Idle.
//
//   1. Gate. Discard (log only) when stopped, disabled, or the alert's
//      urgency tier is not enabled by the act_on_* flags.
//   2. Decide, by alert type:
//        STOP_LOSS_HIT   pnl_pct < auto_exit_loss_pct → SELL_ALL,
//                        otherwise SELL 50%.
//        TAKE_PROFIT     pnl_pct > auto_reduce_gain_pct →
//                        SELL min(50, max_single_trade_pct)%.
//        CONCENTRATION   concentration_pct > auto_reduce_concentration_pct →
//                        SELL (conc - target) / conc * 100 %, capped at
//                        max_single_trade_pct. The cap may leave the position
//                        above target; that is intended.
//        RISK_THRESHOLD  SELL_ALL.
//        IDLE_CAPITAL    log only.
//      Trading alerts without a symbol are ignored.
//   3. Throttle. Refuse when today's count has reached max_daily_trades or the
//      symbol traded less than cooldown_minutes ago (any direction).
//   4. Size. SELL_ALL sells the full held quantity. SELL sells
//      held * pct / 100, never more than held * max_single_trade_pct / 100.
//      No holding → warn and stop, nothing recorded.
//   5. Minimum. value = quantity * price (0 when price <= 0). Below
//      min_trade_value and not SELL_ALL → stop, nothing recorded.
//   6. Record. Dry run logs only. Live builds a domain::Order and calls
//      IPortfolioStore::applyTrade(); an ExecutionError becomes
//      success = false plus the message.
//   7. Account for it whatever the outcome: bump the daily count, stamp the
//      symbol's cooldown, append to history, notify the trade listener once.
//
// The daily count resets lazily: at every throttle check and stats query,
// when the UTC calendar day of "now" differs from the stored day.
//
// Thread model:
//   handleAlert() normally runs on the account's rebalance loop, while
//   manualRebalance() and the stats accessors run on the IPC thread. One
//   mutex covers steps 3-7 and every read of the throttle state, so two
//   threads can never both pass the daily-cap check for the last slot.
//   Listeners are invoked after the mutex is released; a listener may call
//   back into getDailyStats() or getTradeHistory().
//
// Errors:
//   handleAlert() never throws. NotFoundError and ThrottledError are caught
//   and logged inside; ExecutionError is turned into data. A listener that
//   throws is logged and ignored.
//
// Ownership:
//   Holds references to the store and clock; both must outlive it. The alert
//   source passed to start() must stay alive until stop().
// -----------------------------------------------------------------------------
class Rebalancer {
 public:
  using TradeListener = std::function<void(const domain::TradeExecution&)>;
  using RebalanceListener =
      std::function<void(const domain::RebalanceResult&)>;

  static constexpr std::size_t kDefaultHistoryLimit = 20;

  Rebalancer(std::string account_id, IPortfolioStore& store,
             const ITimeProvider& clock,
             const domain::RebalanceConfig& config = {});

  Rebalancer(const Rebalancer&) = delete;
  Rebalancer& operator=(const Rebalancer&) = delete;
  Rebalancer(Rebalancer&&) = delete;
  Rebalancer& operator=(Rebalancer&&) = delete;

  // Set before start(); not synchronized against concurrent alert handling.
  void setTradeListener(TradeListener listener);
  void setRebalanceListener(RebalanceListener listener);

  // -------------------------------------------------------------------------
  // start(source) / stop()
  // -------------------------------------------------------------------------
  // Both idempotent. stop() only closes the gate for alerts that arrive
  // afterwards; an alert already past the gate completes normally. The
  // source stays connected after stop() so manualRebalance() still reports
  // snapshots (its alerts are discarded by the gate).
  // -------------------------------------------------------------------------
  void start(IAlertSource& source);
  void stop();
  bool isRunning() const { return running_.load(); }

  void handleAlert(const domain::Alert& alert);

  // True when a trade on `symbol` would pass the throttle right now. Applies
  // the lazy daily reset. Does not consume anything.
  bool canTrade(const std::string& symbol);

  // -------------------------------------------------------------------------
  // manualRebalance()
  // -------------------------------------------------------------------------
  // Runs every alert of the source's current snapshot through handleAlert()'s
  // path, synchronously, and returns the trades recorded by this batch with
  // the snapshots before and after. Notifies the rebalance listener.
  // Throws NotConnectedError if start() was never called.
  // -------------------------------------------------------------------------
  domain::RebalanceResult manualRebalance();

  domain::DailyStats getDailyStats();

  // The most recent `limit` records, oldest first.
  std::vector<domain::TradeExecution> getTradeHistory(
      std::size_t limit = kDefaultHistoryLimit) const;

  const domain::RebalanceConfig& config() const { return config_; }
  const std::string& accountId() const { return account_id_; }

 private:
  struct Decision {
    std::string symbol;
    domain::RebalanceAction action{domain::RebalanceAction::NoAction};
    double reduce_pct{100.0};
    std::string reason;
  };

  bool urgencyEnabled(domain::ActionUrgency urgency) const;
  std::optional<Decision> decide(const domain::Alert& alert) const;

  // Gate + decide + execute + notify. Returns the record, if one was made.
  std::optional<domain::TradeExecution> process(const domain::Alert& alert);

  // Steps 3-7 minus the notification. Caller holds mutex_. Throws
  // ThrottledError / NotFoundError when the trade is refused.
  std::optional<domain::TradeExecution> executeLocked(
      const Decision& decision, const domain::Alert& alert);

  void resetIfNewDayLocked(std::int64_t now_ms);
  void checkThrottleLocked(const std::string& symbol, std::int64_t now_ms);

  void notifyTrade(const domain::TradeExecution& trade) const;

  const std::string account_id_;
  IPortfolioStore& store_;
  const ITimeProvider& clock_;
  const domain::RebalanceConfig config_;

  TradeListener on_trade_;
  RebalanceListener on_rebalance_;

  std::atomic<bool> running_{false};
  std::atomic<IAlertSource*> source_{nullptr};

  // --- Throttle state, guarded by mutex_ -------------------------------------
  mutable std::mutex mutex_;
  int daily_trade_count_{0};
  std::int64_t last_reset_day_{0};
  std::unordered_map<std::string, std::int64_t> last_trade_ms_;
  std::vector<domain::TradeExecution> history_;
};

}  // namespace riskguard
