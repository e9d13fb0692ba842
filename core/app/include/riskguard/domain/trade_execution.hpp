#pragma once

#include "riskguard/domain/alert.hpp"
#include "riskguard/domain/timestamp.hpp"

#include <optional>
#include <string>
#include <vector>

namespace riskguard {
namespace domain {

// -----------------------------------------------------------------------------
// RebalanceAction
// -----------------------------------------------------------------------------
// SellAll closes the whole position and is exempt from both the
// single-trade cap and the minimum-notional check. NoAction is what an
// alert handler returns when the alert does not warrant a trade.
// -----------------------------------------------------------------------------
enum class RebalanceAction {
  Buy,
  Sell,
  SellAll,
  NoAction,
};

const char* toString(RebalanceAction action);
std::optional<RebalanceAction> parseRebalanceAction(const std::string& name);

// -----------------------------------------------------------------------------
// TradeExecution — one entry of the rebalancer's append-only trade log
// -----------------------------------------------------------------------------
//
// @brief  Record of a single execution attempt, real or simulated.
//
// @details
// Created exactly once per attempt that passed the throttle, position and
// minimum-value checks. Failed attempts are recorded too: success is false
// and error carries the store's message. Records are never mutated after
// they are appended to the history.
//
// total_value is quantity * price at the moment of the attempt (0 when the
// alert carried no usable price).
// -----------------------------------------------------------------------------
struct TradeExecution {
  Timestamp timestamp{};
  std::string symbol;
  RebalanceAction action{RebalanceAction::NoAction};
  double quantity{0.0};
  double price{0.0};
  double total_value{0.0};
  std::string reason;
  std::optional<AlertType> alert_type;
  bool success{true};
  std::optional<std::string> error;
};

// -----------------------------------------------------------------------------
// RebalanceResult — outcome of one manual rebalance batch
// -----------------------------------------------------------------------------
struct RebalanceResult {
  Timestamp timestamp{};
  std::vector<TradeExecution> trades_executed;  // New in this batch only
  int alerts_processed{0};
  std::optional<PortfolioSnapshot> snapshot_before;
  std::optional<PortfolioSnapshot> snapshot_after;
  bool dry_run{true};

  // "Rebalance (DRY RUN) at HH:MM:SS: N trades, $X total". Counts and sums
  // successful trades only; the clock is UTC.
  std::string summary() const;
};

// -----------------------------------------------------------------------------
// DailyStats — read-only view of the rebalancer's throttle state
// -----------------------------------------------------------------------------
struct DailyStats {
  int trades_today{0};
  int trades_remaining{0};
  double total_volume{0.0};  // Sum of successful trade values today
  int success_count{0};
  int failure_count{0};
  bool dry_run{true};
};

}  // namespace domain
}  // namespace riskguard
