#pragma once

#include "riskguard/domain/risk_level.hpp"
#include "riskguard/domain/timestamp.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace riskguard {
namespace domain {

// -----------------------------------------------------------------------------
// AlertType
// -----------------------------------------------------------------------------
// Responsibility: The condition the external portfolio monitor detected.
//   StopLossHit    — a position's loss crossed its stop-loss threshold.
//   TakeProfit     — a position's gain crossed its take-profit threshold.
//   Concentration  — a position grew past its allowed share of the portfolio.
//   RiskThreshold  — a position reached the critical risk level.
//   IdleCapital    — too much of the portfolio sits in cash.
// -----------------------------------------------------------------------------
enum class AlertType {
  StopLossHit,
  TakeProfit,
  Concentration,
  RiskThreshold,
  IdleCapital,
};

// -----------------------------------------------------------------------------
// ActionUrgency
// -----------------------------------------------------------------------------
// Ordered: Low < Medium < High < Immediate. Whether an urgency tier is acted
// on is decided per tier by RebalanceConfig::act_on_* flags.
// -----------------------------------------------------------------------------
enum class ActionUrgency {
  Low,
  Medium,
  High,
  Immediate,
};

const char* toString(AlertType type);
const char* toString(ActionUrgency urgency);
std::optional<AlertType> parseAlertType(const std::string& name);
std::optional<ActionUrgency> parseActionUrgency(const std::string& name);

// -----------------------------------------------------------------------------
// Alert — one detected condition, consumed exactly once by the Rebalancer
// -----------------------------------------------------------------------------
//
// @details
// The numeric payload carries the figures that triggered the alert. Keys used
// by the rebalancer:
//   "pnl_pct"            — unrealized P&L % (STOP_LOSS_HIT, TAKE_PROFIT)
//   "current_price"      — last price, used as the trade price
//   "concentration_pct"  — portfolio share % (CONCENTRATION)
//   "idle_pct"           — cash share % (IDLE_CAPITAL)
// Unknown keys are carried through untouched. A missing key reads as 0.
// -----------------------------------------------------------------------------
struct Alert {
  AlertType alert_type{AlertType::RiskThreshold};
  ActionUrgency urgency{ActionUrgency::Low};
  std::optional<std::string> symbol;
  std::string title;
  std::string message;
  std::map<std::string, double> data;
  Timestamp timestamp{};

  // Payload lookup with the "missing reads as 0" rule.
  double value(const std::string& key) const {
    auto it = data.find(key);
    return it == data.end() ? 0.0 : it->second;
  }
};

// -----------------------------------------------------------------------------
// PortfolioSnapshot — the monitor's latest view of one account
// -----------------------------------------------------------------------------
//
// @details
// Produced by the external monitor on every polling cycle. `alerts` holds the
// conditions active in THIS snapshot; a manual rebalance re-evaluates all of
// them. Snapshots are superseded, never updated.
// -----------------------------------------------------------------------------
struct PortfolioSnapshot {
  std::string account_id;
  Timestamp timestamp{};
  double total_value{0.0};
  double cash{0.0};
  double invested_value{0.0};
  double total_unrealized_pnl{0.0};
  int position_count{0};
  RiskLevel risk_level{RiskLevel::Low};
  std::vector<Alert> alerts;
};

}  // namespace domain
}  // namespace riskguard
