#pragma once

#include "riskguard/domain/risk_level.hpp"

#include <optional>
#include <string>
#include <vector>

namespace riskguard {
namespace domain {

// -----------------------------------------------------------------------------
// PositionRiskAssessment
// -----------------------------------------------------------------------------
//
// @brief  The rule engine's verdict on one position, computed from a single
//         snapshot of the position and the portfolio total.
//
// @details
// Produced fresh by RiskAssessor::assessPosition() every evaluation cycle and
// never mutated afterwards. The next cycle supersedes it.
//
// All percentages are plain percent values (12.5 means 12.5%).
//   unrealized_pnl_pct  — 0 when the cost basis is 0.
//   concentration       — market value / portfolio total, 0 when total is 0.
//   target_allocation   — min(concentration, max_concentration_pct).
// -----------------------------------------------------------------------------
struct PositionRiskAssessment {
  std::string symbol;
  double quantity{0.0};
  double entry_price{0.0};
  double current_price{0.0};
  double market_value{0.0};
  double unrealized_pnl{0.0};
  double unrealized_pnl_pct{0.0};
  int days_held{0};

  RiskLevel risk_level{RiskLevel::Low};
  double concentration{0.0};

  PositionAction recommended_action{PositionAction::Hold};
  std::string action_reason;
  double target_allocation{0.0};
  double stop_loss_price{0.0};
  double take_profit_price{0.0};
  double confidence{0.0};
};

// -----------------------------------------------------------------------------
// SuggestedAction — one line of the portfolio's prioritized to-do list
// -----------------------------------------------------------------------------
// action is a lower-case tag: exit, reduce, reallocate, add, or deploy_cash.
// deploy_cash has no symbol and no risk level.
// -----------------------------------------------------------------------------
struct SuggestedAction {
  int priority{0};
  std::optional<std::string> symbol;
  std::string action;
  std::string reason;
  double current_value{0.0};
  double pnl_pct{0.0};
  std::optional<RiskLevel> risk_level;
};

// -----------------------------------------------------------------------------
// PortfolioRiskAssessment
// -----------------------------------------------------------------------------
//
// @details
// Invariants:
//   total_value == cash_available + invested_value
//   rebalance_needed == any position's recommended_action != Hold
// position_assessments keeps the store's position order.
// -----------------------------------------------------------------------------
struct PortfolioRiskAssessment {
  std::string account_id;
  double total_value{0.0};
  double cash_available{0.0};
  double invested_value{0.0};
  double total_unrealized_pnl{0.0};

  RiskLevel overall_risk_level{RiskLevel::Low};
  double diversification_score{100.0};
  bool concentration_warning{false};
  double max_single_position_pct{0.0};
  double capital_at_risk{0.0};

  bool rebalance_needed{false};
  std::vector<PositionRiskAssessment> position_assessments;
  std::vector<SuggestedAction> suggested_actions;
};

// Caller-supplied reallocation target (e.g. from a screener).
struct Opportunity {
  std::string symbol;
  std::string reason;
  std::string expected_return;
  std::string risk_level;
};

// -----------------------------------------------------------------------------
// ReallocationSuggestion
// -----------------------------------------------------------------------------
// Either "free capital from from_symbol" (to_symbol empty) or "put freed
// capital into to_symbol" (from_symbol is "freed_capital").
// -----------------------------------------------------------------------------
struct ReallocationSuggestion {
  std::optional<std::string> from_symbol;
  std::optional<std::string> to_symbol;
  double amount{0.0};
  std::string reason;
  int priority{1};
  std::string expected_benefit;
  std::string risk_impact;
};

}  // namespace domain
}  // namespace riskguard
