#pragma once

#include "riskguard/domain/assessment.hpp"
#include "riskguard/domain/position.hpp"
#include "riskguard/domain/risk_thresholds.hpp"

namespace riskguard {

// -----------------------------------------------------------------------------
// RiskAssessor
// -----------------------------------------------------------------------------
//
// @brief  Rule engine that classifies one position and recommends an action.
//
// @details
// assessPosition() is a pure function of (position, portfolio total,
// thresholds). It holds no mutable state, so two calls with the same inputs
// produce identical results and one instance may be shared across threads.
//
// Computation order:
//   1. Economic figures. An unknown current price falls back to the entry
//      price. P&L % is 0 when the cost basis is 0.
//   2. Concentration = market value / portfolio total (0 when total is 0).
//   3. Risk level, first match wins:
//        pnl% < -20          → Critical
//        pnl% < -10          → High
//        concentration > 40  → High
//        concentration > 25  → Moderate
//        pnl% > 30           → Moderate
//        otherwise           → Low
//   4. Action, first match wins:
//        pnl% < stop_loss          → Exit
//        pnl% > take_profit        → Reduce
//        concentration > max_conc  → Reduce
//        level == Critical         → Exit
//        level == High             → Reduce
//        otherwise                 → Hold
//   5. Target allocation and stop-loss / take-profit prices.
//
// Errors:
//   Negative quantity, entry price, current price or portfolio total raise
//   InvalidInputError before anything is computed. Negative values are never
//   clamped to zero.
// -----------------------------------------------------------------------------
class RiskAssessor {
 public:
  explicit RiskAssessor(const domain::RiskThresholds& thresholds = {});

  domain::PositionRiskAssessment assessPosition(
      const domain::Position& position, double total_portfolio_value) const;

  // Exposed separately so the level scale can be exercised on its own.
  static domain::RiskLevel classify(double pnl_pct, double concentration);

  const domain::RiskThresholds& thresholds() const { return thresholds_; }

 private:
  domain::PositionAction recommend(double pnl_pct, double concentration,
                                   domain::RiskLevel level,
                                   std::string& reason) const;

  const domain::RiskThresholds thresholds_;
};

}  // namespace riskguard
