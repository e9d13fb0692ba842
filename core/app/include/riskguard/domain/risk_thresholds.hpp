#pragma once

namespace riskguard {
namespace domain {

// -----------------------------------------------------------------------------
// RiskThresholds — rule-engine thresholds for position assessment
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of the percentages that drive the recommended
//         action for a position.
//
// @details
// These thresholds are applied by RiskAssessor (action selection and derived
// stop-loss / take-profit prices) and PortfolioComposer (concentration
// warning). They are passed by value to component constructors and remain
// constant for the lifetime of the component.
//
// Sign convention:
//   All values are percentages (e.g. -10.0 means -10%). stop_loss_pct is a
//   NEGATIVE number: a position whose unrealized P&L % falls below it is
//   recommended for exit.
//
// The risk LEVEL cut-offs (-20 / -10 / 40 / 25 / 30) belong to the
// classification scale in RiskAssessor::classify() and are not listed here.
//
// Thread model:
//   Plain data struct, copied by value.
// -----------------------------------------------------------------------------
struct RiskThresholds {
  /// Unrealized P&L % below which a position is recommended for EXIT.
  double stop_loss_pct{-10.0};

  /// Unrealized P&L % above which a position is recommended for REDUCE.
  double take_profit_pct{20.0};

  /// Portfolio share (%) above which a position counts as over-concentrated.
  double max_concentration_pct{25.0};

  /// Confidence attached to rule-engine recommendations, in [0, 1].
  double default_confidence{0.7};
};

}  // namespace domain
}  // namespace riskguard
