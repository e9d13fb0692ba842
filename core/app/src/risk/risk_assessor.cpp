#include "riskguard/risk/risk_assessor.hpp"

#include "riskguard/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <string>

namespace riskguard {

namespace {

constexpr double kCriticalLossPct = -20.0;
constexpr double kHighLossPct = -10.0;
constexpr double kHighConcentrationPct = 40.0;
constexpr double kModerateConcentrationPct = 25.0;
constexpr double kModerateGainPct = 30.0;

std::string format1(double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", value);
  return buf;
}

void requireNonNegative(double value, const char* field,
                        const std::string& symbol) {
  if (value < 0.0) {
    throw InvalidInputError("Negative " + std::string(field) + " (" +
                            std::to_string(value) + ") for position '" +
                            symbol + "'");
  }
}

}  // namespace

RiskAssessor::RiskAssessor(const domain::RiskThresholds& thresholds)
    : thresholds_(thresholds) {}

domain::PositionRiskAssessment RiskAssessor::assessPosition(
    const domain::Position& position, double total_portfolio_value) const {
  requireNonNegative(position.quantity, "quantity", position.symbol);
  requireNonNegative(position.entry_price, "entry price", position.symbol);
  if (position.current_price) {
    requireNonNegative(*position.current_price, "current price",
                       position.symbol);
  }
  if (total_portfolio_value < 0.0) {
    throw InvalidInputError("Negative portfolio value (" +
                            std::to_string(total_portfolio_value) + ")");
  }

  const double current =
      position.current_price.value_or(position.entry_price);

  // --- 1. Economic figures ---------------------------------------------------
  const double market_value = position.quantity * current;
  const double cost_basis = position.quantity * position.entry_price;
  const double pnl = market_value - cost_basis;
  const double pnl_pct = cost_basis > 0.0 ? pnl / cost_basis * 100.0 : 0.0;

  // --- 2. Concentration ------------------------------------------------------
  const double concentration =
      total_portfolio_value > 0.0
          ? market_value / total_portfolio_value * 100.0
          : 0.0;

  // --- 3-4. Level and action -------------------------------------------------
  const domain::RiskLevel level = classify(pnl_pct, concentration);
  std::string reason;
  const domain::PositionAction action =
      recommend(pnl_pct, concentration, level, reason);

  domain::PositionRiskAssessment out;
  out.symbol = position.symbol;
  out.quantity = position.quantity;
  out.entry_price = position.entry_price;
  out.current_price = current;
  out.market_value = market_value;
  out.unrealized_pnl = pnl;
  out.unrealized_pnl_pct = pnl_pct;
  out.days_held = position.days_held;
  out.risk_level = level;
  out.concentration = concentration;
  out.recommended_action = action;
  out.action_reason = std::move(reason);

  // --- 5. Derived fields -----------------------------------------------------
  out.target_allocation =
      std::min(concentration, thresholds_.max_concentration_pct);
  out.stop_loss_price =
      position.entry_price * (1.0 + thresholds_.stop_loss_pct / 100.0);
  out.take_profit_price =
      position.entry_price * (1.0 + thresholds_.take_profit_pct / 100.0);
  out.confidence = thresholds_.default_confidence;
  return out;
}

domain::RiskLevel RiskAssessor::classify(double pnl_pct,
                                         double concentration) {
  using domain::RiskLevel;
  if (pnl_pct < kCriticalLossPct) return RiskLevel::Critical;
  if (pnl_pct < kHighLossPct) return RiskLevel::High;
  if (concentration > kHighConcentrationPct) return RiskLevel::High;
  if (concentration > kModerateConcentrationPct) return RiskLevel::Moderate;
  if (pnl_pct > kModerateGainPct) return RiskLevel::Moderate;
  return RiskLevel::Low;
}

domain::PositionAction RiskAssessor::recommend(double pnl_pct,
                                               double concentration,
                                               domain::RiskLevel level,
                                               std::string& reason) const {
  using domain::PositionAction;
  using domain::RiskLevel;

  if (pnl_pct < thresholds_.stop_loss_pct) {
    reason = "Stop loss triggered: " + format1(pnl_pct) +
             "% loss exceeds " + format1(thresholds_.stop_loss_pct) +
             "% threshold";
    return PositionAction::Exit;
  }
  if (pnl_pct > thresholds_.take_profit_pct) {
    reason = "Take profit opportunity: " + format1(pnl_pct) +
             "% gain exceeds " + format1(thresholds_.take_profit_pct) +
             "% threshold";
    return PositionAction::Reduce;
  }
  if (concentration > thresholds_.max_concentration_pct) {
    reason = "Position too concentrated at " + format1(concentration) +
             "% of portfolio (max " +
             format1(thresholds_.max_concentration_pct) + "%)";
    return PositionAction::Reduce;
  }
  if (level == RiskLevel::Critical) {
    reason = "Critical risk level - recommend full exit";
    return PositionAction::Exit;
  }
  if (level == RiskLevel::High) {
    reason = "High risk level - consider reducing exposure";
    return PositionAction::Reduce;
  }
  reason = "Position within acceptable risk parameters";
  return PositionAction::Hold;
}

}  // namespace riskguard
