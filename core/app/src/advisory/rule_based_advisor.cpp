#include "riskguard/advisory/rule_based_advisor.hpp"

#include "riskguard/risk/risk_assessor.hpp"

#include <algorithm>
#include <cstdio>
#include <string>

namespace riskguard {
namespace advisory {

namespace {

std::string describe(const char* label, double value, const char* unit) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), "%s %.1f%s", label, value, unit);
  return buf;
}

}  // namespace

RuleBasedAdvisor::RuleBasedAdvisor(const domain::RiskThresholds& base)
    : base_(base) {}

domain::RiskThresholds RuleBasedAdvisor::thresholdsFor(Stance stance) const {
  domain::RiskThresholds t = base_;
  switch (stance) {
    case Stance::Aggressive:
      t.stop_loss_pct = base_.stop_loss_pct * 2.0;
      t.take_profit_pct = base_.take_profit_pct * 2.0;
      t.max_concentration_pct = base_.max_concentration_pct + 10.0;
      t.default_confidence = base_.default_confidence - 0.1;
      break;
    case Stance::Conservative:
      t.stop_loss_pct = base_.stop_loss_pct / 2.0;
      t.take_profit_pct = base_.take_profit_pct / 2.0;
      t.max_concentration_pct = base_.max_concentration_pct - 5.0;
      t.default_confidence = base_.default_confidence + 0.1;
      break;
    case Stance::Neutral:
      break;
  }
  t.default_confidence = std::clamp(t.default_confidence, 0.0, 1.0);
  return t;
}

Advice RuleBasedAdvisor::advise(const AdviceRequest& request) {
  const domain::PositionRiskAssessment& pos = request.position;
  const domain::RiskThresholds thresholds = thresholdsFor(request.stance);

  // Rebuild the inputs the assessment was computed from. The portfolio total
  // is recovered from market value and concentration.
  domain::Position position;
  position.symbol = pos.symbol;
  position.quantity = pos.quantity;
  position.entry_price = pos.entry_price;
  position.current_price = pos.current_price;
  position.days_held = pos.days_held;
  const double total =
      pos.concentration > 0.0 ? pos.market_value / pos.concentration * 100.0
                              : 0.0;

  const RiskAssessor assessor(thresholds);
  const domain::PositionRiskAssessment view =
      assessor.assessPosition(position, total);

  Advice advice;
  advice.action = view.recommended_action;
  advice.confidence = thresholds.default_confidence;
  advice.reasoning = std::string(toString(request.stance)) + " view: " +
                     view.action_reason;

  if (request.stance == Stance::Aggressive &&
      advice.action == domain::PositionAction::Hold &&
      view.unrealized_pnl_pct > 0.0 &&
      view.risk_level == domain::RiskLevel::Low) {
    advice.action = domain::PositionAction::Add;
    advice.reasoning = "aggressive view: profitable low-risk position, "
                       "room to add";
  }

  advice.key_points.push_back(
      describe("Unrealized P&L", view.unrealized_pnl_pct, "%"));
  advice.key_points.push_back(
      describe("Portfolio concentration", view.concentration, "%"));
  advice.key_points.push_back(std::string("Risk level ") +
                              domain::toString(view.risk_level));
  if (!request.market_context.empty()) {
    advice.key_points.push_back("Context: " + request.market_context);
  }
  return advice;
}

}  // namespace advisory
}  // namespace riskguard
