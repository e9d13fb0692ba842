#include "riskguard/risk/portfolio_composer.hpp"

#include "riskguard/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <string>

namespace riskguard {

namespace {

constexpr double kIdleCashPct = 30.0;
constexpr std::size_t kMaxOpportunities = 3;

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

}  // namespace

PortfolioComposer::PortfolioComposer(const domain::RiskThresholds& thresholds)
    : assessor_(thresholds) {}

domain::PortfolioRiskAssessment PortfolioComposer::assessPortfolio(
    const domain::Account& account,
    const std::vector<domain::Position>& positions) const {
  if (account.cash_balance < 0.0) {
    throw InvalidInputError("Negative cash balance (" +
                            std::to_string(account.cash_balance) +
                            ") for account '" + account.account_id + "'");
  }

  std::vector<const domain::Position*> open;
  double invested = 0.0;
  for (const auto& p : positions) {
    if (p.quantity < 0.0) {
      throw InvalidInputError("Negative quantity (" +
                              std::to_string(p.quantity) + ") for '" +
                              p.symbol + "'");
    }
    if (p.quantity == 0.0) {
      continue;
    }
    open.push_back(&p);
    invested += p.quantity * p.current_price.value_or(p.entry_price);
  }

  domain::PortfolioRiskAssessment out;
  out.account_id = account.account_id;
  out.cash_available = account.cash_balance;
  out.invested_value = invested;
  out.total_value = invested + account.cash_balance;

  // Assess against the same total that the header figures use.
  for (const auto* p : open) {
    out.position_assessments.push_back(
        assessor_.assessPosition(*p, out.total_value));
    out.total_unrealized_pnl += out.position_assessments.back().unrealized_pnl;
  }

  analyzeComposition(out);
  buildSuggestions(out);
  return out;
}

void PortfolioComposer::analyzeComposition(
    domain::PortfolioRiskAssessment& assessment) const {
  using domain::PositionAction;
  using domain::RiskLevel;

  const auto& positions = assessment.position_assessments;
  if (positions.empty()) {
    assessment.diversification_score = 100.0;
    assessment.overall_risk_level = RiskLevel::Low;
    return;
  }

  const std::size_t count = positions.size();
  if (count >= 10) {
    assessment.diversification_score = 90.0;
  } else if (count >= 5) {
    assessment.diversification_score = 70.0;
  } else if (count >= 3) {
    assessment.diversification_score = 50.0;
  } else {
    assessment.diversification_score = 30.0;
  }

  double max_conc = 0.0;
  int critical = 0;
  int high = 0;
  int moderate = 0;
  for (const auto& p : positions) {
    max_conc = std::max(max_conc, p.concentration);
    switch (p.risk_level) {
      case RiskLevel::Critical: ++critical; break;
      case RiskLevel::High:     ++high; break;
      case RiskLevel::Moderate: ++moderate; break;
      case RiskLevel::Low:      break;
    }
    if (p.recommended_action != PositionAction::Hold) {
      assessment.rebalance_needed = true;
    }
    if (p.unrealized_pnl < 0.0) {
      assessment.capital_at_risk += std::fabs(p.unrealized_pnl);
    }
  }

  assessment.max_single_position_pct = max_conc;
  if (max_conc > assessor_.thresholds().max_concentration_pct) {
    assessment.concentration_warning = true;
    assessment.diversification_score -= 20.0;
  }

  const double n = static_cast<double>(count);
  if (critical > 0) {
    assessment.overall_risk_level = RiskLevel::Critical;
  } else if (high > n * 0.3) {
    assessment.overall_risk_level = RiskLevel::High;
  } else if (moderate > n * 0.5) {
    assessment.overall_risk_level = RiskLevel::Moderate;
  } else {
    assessment.overall_risk_level = RiskLevel::Low;
  }
}

void PortfolioComposer::buildSuggestions(
    domain::PortfolioRiskAssessment& assessment) const {
  std::vector<const domain::PositionRiskAssessment*> actionable;
  for (const auto& p : assessment.position_assessments) {
    if (p.recommended_action != domain::PositionAction::Hold) {
      actionable.push_back(&p);
    }
  }

  // Equal keys keep store order.
  std::stable_sort(
      actionable.begin(), actionable.end(),
      [](const domain::PositionRiskAssessment* a,
         const domain::PositionRiskAssessment* b) {
        const int pa = domain::actionPriority(a->recommended_action);
        const int pb = domain::actionPriority(b->recommended_action);
        if (pa != pb) {
          return pa < pb;
        }
        return std::fabs(a->unrealized_pnl_pct) >
               std::fabs(b->unrealized_pnl_pct);
      });

  int priority = 1;
  for (const auto* p : actionable) {
    domain::SuggestedAction s;
    s.priority = priority++;
    s.symbol = p->symbol;
    s.action = domain::toString(p->recommended_action);
    s.reason = p->action_reason;
    s.current_value = p->market_value;
    s.pnl_pct = p->unrealized_pnl_pct;
    s.risk_level = p->risk_level;
    assessment.suggested_actions.push_back(std::move(s));
  }

  const double cash_pct =
      assessment.total_value > 0.0
          ? assessment.cash_available / assessment.total_value * 100.0
          : 0.0;
  if (cash_pct > kIdleCashPct) {
    char reason[96];
    std::snprintf(reason, sizeof(reason),
                  "Cash position at %.1f%% - consider deploying to "
                  "opportunities",
                  cash_pct);
    domain::SuggestedAction s;
    s.priority = priority;
    s.action = "deploy_cash";
    s.reason = reason;
    s.current_value = assessment.cash_available;
    s.pnl_pct = 0.0;
    assessment.suggested_actions.push_back(std::move(s));
  }
}

std::vector<domain::ReallocationSuggestion>
PortfolioComposer::reallocationSuggestions(
    const domain::PortfolioRiskAssessment& assessment,
    const std::vector<domain::Opportunity>& opportunities) const {
  using domain::PositionAction;

  std::vector<domain::ReallocationSuggestion> out;
  double freed = 0.0;

  for (const auto& p : assessment.position_assessments) {
    if (p.recommended_action != PositionAction::Exit &&
        p.recommended_action != PositionAction::Reduce) {
      continue;
    }
    const bool exit = p.recommended_action == PositionAction::Exit;
    const double amount =
        exit ? p.market_value
             : std::max(0.0, p.market_value - assessment.total_value *
                                                  p.target_allocation / 100.0);
    freed += amount;

    domain::ReallocationSuggestion s;
    s.from_symbol = p.symbol;
    s.amount = amount;
    s.reason = p.action_reason;
    s.priority = exit ? 1 : 2;
    s.expected_benefit = "Reduce risk exposure";
    s.risk_impact = std::string("Reduces portfolio risk from ") +
                    domain::toString(assessment.overall_risk_level);
    out.push_back(std::move(s));
  }

  if (opportunities.empty() || freed <= 0.0) {
    return out;
  }

  const std::size_t n = std::min(kMaxOpportunities, opportunities.size());
  const double share = freed / static_cast<double>(n);
  for (std::size_t i = 0; i < n; ++i) {
    const auto& opp = opportunities[i];
    domain::ReallocationSuggestion s;
    s.from_symbol = "freed_capital";
    s.to_symbol = opp.symbol;
    s.amount = share;
    s.reason = "New opportunity: " +
               (opp.reason.empty() ? std::string("AI identified opportunity")
                                   : opp.reason);
    s.priority = 3 + static_cast<int>(i);
    s.expected_benefit =
        opp.expected_return.empty() ? "Potential upside" : opp.expected_return;
    s.risk_impact = opp.risk_level.empty() ? "moderate" : opp.risk_level;
    out.push_back(std::move(s));
  }
  return out;
}

std::optional<domain::PositionRiskAssessment> PortfolioComposer::findPosition(
    const domain::PortfolioRiskAssessment& assessment,
    const std::string& symbol) {
  const std::string wanted = upper(symbol);
  for (const auto& p : assessment.position_assessments) {
    if (upper(p.symbol) == wanted) {
      return p;
    }
  }
  return std::nullopt;
}

}  // namespace riskguard
