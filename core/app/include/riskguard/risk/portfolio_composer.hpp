#pragma once

#include "riskguard/domain/assessment.hpp"
#include "riskguard/domain/position.hpp"
#include "riskguard/risk/risk_assessor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace riskguard {

// -----------------------------------------------------------------------------
// PortfolioComposer
// -----------------------------------------------------------------------------
//
// @brief  Aggregates per-position assessments into portfolio metrics, a
//         prioritized action list, and capital reallocation suggestions.
//
// @details
// All figures come from the one (account, positions) snapshot passed in, so
// total_value == cash_available + invested_value always holds. Positions with
// quantity 0 are closed and skipped. A negative quantity or cash balance is
// an InvalidInputError before anything is computed.
//
// Portfolio metrics:
//   diversification  by position count: >=10 → 90, >=5 → 70, >=3 → 50,
//                    else 30; minus 20 (and concentration_warning) when the
//                    largest position exceeds max_concentration_pct. An empty
//                    portfolio scores 100.
//   overall level    Critical if any position is Critical; High if more
//                    than 30% are High; Moderate if more than 50% are
//                    Moderate; else Low.
//   capital at risk  sum of |unrealized P&L| over losing positions.
//
// Suggested actions are the non-Hold positions ordered by
// (actionPriority, -|pnl%|), numbered from 1, followed by a deploy_cash line
// when cash exceeds 30% of the portfolio.
//
// Thread model: Stateless apart from the const RiskAssessor. Safe to share.
// -----------------------------------------------------------------------------
class PortfolioComposer {
 public:
  explicit PortfolioComposer(const domain::RiskThresholds& thresholds = {});

  domain::PortfolioRiskAssessment assessPortfolio(
      const domain::Account& account,
      const std::vector<domain::Position>& positions) const;

  // -------------------------------------------------------------------------
  // reallocationSuggestions(assessment, opportunities)
  // -------------------------------------------------------------------------
  // One suggestion per Exit/Reduce position:
  //   Exit   → frees the full market value, priority 1.
  //   Reduce → frees max(0, market value - total * target_allocation / 100),
  //            priority 2.
  // When opportunities are given and the freed capital is positive, the
  // first three opportunities each get freed / min(3, count), priority
  // 3, 4, 5. Nothing to reduce and no opportunities yields an empty list.
  // -------------------------------------------------------------------------
  std::vector<domain::ReallocationSuggestion> reallocationSuggestions(
      const domain::PortfolioRiskAssessment& assessment,
      const std::vector<domain::Opportunity>& opportunities = {}) const;

  // Case-insensitive symbol lookup in an existing assessment.
  static std::optional<domain::PositionRiskAssessment> findPosition(
      const domain::PortfolioRiskAssessment& assessment,
      const std::string& symbol);

  const RiskAssessor& assessor() const { return assessor_; }

 private:
  void analyzeComposition(domain::PortfolioRiskAssessment& assessment) const;
  void buildSuggestions(domain::PortfolioRiskAssessment& assessment) const;

  const RiskAssessor assessor_;
};

}  // namespace riskguard
