#pragma once

#include "riskguard/advisory/advice.hpp"
#include "riskguard/advisory/i_advisor.hpp"
#include "riskguard/domain/assessment.hpp"

#include <string>
#include <vector>

namespace riskguard {
namespace advisory {

// -----------------------------------------------------------------------------
// PositionDebate — multi-stance review of positions through an IAdvisor
// -----------------------------------------------------------------------------
//
// @brief  Asks the advisor for an Aggressive, a Conservative and a Neutral
//         opinion on a position, concurrently, and judges the result.
//
// @details
// Judge (deterministic):
//   1. Each argument votes for its action with weight = its confidence.
//   2. The action with the highest total weight wins. Ties go to the more
//      protective action: Exit > Reduce > Hold > Add.
//   3. confidence = winning weight / total weight.
//   4. risk_score = confidence-weighted mean of per-action severity
//      (Exit 100, Reduce 70, Hold 40, Add 20).
//   When every argument has confidence 0 the verdict is Hold, confidence 0,
//   risk score 50.
//
// A stance whose advise() throws becomes a Hold argument with confidence 0
// and the error text as its reasoning, so it carries no vote weight.
// analyze() never throws for advisor failures: a debate where every stance
// failed is a Hold verdict at risk score 50.
//
// Thread model:
//   analyze() blocks the caller until the three advise() calls return. The
//   advisor must tolerate concurrent calls (see IAdvisor).
//
// Ownership: holds a reference to the advisor; the caller keeps it alive.
// -----------------------------------------------------------------------------
class PositionDebate {
 public:
  explicit PositionDebate(IAdvisor& advisor);

  DebateVerdict analyze(const domain::PositionRiskAssessment& position,
                        const std::string& market_context = "");

  // One debate per position, in order, rolled up into a PortfolioAdvice.
  PortfolioAdvice portfolioRecommendations(
      const std::vector<domain::PositionRiskAssessment>& positions,
      const std::string& market_context = "");

  // The judge, exposed for callers that gather arguments themselves.
  static DebateVerdict judge(const std::string& symbol,
                             std::vector<DebateArgument> arguments);

  static double severity(domain::PositionAction action);
  static domain::RiskLevel levelForScore(double score);

 private:
  DebateArgument argue(const AdviceRequest& request);

  IAdvisor& advisor_;
};

}  // namespace advisory
}  // namespace riskguard
