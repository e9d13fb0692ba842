#pragma once

#include "riskguard/advisory/i_advisor.hpp"
#include "riskguard/domain/risk_thresholds.hpp"

namespace riskguard {
namespace advisory {

// -----------------------------------------------------------------------------
// RuleBasedAdvisor
// -----------------------------------------------------------------------------
//
// @brief  Offline IAdvisor: re-runs the rule engine with thresholds shifted
//         by stance. Used when no external oracle is configured, and in tests.
//
// @details
// Relative to the base thresholds:
//   Aggressive    stop-loss twice as deep, take-profit twice as high,
//                 concentration limit +10 points, confidence -0.1. A Hold on
//                 a profitable low-risk position becomes Add.
//   Conservative  stop-loss and take-profit halved, concentration limit
//                 -5 points, confidence +0.1.
//   Neutral       base thresholds.
// Confidence is kept inside [0, 1].
//
// Stateless after construction, so concurrent advise() calls are safe.
// -----------------------------------------------------------------------------
class RuleBasedAdvisor final : public IAdvisor {
 public:
  explicit RuleBasedAdvisor(const domain::RiskThresholds& base = {});

  Advice advise(const AdviceRequest& request) override;

  domain::RiskThresholds thresholdsFor(Stance stance) const;

 private:
  const domain::RiskThresholds base_;
};

}  // namespace advisory
}  // namespace riskguard
