#pragma once

#include "riskguard/domain/assessment.hpp"
#include "riskguard/domain/risk_level.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace riskguard {
namespace advisory {

// -----------------------------------------------------------------------------
// Stance
// -----------------------------------------------------------------------------
// The perspective an advisor is asked to argue from. A debate asks the same
// advisor three times, once per stance.
// -----------------------------------------------------------------------------
enum class Stance {
  Aggressive,
  Conservative,
  Neutral,
};

const char* toString(Stance stance);

// -----------------------------------------------------------------------------
// AdviceRequest
// -----------------------------------------------------------------------------
// market_context is free text handed through to the oracle untouched
// (sector news, index moves, ...). It may be empty.
// -----------------------------------------------------------------------------
struct AdviceRequest {
  domain::PositionRiskAssessment position;
  std::string market_context;
  Stance stance{Stance::Neutral};
};

// -----------------------------------------------------------------------------
// Advice — the oracle's structured answer
// -----------------------------------------------------------------------------
//
// @details
// action is restricted to Hold, Reduce, Exit or Add; Reallocate is a
// portfolio-level concept the oracle never proposes. confidence is in
// [0, 1]. At most kMaxKeyPoints key points are kept.
//
// Oracle responses are validated in exactly one place:
// codec::parseAdvice(). Adapters build Advice through it and never read raw
// oracle fields themselves.
// -----------------------------------------------------------------------------
struct Advice {
  static constexpr std::size_t kMaxKeyPoints = 5;

  domain::PositionAction action{domain::PositionAction::Hold};
  double confidence{0.0};
  std::string reasoning;
  std::vector<std::string> key_points;
};

// One stance's contribution to a debate. failed is set when the advisor
// threw; the advice is then Hold with confidence 0 and the error text in
// reasoning.
struct DebateArgument {
  Stance stance{Stance::Neutral};
  Advice advice;
  bool failed{false};
};

// -----------------------------------------------------------------------------
// DebateVerdict — judge output for one position
// -----------------------------------------------------------------------------
//   confidence  winning action's vote weight / total vote weight (0 when no
//               advisor expressed any confidence).
//   risk_score  confidence-weighted mean severity in [0, 100]:
//               Exit 100, Reduce 70, Hold 40, Add 20. 50 when the total
//               weight is 0.
// -----------------------------------------------------------------------------
struct DebateVerdict {
  std::string symbol;
  std::vector<DebateArgument> arguments;  // Aggressive, Conservative, Neutral
  domain::PositionAction final_action{domain::PositionAction::Hold};
  double confidence{0.0};
  double risk_score{50.0};
  std::string summary;
};

// -----------------------------------------------------------------------------
// PortfolioAdvice — per-position debates rolled up
// -----------------------------------------------------------------------------
// risk_level thresholds on average_risk_score: >=75 Critical, >=50 High,
// >=25 Moderate, else Low. An empty portfolio scores 0.
// -----------------------------------------------------------------------------
struct PortfolioAdvice {
  double average_risk_score{0.0};
  domain::RiskLevel risk_level{domain::RiskLevel::Low};
  std::vector<std::string> to_exit;
  std::vector<std::string> to_reduce;
  std::vector<std::string> to_hold;
  std::vector<std::string> to_add;
  std::vector<DebateVerdict> verdicts;
};

}  // namespace advisory
}  // namespace riskguard
