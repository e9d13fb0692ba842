#pragma once

#include <optional>
#include <string>

namespace riskguard {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLevel
// -----------------------------------------------------------------------------
// Responsibility: Ordered severity scale shared by position and portfolio
// assessments. The enumerator order IS the severity order, so comparisons
// like `level >= RiskLevel::High` are meaningful.
// -----------------------------------------------------------------------------
enum class RiskLevel {
  Low,
  Moderate,
  High,
  Critical,
};

// -----------------------------------------------------------------------------
// PositionAction
// -----------------------------------------------------------------------------
// Responsibility: What the rule engine recommends doing with a position.
//   Hold       — keep the position unchanged.
//   Reduce     — partial exit.
//   Exit       — full exit.
//   Add        — increase the position.
//   Reallocate — move the capital to a better opportunity.
// -----------------------------------------------------------------------------
enum class PositionAction {
  Hold,
  Reduce,
  Exit,
  Add,
  Reallocate,
};

// Lower-case wire names ("low", "moderate", ...). Used by the JSON codec and
// by log lines.
const char* toString(RiskLevel level);
const char* toString(PositionAction action);

// Inverse of toString(). Returns std::nullopt for unknown names; callers
// decide whether that is an error.
std::optional<RiskLevel> parseRiskLevel(const std::string& name);
std::optional<PositionAction> parsePositionAction(const std::string& name);

// -----------------------------------------------------------------------------
// actionPriority(action)
// -----------------------------------------------------------------------------
// @brief  Sort key for suggested actions: Exit(1) < Reduce(2) <
//         Reallocate(3) < Add(4) < Hold(5).
// -----------------------------------------------------------------------------
int actionPriority(PositionAction action);

}  // namespace domain
}  // namespace riskguard
