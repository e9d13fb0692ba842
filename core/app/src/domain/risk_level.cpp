#include "riskguard/domain/risk_level.hpp"

namespace riskguard {
namespace domain {

const char* toString(RiskLevel level) {
  switch (level) {
    case RiskLevel::Low:      return "low";
    case RiskLevel::Moderate: return "moderate";
    case RiskLevel::High:     return "high";
    case RiskLevel::Critical: return "critical";
  }
  return "unknown";
}

const char* toString(PositionAction action) {
  switch (action) {
    case PositionAction::Hold:       return "hold";
    case PositionAction::Reduce:     return "reduce";
    case PositionAction::Exit:       return "exit";
    case PositionAction::Add:        return "add";
    case PositionAction::Reallocate: return "reallocate";
  }
  return "unknown";
}

std::optional<RiskLevel> parseRiskLevel(const std::string& name) {
  if (name == "low") return RiskLevel::Low;
  if (name == "moderate") return RiskLevel::Moderate;
  if (name == "high") return RiskLevel::High;
  if (name == "critical") return RiskLevel::Critical;
  return std::nullopt;
}

std::optional<PositionAction> parsePositionAction(const std::string& name) {
  if (name == "hold") return PositionAction::Hold;
  if (name == "reduce") return PositionAction::Reduce;
  if (name == "exit") return PositionAction::Exit;
  if (name == "add") return PositionAction::Add;
  if (name == "reallocate") return PositionAction::Reallocate;
  return std::nullopt;
}

int actionPriority(PositionAction action) {
  switch (action) {
    case PositionAction::Exit:       return 1;
    case PositionAction::Reduce:     return 2;
    case PositionAction::Reallocate: return 3;
    case PositionAction::Add:        return 4;
    case PositionAction::Hold:       return 5;
  }
  return 5;
}

}  // namespace domain
}  // namespace riskguard
