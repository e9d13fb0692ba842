#include "riskguard/domain/alert.hpp"

namespace riskguard {
namespace domain {

const char* toString(AlertType type) {
  switch (type) {
    case AlertType::StopLossHit:   return "stop_loss_hit";
    case AlertType::TakeProfit:    return "take_profit";
    case AlertType::Concentration: return "concentration";
    case AlertType::RiskThreshold: return "risk_threshold";
    case AlertType::IdleCapital:   return "idle_capital";
  }
  return "unknown";
}

const char* toString(ActionUrgency urgency) {
  switch (urgency) {
    case ActionUrgency::Low:       return "low";
    case ActionUrgency::Medium:    return "medium";
    case ActionUrgency::High:      return "high";
    case ActionUrgency::Immediate: return "immediate";
  }
  return "unknown";
}

std::optional<AlertType> parseAlertType(const std::string& name) {
  if (name == "stop_loss_hit") return AlertType::StopLossHit;
  if (name == "take_profit") return AlertType::TakeProfit;
  if (name == "concentration") return AlertType::Concentration;
  if (name == "risk_threshold") return AlertType::RiskThreshold;
  if (name == "idle_capital") return AlertType::IdleCapital;
  return std::nullopt;
}

std::optional<ActionUrgency> parseActionUrgency(const std::string& name) {
  if (name == "low") return ActionUrgency::Low;
  if (name == "medium") return ActionUrgency::Medium;
  if (name == "high") return ActionUrgency::High;
  if (name == "immediate") return ActionUrgency::Immediate;
  return std::nullopt;
}

}  // namespace domain
}  // namespace riskguard
