#pragma once

#include "riskguard/domain/alert.hpp"
#include "riskguard/domain/trade_execution.hpp"

#include <cstdint>
#include <string>

namespace riskguard {

// -----------------------------------------------------------------------------
// AlertEvent
// -----------------------------------------------------------------------------
// Responsibility: Carries one alert from the alert source (ZMQ gateway or an
// in-process pushAlert() call) onto the account's rebalance loop, and from
// the rebalancer onto the notification loop.
// -----------------------------------------------------------------------------
struct AlertEvent {
  std::string account_id;
  domain::Alert alert;
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// TradeExecutedEvent
// -----------------------------------------------------------------------------
// Responsibility: Published on the notification loop once per recorded
// TradeExecution, successful or failed.
// -----------------------------------------------------------------------------
struct TradeExecutedEvent {
  std::string account_id;
  domain::TradeExecution trade;
};

// -----------------------------------------------------------------------------
// RebalanceCompletedEvent
// -----------------------------------------------------------------------------
// Responsibility: Published on the notification loop after every manual
// rebalance batch.
// -----------------------------------------------------------------------------
struct RebalanceCompletedEvent {
  std::string account_id;
  domain::RebalanceResult result;
};

}  // namespace riskguard
