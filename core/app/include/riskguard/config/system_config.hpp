#pragma once

#include "riskguard/domain/position.hpp"
#include "riskguard/domain/rebalance_config.hpp"
#include "riskguard/domain/risk_thresholds.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace riskguard {

// -----------------------------------------------------------------------------
// SystemConfig — everything RebalancingSystem needs to come up
// -----------------------------------------------------------------------------
//
// @details
// Built by ConfigLoader from a JSON file, or directly in code (tests). Passed
// by value; no component keeps a reference into it.
//
//   alert_endpoint         SUB endpoint of the external portfolio monitor.
//   cmd_endpoint           REP endpoint for operator commands.
//   pub_endpoint           PUB endpoint for trade / alert telemetry.
//   notification_capacity  Bound of the notification queue (0 = unbounded).
//   advisor_endpoint       REP endpoint of the advisory oracle. When absent,
//                          the built-in RuleBasedAdvisor answers instead.
//   initial_cash /         Opening book loaded into the in-memory position
//   initial_positions      store by the executable.
// -----------------------------------------------------------------------------
struct SystemConfig {
  std::string account_id{"default"};

  std::string alert_endpoint{"tcp://127.0.0.1:5560"};
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};

  std::size_t notification_capacity{1024};

  std::optional<std::string> advisor_endpoint;
  int advisor_timeout_ms{5000};

  double initial_cash{0.0};
  std::vector<domain::Position> initial_positions;

  domain::RebalanceConfig rebalance;
  domain::RiskThresholds risk;
};

}  // namespace riskguard
