#pragma once

#include "riskguard/domain/alert.hpp"

#include <optional>

namespace riskguard {

// -----------------------------------------------------------------------------
// IAlertSource — output contract of the external portfolio monitor
// -----------------------------------------------------------------------------
//
// @brief  Read side of the monitor: its most recent portfolio snapshot.
//
// @details
// The push side (one call per newly detected condition) is not part of this
// interface. The monitor's alerts reach the Rebalancer as AlertEvents on the
// account's rebalance loop, wherever they come from (ZMQ feed, in-process
// pushAlert(), a test).
//
// currentSnapshot() returns std::nullopt until the monitor has produced its
// first snapshot.
//
// Thread-safety: Must be safe to call from any thread.
// -----------------------------------------------------------------------------
class IAlertSource {
 public:
  virtual ~IAlertSource() = default;

  virtual std::optional<domain::PortfolioSnapshot> currentSnapshot() const = 0;
};

}  // namespace riskguard
