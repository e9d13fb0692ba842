#pragma once

#include "riskguard/domain/order.hpp"
#include "riskguard/domain/position.hpp"

#include <optional>
#include <string>
#include <vector>

namespace riskguard {

// -----------------------------------------------------------------------------
// IPortfolioStore — account and position persistence boundary
// -----------------------------------------------------------------------------
//
// @brief  The only way the risk core reads holdings or changes them.
//
// @details
// Reads are used by PortfolioRiskService (assessment) and the Rebalancer
// (held quantity for SELL sizing). applyTrade() is the write path and is
// called by the Rebalancer in live mode only; dry-run never calls it.
//
// applyTrade() contract:
//   - All-or-nothing. The position change, the cash change and the order log
//     entry happen together or not at all.
//   - On any failure it throws ExecutionError and leaves the store unchanged.
//   - Returns the id assigned to the order.
//   - Must complete or fail promptly. No retry is performed by callers.
//
// Thread model:
//   Implementations must be safe for concurrent reads and writes. The IPC
//   thread reads while the rebalance loop writes.
//
// Ownership:
//   Owned by the caller of RebalancingSystem (main() or a test). Components
//   hold a reference and never outlive it.
// -----------------------------------------------------------------------------
class IPortfolioStore {
 public:
  virtual ~IPortfolioStore() = default;

  virtual std::optional<domain::Account> account(
      const std::string& account_id) const = 0;

  // Open and closed holdings of the account, in insertion order. Empty for
  // an unknown account.
  virtual std::vector<domain::Position> positions(
      const std::string& account_id) const = 0;

  virtual std::optional<domain::Position> position(
      const std::string& account_id, const std::string& symbol) const = 0;

  virtual domain::OrderId applyTrade(const domain::Order& order) = 0;
};

}  // namespace riskguard
