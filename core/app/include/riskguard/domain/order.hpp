#pragma once

#include "riskguard/domain/timestamp.hpp"

#include <cstdint>
#include <string>

namespace riskguard {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Identifier the position store assigns to every applied trade. 0 means
// "not yet assigned" (dry-run trades never get one).
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;

enum class Side {
  Buy,
  Sell,
};

const char* toString(Side side);

// -----------------------------------------------------------------------------
// Order — a trade applied to the position store
// -----------------------------------------------------------------------------
//
// @details
// Built by the Rebalancer in live mode and handed to
// IPortfolioStore::applyTrade(). The store fills in `id` and appends the
// order to its order log in the same transaction that mutates the position
// and the cash balance.
//
// Value type: copies in the order log are snapshots and never change.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  std::string account_id;
  std::string symbol;
  Side side{Side::Sell};
  double quantity{0.0};
  double price{0.0};
  Timestamp timestamp{};
};

}  // namespace domain
}  // namespace riskguard
