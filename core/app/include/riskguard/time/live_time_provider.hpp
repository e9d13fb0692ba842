#pragma once

#include "riskguard/time/i_time_provider.hpp"

namespace riskguard {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time
// -----------------------------------------------------------------------------
// Owned by RebalancingSystem in production and lent to the Rebalancer by
// const reference. No internal state.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace riskguard
