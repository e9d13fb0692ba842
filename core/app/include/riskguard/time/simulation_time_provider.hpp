#pragma once

#include "riskguard/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace riskguard {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the caller last set.
//
// @details
// Lets tests walk the rebalancer through cooldown windows and across
// midnight without sleeping: set the clock, deliver an alert, advance by
// five minutes, deliver another.
//
// Thread model:
//   std::atomic<int64_t> storage. One writer (the test or replay driver),
//   any number of readers.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Monotonicity is not enforced; tests may rewind.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms relative to its current value.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace riskguard
