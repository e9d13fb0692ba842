#pragma once

#include <cstdint>

namespace riskguard {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "current time" away from std::chrono::system_clock.
//
// @details
// The rebalancer's cooldowns and its daily trade counter are both functions
// of "now". Reading the system clock directly would make those rules
// untestable without sleeping, so the clock is injected:
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → a value the caller sets (tests, replays).
//
// Epoch milliseconds rather than a time_point: alert feeds and IPC messages
// carry integer timestamps, and cooldown arithmetic is plain subtraction.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference. The provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since 1970-01-01 00:00:00 UTC.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace riskguard
