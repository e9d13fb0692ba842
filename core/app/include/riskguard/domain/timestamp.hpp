#pragma once

#include <chrono>

namespace riskguard {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Type alias for wall-clock time. Used by alerts, snapshots, and trade
// executions for ordering and auditing. Components never read the system
// clock directly; they obtain "now" from an ITimeProvider and convert with
// ms_to_timestamp() (time/time_utils.hpp).
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

}  // namespace riskguard
