#pragma once

#include "riskguard/domain/timestamp.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace riskguard {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that bridge ITimeProvider's int64_t milliseconds and
//         the Timestamp (system_clock::time_point) carried by domain records.
//
// @details
// Calendar arithmetic is done in UTC only. The rebalancer's daily trade
// counter resets when epoch_day() of "now" differs from the stored day, so
// the reset instant does not depend on the host's time zone.
//
// Thread-safety: Stateless, safe to call from any thread.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

constexpr std::int64_t kMillisPerMinute = 60LL * 1000LL;
constexpr std::int64_t kMillisPerDay = 24LL * 60LL * kMillisPerMinute;

// -------------------------------------------------------------------------
// epoch_day
// -------------------------------------------------------------------------
// @brief  Number of whole UTC days since 1970-01-01 for the given instant.
//
// @details
// Floor division, so instants before the epoch map to negative days instead
// of collapsing onto day 0.
// -------------------------------------------------------------------------
inline std::int64_t epoch_day(std::int64_t ms) {
  std::int64_t day = ms / kMillisPerDay;
  if (ms % kMillisPerDay < 0) {
    --day;
  }
  return day;
}

// "HH:MM:SS" in UTC. Used by RebalanceResult::summary() and log lines.
std::string format_clock(Timestamp tp);

// "YYYY-MM-DDTHH:MM:SSZ" in UTC.
std::string format_iso8601(Timestamp tp);

}  // namespace riskguard
