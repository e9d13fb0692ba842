#include "riskguard/time/time_utils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace riskguard {

namespace {

std::tm to_utc_tm(Timestamp tp) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
  std::tm utc{};
  // gmtime_r is the re-entrant POSIX variant; plain gmtime shares a static
  // buffer across threads.
  gmtime_r(&seconds, &utc);
  return utc;
}

}  // namespace

std::string format_clock(Timestamp tp) {
  const std::tm utc = to_utc_tm(tp);
  std::ostringstream out;
  out << std::put_time(&utc, "%H:%M:%S");
  return out.str();
}

std::string format_iso8601(Timestamp tp) {
  const std::tm utc = to_utc_tm(tp);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

}  // namespace riskguard
