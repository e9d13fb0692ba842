#pragma once

#include <stdexcept>
#include <string>

namespace riskguard {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exception types raised at the boundaries of the risk core.
//
// @details
// Every failure in riskguard is either skipped with a log line or recorded
// as data (TradeExecution::error). Exceptions are used only where a caller
// handed us something we cannot work with:
//
//   InvalidInputError  — negative quantity/price/portfolio value, malformed
//                        advisory response. Raised before any computation.
//   NotFoundError      — unknown account, or no position for a SELL-class
//                        alert. The Rebalancer catches the latter internally.
//   ThrottledError     — daily cap or per-symbol cooldown active. Raised and
//                        caught inside the Rebalancer, logged, never escalated.
//   ExecutionError     — the position store failed to apply a trade. Captured
//                        into TradeExecution::error with success = false.
//   ConfigError        — configuration file missing or out of range.
//   NotConnectedError  — manual rebalance requested before start().
//
// All derive from RiskGuardError so a top-level handler can catch the whole
// family with a single clause.
// -----------------------------------------------------------------------------
class RiskGuardError : public std::runtime_error {
 public:
  explicit RiskGuardError(const std::string& what) : std::runtime_error(what) {}
};

class InvalidInputError : public RiskGuardError {
 public:
  explicit InvalidInputError(const std::string& what) : RiskGuardError(what) {}
};

class NotFoundError : public RiskGuardError {
 public:
  explicit NotFoundError(const std::string& what) : RiskGuardError(what) {}
};

class ThrottledError : public RiskGuardError {
 public:
  explicit ThrottledError(const std::string& what) : RiskGuardError(what) {}
};

class ExecutionError : public RiskGuardError {
 public:
  explicit ExecutionError(const std::string& what) : RiskGuardError(what) {}
};

class ConfigError : public RiskGuardError {
 public:
  explicit ConfigError(const std::string& what) : RiskGuardError(what) {}
};

class NotConnectedError : public RiskGuardError {
 public:
  explicit NotConnectedError(const std::string& what)
      : RiskGuardError(what) {}
};

}  // namespace riskguard
