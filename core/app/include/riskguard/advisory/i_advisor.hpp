#pragma once

#include "riskguard/advisory/advice.hpp"

namespace riskguard {
namespace advisory {

// -----------------------------------------------------------------------------
// IAdvisor — the advisory oracle capability
// -----------------------------------------------------------------------------
//
// @brief  advise(request) → structured Advice for one position and stance.
//
// @details
// Implementations may block (a remote oracle) and may throw any
// std::exception on failure. PositionDebate calls advise() from three
// threads at once, so implementations must be safe for concurrent calls.
//
// Ownership: PositionDebate holds a reference; the caller owns the advisor.
// -----------------------------------------------------------------------------
class IAdvisor {
 public:
  virtual ~IAdvisor() = default;

  virtual Advice advise(const AdviceRequest& request) = 0;
};

}  // namespace advisory
}  // namespace riskguard
