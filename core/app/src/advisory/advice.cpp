#include "riskguard/advisory/advice.hpp"

namespace riskguard {
namespace advisory {

const char* toString(Stance stance) {
  switch (stance) {
    case Stance::Aggressive:   return "aggressive";
    case Stance::Conservative: return "conservative";
    case Stance::Neutral:      return "neutral";
  }
  return "unknown";
}

}  // namespace advisory
}  // namespace riskguard
