#include "riskguard/domain/order.hpp"
#include "riskguard/domain/trade_execution.hpp"
#include "riskguard/time/time_utils.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace riskguard {
namespace domain {

namespace {

// 1234567.5 -> "1,234,567.50"
std::string formatMoney(double value) {
  char digits[64];
  std::snprintf(digits, sizeof(digits), "%.2f", std::fabs(value));
  std::string whole(digits);
  const std::string::size_type dot = whole.find('.');
  std::string fraction = whole.substr(dot);
  whole.erase(dot);

  std::string grouped;
  int count = 0;
  for (auto it = whole.rbegin(); it != whole.rend(); ++it) {
    if (count != 0 && count % 3 == 0) {
      grouped.insert(grouped.begin(), ',');
    }
    grouped.insert(grouped.begin(), *it);
    ++count;
  }
  return (value < 0 ? "-" : "") + grouped + fraction;
}

}  // namespace

const char* toString(Side side) {
  return side == Side::Buy ? "buy" : "sell";
}

const char* toString(RebalanceAction action) {
  switch (action) {
    case RebalanceAction::Buy:      return "buy";
    case RebalanceAction::Sell:     return "sell";
    case RebalanceAction::SellAll:  return "sell_all";
    case RebalanceAction::NoAction: return "no_action";
  }
  return "unknown";
}

std::optional<RebalanceAction> parseRebalanceAction(const std::string& name) {
  if (name == "buy") return RebalanceAction::Buy;
  if (name == "sell") return RebalanceAction::Sell;
  if (name == "sell_all") return RebalanceAction::SellAll;
  if (name == "no_action") return RebalanceAction::NoAction;
  return std::nullopt;
}

std::string RebalanceResult::summary() const {
  int executed = 0;
  double total = 0.0;
  for (const auto& trade : trades_executed) {
    if (trade.success) {
      ++executed;
      total += trade.total_value;
    }
  }

  std::ostringstream out;
  out << "Rebalance " << (dry_run ? "(DRY RUN) " : "") << "at "
      << format_clock(timestamp) << ": " << executed << " trades, $"
      << formatMoney(total) << " total";
  return out.str();
}

}  // namespace domain
}  // namespace riskguard
