#pragma once

#include <optional>
#include <string>

namespace riskguard {
namespace domain {

// -----------------------------------------------------------------------------
// Position — a held quantity of one symbol
// -----------------------------------------------------------------------------
//
// @brief  Read-only view of a holding as reported by the position store.
//
// @details
// Only long holdings exist in this model: quantity is the number of units
// held and must be >= 0. A quantity of 0 means the position is closed; the
// portfolio composer skips it.
//
// current_price is optional because a store may not have a fresh quote. When
// it is absent the risk assessor values the position at entry_price, so an
// unquoted position shows zero unrealized P&L rather than a total loss.
//
// Derived figures (market value, unrealized P&L) are NOT stored here. They
// are computed by RiskAssessor from a single snapshot so the portfolio totals
// and the per-position figures always agree.
//
// Thread model:
//   Value type. The authoritative copy lives inside the position store;
//   components receive copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;                   // Ticker, e.g. "AAPL"
  double quantity{0.0};                 // Units held, >= 0
  double entry_price{0.0};              // Average entry price per unit
  std::optional<double> current_price;  // Last quote, if known
  int days_held{0};                     // Calendar days since first fill
};

// -----------------------------------------------------------------------------
// Account — cash side of a portfolio
// -----------------------------------------------------------------------------
struct Account {
  std::string account_id;
  double cash_balance{0.0};
};

}  // namespace domain
}  // namespace riskguard
