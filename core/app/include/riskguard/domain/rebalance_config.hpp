#pragma once

namespace riskguard {
namespace domain {

// -----------------------------------------------------------------------------
// RebalanceConfig — safety limits and auto-action thresholds
// -----------------------------------------------------------------------------
//
// @brief  Process-wide settings for the alert-to-trade pipeline. Set once at
//         startup (ConfigLoader or code), copied into the Rebalancer, and
//         never modified during a run.
//
// @details
// Three groups of settings:
//
//   Safety limits — bound how much the rebalancer may trade:
//     max_daily_trades, max_single_trade_pct, min_trade_value,
//     cooldown_minutes.
//
//   Auto-action thresholds — decide whether an alert turns into a trade:
//     auto_exit_loss_pct (negative), auto_reduce_gain_pct,
//     auto_reduce_concentration_pct, target_position_pct.
//
//   Urgency gates — which alert urgencies are acted on at all.
//
// dry_run defaults to true. Stored positions change only with dry_run off.
// -----------------------------------------------------------------------------
struct RebalanceConfig {
  bool enabled{true};
  bool dry_run{true};

  // --- Safety limits ---------------------------------------------------------
  int max_daily_trades{10};
  double max_single_trade_pct{25.0};  // Max % of a position traded at once
  double min_trade_value{100.0};      // Minimum notional for non-SELL_ALL
  int cooldown_minutes{15};           // Per-symbol quiet period

  // --- Auto-action thresholds ------------------------------------------------
  double auto_exit_loss_pct{-15.0};
  double auto_reduce_gain_pct{30.0};
  double auto_reduce_concentration_pct{30.0};

  // --- Position sizing -------------------------------------------------------
  double target_position_pct{5.0};
  double max_position_pct{10.0};

  // --- Urgency gates ---------------------------------------------------------
  bool act_on_immediate{true};
  bool act_on_high{true};
  bool act_on_medium{false};
  bool act_on_low{false};
};

}  // namespace domain
}  // namespace riskguard
