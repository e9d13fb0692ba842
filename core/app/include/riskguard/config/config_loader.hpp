#pragma once

#include "riskguard/config/system_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace riskguard {

// -----------------------------------------------------------------------------
// ConfigLoader
// -----------------------------------------------------------------------------
//
// @brief  Reads a SystemConfig from JSON.
//
// @details
// Layout (every key optional, defaults from SystemConfig):
//
//   {
//     "account_id": "acct-1",
//     "alert_endpoint": "tcp://127.0.0.1:5560",
//     "ipc": { "cmd_endpoint": "...", "pub_endpoint": "..." },
//     "notification_capacity": 1024,
//     "advisor": { "endpoint": "tcp://127.0.0.1:5570", "timeout_ms": 5000 },
//     "rebalance": { "enabled": true, "dry_run": true,
//                    "max_daily_trades": 10, ... },
//     "risk": { "stop_loss_pct": -10, "take_profit_pct": 20, ... },
//     "portfolio": { "cash": 25000,
//                    "positions": [ { "symbol": "AAPL", "quantity": 10,
//                                     "entry_price": 150,
//                                     "current_price": 180,
//                                     "days_held": 30 } ] }
//   }
//
// Validation (ConfigError with the offending key in the message):
//   - wrong JSON type for a key
//   - max_daily_trades, cooldown_minutes, min_trade_value < 0
//   - max_single_trade_pct, target/max_position_pct outside (0, 100]
//   - target_position_pct > max_position_pct
//   - auto_exit_loss_pct or stop_loss_pct > 0
//   - default_confidence outside [0, 1]
//   - empty account_id, only one of the ipc endpoints set, advisor
//     timeout <= 0
//   - negative cash, or a position with an empty symbol or a negative
//     quantity or price
//
// An empty endpoint string is allowed for alert_endpoint and the ipc pair:
// it disables that channel.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  static SystemConfig loadFile(const std::string& path);
  static SystemConfig parse(const nlohmann::json& j);
  static SystemConfig parse(const std::string& text);

  static void validate(const SystemConfig& config);
};

}  // namespace riskguard
