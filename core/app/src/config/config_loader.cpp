#include "riskguard/config/config_loader.hpp"

#include "riskguard/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <utility>
#include <sstream>

namespace riskguard {

namespace {

using nlohmann::json;

// Reads `key` from `j` into `out` when present. A present key of the wrong
// type is a ConfigError rather than a silent default.
template <typename T>
void read(const json& j, const char* key, T& out, const std::string& scope) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const json::exception&) {
    throw ConfigError("Invalid type for " + scope + key);
  }
}

const json& section(const json& j, const char* key, const json& empty) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return empty;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("Section '") + key + "' must be an object");
  }
  return *it;
}

void require(bool ok, const std::string& message) {
  if (!ok) {
    throw ConfigError(message);
  }
}

bool isPercent(double v) { return v > 0.0 && v <= 100.0; }

}  // namespace

SystemConfig ConfigLoader::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("Cannot open config file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse(buffer.str());
}

SystemConfig ConfigLoader::parse(const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("Malformed config JSON: ") + e.what());
  }
  return parse(j);
}

SystemConfig ConfigLoader::parse(const json& j) {
  if (!j.is_object()) {
    throw ConfigError("Config root must be a JSON object");
  }

  const json empty = json::object();
  SystemConfig cfg;

  read(j, "account_id", cfg.account_id, "");
  read(j, "alert_endpoint", cfg.alert_endpoint, "");
  auto capacity = static_cast<std::int64_t>(cfg.notification_capacity);
  read(j, "notification_capacity", capacity, "");
  require(capacity >= 0, "notification_capacity must be >= 0");
  cfg.notification_capacity = static_cast<std::size_t>(capacity);

  const json& ipc = section(j, "ipc", empty);
  read(ipc, "cmd_endpoint", cfg.cmd_endpoint, "ipc.");
  read(ipc, "pub_endpoint", cfg.pub_endpoint, "ipc.");

  const json& advisor = section(j, "advisor", empty);
  std::string advisor_endpoint;
  read(advisor, "endpoint", advisor_endpoint, "advisor.");
  if (!advisor_endpoint.empty()) {
    cfg.advisor_endpoint = advisor_endpoint;
  }
  read(advisor, "timeout_ms", cfg.advisor_timeout_ms, "advisor.");

  const json& rb = section(j, "rebalance", empty);
  auto& r = cfg.rebalance;
  read(rb, "enabled", r.enabled, "rebalance.");
  read(rb, "dry_run", r.dry_run, "rebalance.");
  read(rb, "max_daily_trades", r.max_daily_trades, "rebalance.");
  read(rb, "max_single_trade_pct", r.max_single_trade_pct, "rebalance.");
  read(rb, "min_trade_value", r.min_trade_value, "rebalance.");
  read(rb, "cooldown_minutes", r.cooldown_minutes, "rebalance.");
  read(rb, "auto_exit_loss_pct", r.auto_exit_loss_pct, "rebalance.");
  read(rb, "auto_reduce_gain_pct", r.auto_reduce_gain_pct, "rebalance.");
  read(rb, "auto_reduce_concentration_pct", r.auto_reduce_concentration_pct,
       "rebalance.");
  read(rb, "target_position_pct", r.target_position_pct, "rebalance.");
  read(rb, "max_position_pct", r.max_position_pct, "rebalance.");
  read(rb, "act_on_immediate", r.act_on_immediate, "rebalance.");
  read(rb, "act_on_high", r.act_on_high, "rebalance.");
  read(rb, "act_on_medium", r.act_on_medium, "rebalance.");
  read(rb, "act_on_low", r.act_on_low, "rebalance.");

  const json& rk = section(j, "risk", empty);
  auto& t = cfg.risk;
  read(rk, "stop_loss_pct", t.stop_loss_pct, "risk.");
  read(rk, "take_profit_pct", t.take_profit_pct, "risk.");
  read(rk, "max_concentration_pct", t.max_concentration_pct, "risk.");
  read(rk, "default_confidence", t.default_confidence, "risk.");

  const json& book = section(j, "portfolio", empty);
  read(book, "cash", cfg.initial_cash, "portfolio.");
  auto positions = book.find("positions");
  if (positions != book.end() && !positions->is_null()) {
    if (!positions->is_array()) {
      throw ConfigError("portfolio.positions must be an array");
    }
    for (const auto& p : *positions) {
      if (!p.is_object()) {
        throw ConfigError("portfolio.positions entries must be objects");
      }
      domain::Position pos;
      read(p, "symbol", pos.symbol, "portfolio.positions.");
      read(p, "quantity", pos.quantity, "portfolio.positions.");
      read(p, "entry_price", pos.entry_price, "portfolio.positions.");
      double price = -1.0;
      read(p, "current_price", price, "portfolio.positions.");
      if (p.contains("current_price") && !p.at("current_price").is_null()) {
        pos.current_price = price;
      }
      read(p, "days_held", pos.days_held, "portfolio.positions.");
      cfg.initial_positions.push_back(std::move(pos));
    }
  }

  validate(cfg);
  return cfg;
}

void ConfigLoader::validate(const SystemConfig& cfg) {
  require(!cfg.account_id.empty(), "account_id must not be empty");
  require(cfg.cmd_endpoint.empty() == cfg.pub_endpoint.empty(),
          "ipc.cmd_endpoint and ipc.pub_endpoint must be set together");
  require(cfg.advisor_timeout_ms > 0, "advisor.timeout_ms must be positive");

  const auto& r = cfg.rebalance;
  require(r.max_daily_trades >= 0, "rebalance.max_daily_trades must be >= 0");
  require(r.cooldown_minutes >= 0, "rebalance.cooldown_minutes must be >= 0");
  require(r.min_trade_value >= 0.0, "rebalance.min_trade_value must be >= 0");
  require(isPercent(r.max_single_trade_pct),
          "rebalance.max_single_trade_pct must be in (0, 100]");
  require(isPercent(r.target_position_pct),
          "rebalance.target_position_pct must be in (0, 100]");
  require(isPercent(r.max_position_pct),
          "rebalance.max_position_pct must be in (0, 100]");
  require(r.target_position_pct <= r.max_position_pct,
          "rebalance.target_position_pct exceeds max_position_pct");
  require(r.auto_exit_loss_pct <= 0.0,
          "rebalance.auto_exit_loss_pct must be <= 0");
  require(r.auto_reduce_gain_pct >= 0.0,
          "rebalance.auto_reduce_gain_pct must be >= 0");
  require(isPercent(r.auto_reduce_concentration_pct),
          "rebalance.auto_reduce_concentration_pct must be in (0, 100]");

  const auto& t = cfg.risk;
  require(t.stop_loss_pct <= 0.0, "risk.stop_loss_pct must be <= 0");
  require(t.take_profit_pct >= 0.0, "risk.take_profit_pct must be >= 0");
  require(isPercent(t.max_concentration_pct),
          "risk.max_concentration_pct must be in (0, 100]");
  require(t.default_confidence >= 0.0 && t.default_confidence <= 1.0,
          "risk.default_confidence must be in [0, 1]");

  require(cfg.initial_cash >= 0.0, "portfolio.cash must be >= 0");
  for (const auto& p : cfg.initial_positions) {
    require(!p.symbol.empty(), "portfolio.positions: symbol is required");
    require(p.quantity >= 0.0 && p.entry_price >= 0.0 &&
                p.current_price.value_or(0.0) >= 0.0,
            "portfolio.positions: negative quantity or price for " +
                p.symbol);
  }
}

}  // namespace riskguard
