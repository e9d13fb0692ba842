#include "riskguard/codec/json_codec.hpp"

#include "riskguard/errors.hpp"
#include "riskguard/time/time_utils.hpp"

#include <cstdint>
#include <utility>

namespace riskguard {
namespace codec {

using nlohmann::json;

namespace {

// Runs a decoder and converts nlohmann's exceptions into InvalidInputError.
template <typename Fn>
auto translate(const char* what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const json::exception& e) {
    throw InvalidInputError(std::string("Malformed ") + what + ": " +
                            e.what());
  }
}

json optionalString(const std::optional<std::string>& value) {
  return value ? json(*value) : json(nullptr);
}

std::optional<std::string> readOptionalString(const json& j,
                                              const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

template <typename Enum, typename Parser>
Enum readEnum(const json& j, const char* key, Parser parse) {
  const std::string name = j.at(key).get<std::string>();
  std::optional<Enum> value = parse(name);
  if (!value) {
    throw InvalidInputError(std::string("Unknown ") + key + " '" + name +
                            "'");
  }
  return *value;
}

json stringList(const std::vector<std::string>& values) {
  json out = json::array();
  for (const auto& v : values) {
    out.push_back(v);
  }
  return out;
}

}  // namespace

// --- Alerts and snapshots ----------------------------------------------------

json toJson(const domain::Alert& alert) {
  json data = json::object();
  for (const auto& [key, value] : alert.data) {
    data[key] = value;
  }
  return json{
      {"alert_type", domain::toString(alert.alert_type)},
      {"urgency", domain::toString(alert.urgency)},
      {"symbol", optionalString(alert.symbol)},
      {"title", alert.title},
      {"message", alert.message},
      {"data", data},
      {"timestamp_ms", timestamp_to_ms(alert.timestamp)},
  };
}

domain::Alert alertFromJson(const json& j) {
  return translate("alert", [&j] {
    domain::Alert alert;
    alert.alert_type = readEnum<domain::AlertType>(j, "alert_type",
                                                   domain::parseAlertType);
    alert.urgency = readEnum<domain::ActionUrgency>(
        j, "urgency", domain::parseActionUrgency);
    alert.symbol = readOptionalString(j, "symbol");
    alert.title = j.value("title", std::string());
    alert.message = j.value("message", std::string());

    // Only numeric payload entries are meaningful to the rebalancer; text
    // entries (e.g. a sector name) are dropped here.
    auto data = j.find("data");
    if (data != j.end() && data->is_object()) {
      for (const auto& entry : data->items()) {
        if (entry.value().is_number()) {
          alert.data[entry.key()] = entry.value().get<double>();
        }
      }
    }
    alert.timestamp =
        ms_to_timestamp(j.value("timestamp_ms", std::int64_t{0}));
    return alert;
  });
}

json toJson(const domain::PortfolioSnapshot& snapshot) {
  json alerts = json::array();
  for (const auto& a : snapshot.alerts) {
    alerts.push_back(toJson(a));
  }
  return json{
      {"account_id", snapshot.account_id},
      {"timestamp_ms", timestamp_to_ms(snapshot.timestamp)},
      {"total_value", snapshot.total_value},
      {"cash", snapshot.cash},
      {"invested_value", snapshot.invested_value},
      {"total_unrealized_pnl", snapshot.total_unrealized_pnl},
      {"position_count", snapshot.position_count},
      {"risk_level", domain::toString(snapshot.risk_level)},
      {"alerts", alerts},
  };
}

domain::PortfolioSnapshot snapshotFromJson(const json& j) {
  return translate("snapshot", [&j] {
    domain::PortfolioSnapshot s;
    s.account_id = j.at("account_id").get<std::string>();
    s.timestamp = ms_to_timestamp(j.value("timestamp_ms", std::int64_t{0}));
    s.total_value = j.value("total_value", 0.0);
    s.cash = j.value("cash", 0.0);
    s.invested_value = j.value("invested_value", 0.0);
    s.total_unrealized_pnl = j.value("total_unrealized_pnl", 0.0);
    s.position_count = j.value("position_count", 0);
    if (j.contains("risk_level")) {
      s.risk_level = readEnum<domain::RiskLevel>(j, "risk_level",
                                                 domain::parseRiskLevel);
    }
    auto alerts = j.find("alerts");
    if (alerts != j.end() && !alerts->is_null()) {
      for (const auto& a : *alerts) {
        s.alerts.push_back(alertFromJson(a));
      }
    }
    return s;
  });
}

// --- Rebalancer output -------------------------------------------------------

json toJson(const domain::TradeExecution& trade) {
  return json{
      {"timestamp_ms", timestamp_to_ms(trade.timestamp)},
      {"symbol", trade.symbol},
      {"action", domain::toString(trade.action)},
      {"quantity", trade.quantity},
      {"price", trade.price},
      {"total_value", trade.total_value},
      {"reason", trade.reason},
      {"alert_type", trade.alert_type
                         ? json(domain::toString(*trade.alert_type))
                         : json(nullptr)},
      {"success", trade.success},
      {"error", optionalString(trade.error)},
  };
}

json toJson(const domain::DailyStats& stats) {
  return json{
      {"trades_today", stats.trades_today},
      {"trades_remaining", stats.trades_remaining},
      {"total_volume", stats.total_volume},
      {"success_count", stats.success_count},
      {"failure_count", stats.failure_count},
      {"dry_run", stats.dry_run},
  };
}

json toJson(const domain::RebalanceResult& result) {
  json trades = json::array();
  for (const auto& t : result.trades_executed) {
    trades.push_back(toJson(t));
  }
  return json{
      {"timestamp_ms", timestamp_to_ms(result.timestamp)},
      {"trades_executed", trades},
      {"alerts_processed", result.alerts_processed},
      {"snapshot_before", result.snapshot_before
                              ? toJson(*result.snapshot_before)
                              : json(nullptr)},
      {"snapshot_after", result.snapshot_after
                             ? toJson(*result.snapshot_after)
                             : json(nullptr)},
      {"dry_run", result.dry_run},
      {"summary", result.summary()},
  };
}

// --- Assessments -------------------------------------------------------------

json toJson(const domain::PositionRiskAssessment& a) {
  return json{
      {"symbol", a.symbol},
      {"quantity", a.quantity},
      {"entry_price", a.entry_price},
      {"current_price", a.current_price},
      {"market_value", a.market_value},
      {"unrealized_pnl", a.unrealized_pnl},
      {"unrealized_pnl_pct", a.unrealized_pnl_pct},
      {"days_held", a.days_held},
      {"risk_level", domain::toString(a.risk_level)},
      {"concentration", a.concentration},
      {"recommended_action", domain::toString(a.recommended_action)},
      {"action_reason", a.action_reason},
      {"target_allocation", a.target_allocation},
      {"stop_loss_price", a.stop_loss_price},
      {"take_profit_price", a.take_profit_price},
      {"confidence", a.confidence},
  };
}

json toJson(const domain::SuggestedAction& s) {
  return json{
      {"priority", s.priority},
      {"symbol", optionalString(s.symbol)},
      {"action", s.action},
      {"reason", s.reason},
      {"current_value", s.current_value},
      {"pnl_pct", s.pnl_pct},
      {"risk_level", s.risk_level ? json(domain::toString(*s.risk_level))
                                  : json(nullptr)},
  };
}

json toJson(const domain::PortfolioRiskAssessment& a) {
  json positions = json::array();
  for (const auto& p : a.position_assessments) {
    positions.push_back(toJson(p));
  }
  json suggestions = json::array();
  for (const auto& s : a.suggested_actions) {
    suggestions.push_back(toJson(s));
  }
  return json{
      {"account_id", a.account_id},
      {"total_value", a.total_value},
      {"cash_available", a.cash_available},
      {"invested_value", a.invested_value},
      {"total_unrealized_pnl", a.total_unrealized_pnl},
      {"overall_risk_level", domain::toString(a.overall_risk_level)},
      {"diversification_score", a.diversification_score},
      {"concentration_warning", a.concentration_warning},
      {"max_single_position_pct", a.max_single_position_pct},
      {"capital_at_risk", a.capital_at_risk},
      {"rebalance_needed", a.rebalance_needed},
      {"positions", positions},
      {"suggested_actions", suggestions},
  };
}

json toJson(const domain::ReallocationSuggestion& s) {
  return json{
      {"from_symbol", optionalString(s.from_symbol)},
      {"to_symbol", optionalString(s.to_symbol)},
      {"amount", s.amount},
      {"reason", s.reason},
      {"priority", s.priority},
      {"expected_benefit", s.expected_benefit},
      {"risk_impact", s.risk_impact},
  };
}

domain::Opportunity opportunityFromJson(const json& j) {
  return translate("opportunity", [&j] {
    domain::Opportunity o;
    o.symbol = j.at("symbol").get<std::string>();
    o.reason = j.value("reason", std::string());
    o.expected_return = j.value("expected_return", std::string());
    o.risk_level = j.value("risk_level", std::string());
    return o;
  });
}

// --- Advisory ----------------------------------------------------------------

json toJson(const advisory::AdviceRequest& request) {
  return json{
      {"stance", advisory::toString(request.stance)},
      {"position", toJson(request.position)},
      {"market_context", request.market_context},
  };
}

json toJson(const advisory::Advice& advice) {
  return json{
      {"action", domain::toString(advice.action)},
      {"confidence", advice.confidence},
      {"reasoning", advice.reasoning},
      {"key_points", stringList(advice.key_points)},
  };
}

advisory::Advice parseAdvice(const json& j) {
  return translate("advice", [&j] {
    using domain::PositionAction;

    advisory::Advice advice;
    const std::string action = j.at("action").get<std::string>();
    std::optional<PositionAction> parsed = domain::parsePositionAction(action);
    if (!parsed || *parsed == PositionAction::Reallocate) {
      throw InvalidInputError("Advice action '" + action +
                              "' is not one of hold|reduce|exit|add");
    }
    advice.action = *parsed;

    const json& confidence = j.at("confidence");
    if (!confidence.is_number()) {
      throw InvalidInputError("Advice confidence is not a number");
    }
    advice.confidence = confidence.get<double>();
    if (advice.confidence < 0.0 || advice.confidence > 1.0) {
      throw InvalidInputError("Advice confidence " +
                              std::to_string(advice.confidence) +
                              " outside [0, 1]");
    }

    advice.reasoning = j.value("reasoning", std::string());

    auto points = j.find("key_points");
    if (points != j.end() && !points->is_null()) {
      for (const auto& p : *points) {
        if (advice.key_points.size() == advisory::Advice::kMaxKeyPoints) {
          break;
        }
        advice.key_points.push_back(p.get<std::string>());
      }
    }
    return advice;
  });
}

json toJson(const advisory::DebateVerdict& verdict) {
  json arguments = json::array();
  for (const auto& arg : verdict.arguments) {
    json a = toJson(arg.advice);
    a["stance"] = advisory::toString(arg.stance);
    a["failed"] = arg.failed;
    arguments.push_back(a);
  }
  return json{
      {"symbol", verdict.symbol},
      {"final_action", domain::toString(verdict.final_action)},
      {"confidence", verdict.confidence},
      {"risk_score", verdict.risk_score},
      {"summary", verdict.summary},
      {"arguments", arguments},
  };
}

json toJson(const advisory::PortfolioAdvice& report) {
  json verdicts = json::array();
  for (const auto& v : report.verdicts) {
    verdicts.push_back(toJson(v));
  }
  return json{
      {"portfolio_risk_score", report.average_risk_score},
      {"portfolio_risk_level", domain::toString(report.risk_level)},
      {"positions_to_exit", stringList(report.to_exit)},
      {"positions_to_reduce", stringList(report.to_reduce)},
      {"positions_to_hold", stringList(report.to_hold)},
      {"positions_to_add", stringList(report.to_add)},
      {"recommendations", verdicts},
  };
}

// --- Feed --------------------------------------------------------------------

FeedMessage decodeFeedMessage(const std::string& payload) {
  const json j = translate("feed message", [&payload] {
    return json::parse(payload);
  });

  return translate("feed message", [&j] {
    FeedMessage msg;
    const std::string type = j.at("type").get<std::string>();
    if (type == "alert") {
      msg.kind = FeedMessage::Kind::Alert;
      msg.account_id = j.value("account_id", std::string());
      msg.alert = alertFromJson(j);
    } else if (type == "snapshot") {
      msg.kind = FeedMessage::Kind::Snapshot;
      msg.snapshot = snapshotFromJson(j);
      msg.account_id = msg.snapshot->account_id;
    } else {
      throw InvalidInputError("Unknown feed message type '" + type + "'");
    }
    return msg;
  });
}

}  // namespace codec
}  // namespace riskguard
