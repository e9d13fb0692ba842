#pragma once

#include "riskguard/advisory/advice.hpp"
#include "riskguard/domain/alert.hpp"
#include "riskguard/domain/assessment.hpp"
#include "riskguard/domain/trade_execution.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace riskguard {
namespace codec {

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json mapping for every record that crosses a process
//         boundary: the alert feed, IPC replies, telemetry, and the advisory
//         oracle.
//
// @details
// Enumerations travel as their lower-case names (toString()/parse*()).
// Timestamps travel as integer epoch milliseconds under "timestamp_ms".
// Optional fields are written as JSON null and accepted as null or absent.
//
// Decoding errors: every *FromJson / parse* function throws
// InvalidInputError. nlohmann's own exceptions (missing key, wrong type) are
// translated so callers only need to handle the riskguard taxonomy.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::Alert& alert);
domain::Alert alertFromJson(const nlohmann::json& j);

nlohmann::json toJson(const domain::PortfolioSnapshot& snapshot);
domain::PortfolioSnapshot snapshotFromJson(const nlohmann::json& j);

nlohmann::json toJson(const domain::TradeExecution& trade);
nlohmann::json toJson(const domain::DailyStats& stats);
nlohmann::json toJson(const domain::RebalanceResult& result);

nlohmann::json toJson(const domain::PositionRiskAssessment& assessment);
nlohmann::json toJson(const domain::SuggestedAction& action);
nlohmann::json toJson(const domain::PortfolioRiskAssessment& assessment);
nlohmann::json toJson(const domain::ReallocationSuggestion& suggestion);
domain::Opportunity opportunityFromJson(const nlohmann::json& j);

nlohmann::json toJson(const advisory::AdviceRequest& request);
nlohmann::json toJson(const advisory::Advice& advice);
nlohmann::json toJson(const advisory::DebateVerdict& verdict);
nlohmann::json toJson(const advisory::PortfolioAdvice& report);

// -----------------------------------------------------------------------------
// parseAdvice(j)
// -----------------------------------------------------------------------------
// The single validation point for oracle output.
//   "action"      required, one of hold | reduce | exit | add.
//   "confidence"  required number in [0, 1]. Out of range is an error, not
//                 clamped.
//   "reasoning"   optional string.
//   "key_points"  optional array of strings; only the first five are kept.
// -----------------------------------------------------------------------------
advisory::Advice parseAdvice(const nlohmann::json& j);

// -----------------------------------------------------------------------------
// FeedMessage — one message from the monitor's PUB socket
// -----------------------------------------------------------------------------
//   {"type":"alert",    "account_id":..., <alert fields>}
//   {"type":"snapshot", <snapshot fields>, "alerts":[...]}
// -----------------------------------------------------------------------------
struct FeedMessage {
  enum class Kind { Alert, Snapshot };

  Kind kind{Kind::Alert};
  std::string account_id;
  std::optional<domain::Alert> alert;
  std::optional<domain::PortfolioSnapshot> snapshot;
};

// Parses and validates a raw feed payload. Throws InvalidInputError for
// malformed JSON, an unknown "type", or invalid alert/snapshot fields.
FeedMessage decodeFeedMessage(const std::string& payload);

}  // namespace codec
}  // namespace riskguard
