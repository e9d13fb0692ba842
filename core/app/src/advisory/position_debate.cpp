#include "riskguard/advisory/position_debate.hpp"

#include <array>
#include <cstdio>
#include <exception>
#include <future>
#include <utility>

namespace riskguard {
namespace advisory {

namespace {

using domain::PositionAction;

// Most protective first; the judge walks this order so ties resolve to the
// earlier entry.
constexpr std::array<PositionAction, 4> kVoteOrder = {
    PositionAction::Exit, PositionAction::Reduce, PositionAction::Hold,
    PositionAction::Add};

constexpr std::array<Stance, 3> kStances = {
    Stance::Aggressive, Stance::Conservative, Stance::Neutral};

std::size_t voteIndex(PositionAction action) {
  for (std::size_t i = 0; i < kVoteOrder.size(); ++i) {
    if (kVoteOrder[i] == action) {
      return i;
    }
  }
  // Reallocate is never produced by parseAdvice(); count it as Hold.
  return 2;
}

}  // namespace

PositionDebate::PositionDebate(IAdvisor& advisor) : advisor_(advisor) {}

double PositionDebate::severity(PositionAction action) {
  switch (action) {
    case PositionAction::Exit:       return 100.0;
    case PositionAction::Reduce:     return 70.0;
    case PositionAction::Hold:       return 40.0;
    case PositionAction::Add:        return 20.0;
    case PositionAction::Reallocate: return 40.0;
  }
  return 40.0;
}

domain::RiskLevel PositionDebate::levelForScore(double score) {
  if (score >= 75.0) return domain::RiskLevel::Critical;
  if (score >= 50.0) return domain::RiskLevel::High;
  if (score >= 25.0) return domain::RiskLevel::Moderate;
  return domain::RiskLevel::Low;
}

// -----------------------------------------------------------------------------
// argue(): one stance, failures folded into a zero-weight Hold
// -----------------------------------------------------------------------------
DebateArgument PositionDebate::argue(const AdviceRequest& request) {
  DebateArgument argument;
  argument.stance = request.stance;
  try {
    argument.advice = advisor_.advise(request);
  } catch (const std::exception& e) {
    argument.failed = true;
    argument.advice = Advice{};
    argument.advice.action = PositionAction::Hold;
    argument.advice.confidence = 0.0;
    argument.advice.reasoning = std::string("Advisor failed: ") + e.what();
  }
  return argument;
}

// -----------------------------------------------------------------------------
// analyze(): concurrent fan-out, then judge
// -----------------------------------------------------------------------------
DebateVerdict PositionDebate::analyze(
    const domain::PositionRiskAssessment& position,
    const std::string& market_context) {
  std::vector<std::future<DebateArgument>> pending;
  pending.reserve(kStances.size());

  for (Stance stance : kStances) {
    AdviceRequest request{position, market_context, stance};
    pending.push_back(std::async(
        std::launch::async,
        [this, request = std::move(request)] { return argue(request); }));
  }

  std::vector<DebateArgument> arguments;
  arguments.reserve(pending.size());
  for (auto& f : pending) {
    arguments.push_back(f.get());
  }
  return judge(position.symbol, std::move(arguments));
}

// -----------------------------------------------------------------------------
// judge(): confidence-weighted vote
// -----------------------------------------------------------------------------
DebateVerdict PositionDebate::judge(const std::string& symbol,
                                    std::vector<DebateArgument> arguments) {
  std::array<double, kVoteOrder.size()> weight{};
  double total = 0.0;
  double weighted_severity = 0.0;

  for (const auto& arg : arguments) {
    const double w = arg.advice.confidence;
    weight[voteIndex(arg.advice.action)] += w;
    total += w;
    weighted_severity += w * severity(arg.advice.action);
  }

  DebateVerdict verdict;
  verdict.symbol = symbol;

  if (total <= 0.0) {
    verdict.final_action = PositionAction::Hold;
    verdict.confidence = 0.0;
    verdict.risk_score = 50.0;
  } else {
    std::size_t best = 0;
    for (std::size_t i = 1; i < weight.size(); ++i) {
      if (weight[i] > weight[best]) {
        best = i;
      }
    }
    verdict.final_action = kVoteOrder[best];
    verdict.confidence = weight[best] / total;
    verdict.risk_score = weighted_severity / total;
  }

  std::size_t agreeing = 0;
  for (const auto& arg : arguments) {
    if (!arg.failed && arg.advice.action == verdict.final_action) {
      ++agreeing;
    }
  }

  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "%s: %s (%zu of %zu stances agree, confidence %.2f, "
                "risk score %.0f)",
                symbol.c_str(), domain::toString(verdict.final_action),
                agreeing, arguments.size(), verdict.confidence,
                verdict.risk_score);
  verdict.summary = buf;
  verdict.arguments = std::move(arguments);
  return verdict;
}

// -----------------------------------------------------------------------------
// portfolioRecommendations(): debate each position, then bucket
// -----------------------------------------------------------------------------
PortfolioAdvice PositionDebate::portfolioRecommendations(
    const std::vector<domain::PositionRiskAssessment>& positions,
    const std::string& market_context) {
  PortfolioAdvice report;
  double score_sum = 0.0;

  for (const auto& position : positions) {
    DebateVerdict verdict = analyze(position, market_context);
    score_sum += verdict.risk_score;

    switch (verdict.final_action) {
      case PositionAction::Exit:
        report.to_exit.push_back(verdict.symbol);
        break;
      case PositionAction::Reduce:
        report.to_reduce.push_back(verdict.symbol);
        break;
      case PositionAction::Add:
        report.to_add.push_back(verdict.symbol);
        break;
      case PositionAction::Hold:
      case PositionAction::Reallocate:
        report.to_hold.push_back(verdict.symbol);
        break;
    }
    report.verdicts.push_back(std::move(verdict));
  }

  report.average_risk_score =
      positions.empty() ? 0.0
                        : score_sum / static_cast<double>(positions.size());
  report.risk_level = levelForScore(report.average_risk_score);
  return report;
}

}  // namespace advisory
}  // namespace riskguard
