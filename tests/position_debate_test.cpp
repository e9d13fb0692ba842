// =============================================================================
// position_debate_test.cpp
// =============================================================================
// Unit tests for riskguard::advisory::PositionDebate.
//
// Validates:
//   - One advise() call per stance, arguments in stance order
//   - Judge: confidence-weighted vote, protective tie-break, risk score
//   - Advisor failures become zero-weight Hold arguments
//   - Portfolio roll-up: buckets, average score, level
//
// Uses a scripted IAdvisor so every verdict is known in advance.
// =============================================================================

#include "riskguard/advisory/position_debate.hpp"
#include "riskguard/advisory/rule_based_advisor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using riskguard::advisory::Advice;
using riskguard::advisory::AdviceRequest;
using riskguard::advisory::DebateArgument;
using riskguard::advisory::PositionDebate;
using riskguard::advisory::Stance;
using riskguard::domain::PositionAction;
using riskguard::domain::PositionRiskAssessment;
using riskguard::domain::RiskLevel;

namespace {

// IAdvisor backed by a function; safe for the debate's concurrent calls as
// long as the script itself is.
class ScriptedAdvisor final : public riskguard::advisory::IAdvisor {
 public:
  using Script = std::function<Advice(const AdviceRequest&)>;

  explicit ScriptedAdvisor(Script script) : script_(std::move(script)) {}

  Advice advise(const AdviceRequest& request) override {
    ++calls;
    return script_(request);
  }

  std::atomic<int> calls{0};

 private:
  Script script_;
};

Advice advice(PositionAction action, double confidence) {
  Advice a;
  a.action = action;
  a.confidence = confidence;
  return a;
}

// Fixed answer per stance.
ScriptedAdvisor::Script byStance(Advice aggressive, Advice conservative,
                                 Advice neutral) {
  return [=](const AdviceRequest& r) {
    switch (r.stance) {
      case Stance::Aggressive:   return aggressive;
      case Stance::Conservative: return conservative;
      case Stance::Neutral:      return neutral;
    }
    return neutral;
  };
}

PositionRiskAssessment position(const std::string& symbol) {
  PositionRiskAssessment p;
  p.symbol = symbol;
  p.quantity = 10.0;
  p.entry_price = 100.0;
  p.current_price = 100.0;
  p.market_value = 1000.0;
  p.concentration = 10.0;
  return p;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Unanimous exit.
// -----------------------------------------------------------------------------
TEST(PositionDebateTest, UnanimousVerdict) {
  ScriptedAdvisor advisor(byStance(advice(PositionAction::Exit, 0.9),
                                   advice(PositionAction::Exit, 0.8),
                                   advice(PositionAction::Exit, 0.7)));
  PositionDebate debate(advisor);

  auto verdict = debate.analyze(position("XYZ"), "earnings miss");

  EXPECT_EQ(advisor.calls.load(), 3);
  EXPECT_EQ(verdict.symbol, "XYZ");
  EXPECT_EQ(verdict.final_action, PositionAction::Exit);
  EXPECT_DOUBLE_EQ(verdict.confidence, 1.0);
  EXPECT_DOUBLE_EQ(verdict.risk_score, 100.0);
  EXPECT_EQ(verdict.summary,
            "XYZ: exit (3 of 3 stances agree, confidence 1.00, "
            "risk score 100)");

  ASSERT_EQ(verdict.arguments.size(), 3u);
  EXPECT_EQ(verdict.arguments[0].stance, Stance::Aggressive);
  EXPECT_EQ(verdict.arguments[1].stance, Stance::Conservative);
  EXPECT_EQ(verdict.arguments[2].stance, Stance::Neutral);
}

// -----------------------------------------------------------------------------
// 2. Equal weight for Reduce and Add: the protective action wins.
// -----------------------------------------------------------------------------
TEST(PositionDebateTest, TieGoesToProtectiveAction) {
  ScriptedAdvisor advisor(byStance(advice(PositionAction::Add, 0.6),
                                   advice(PositionAction::Reduce, 0.6),
                                   advice(PositionAction::Hold, 0.5)));
  PositionDebate debate(advisor);

  auto verdict = debate.analyze(position("ABC"));

  EXPECT_EQ(verdict.final_action, PositionAction::Reduce);
  EXPECT_NEAR(verdict.confidence, 0.6 / 1.7, 1e-9);
  EXPECT_NEAR(verdict.risk_score, (0.6 * 20 + 0.6 * 70 + 0.5 * 40) / 1.7,
              1e-9);
  EXPECT_NE(verdict.summary.find("1 of 3 stances agree"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 3. A failing stance carries no weight; the debate still completes.
// -----------------------------------------------------------------------------
TEST(PositionDebateTest, FailedStanceIsZeroWeightHold) {
  ScriptedAdvisor advisor([](const AdviceRequest& r) {
    if (r.stance == Stance::Aggressive) {
      throw std::runtime_error("oracle timeout");
    }
    return r.stance == Stance::Conservative
               ? advice(PositionAction::Exit, 0.8)
               : advice(PositionAction::Hold, 0.7);
  });
  PositionDebate debate(advisor);

  auto verdict = debate.analyze(position("XYZ"));

  EXPECT_EQ(verdict.final_action, PositionAction::Exit);
  EXPECT_NEAR(verdict.confidence, 0.8 / 1.5, 1e-9);
  EXPECT_NEAR(verdict.risk_score, (0.8 * 100 + 0.7 * 40) / 1.5, 1e-9);

  const DebateArgument& failed = verdict.arguments[0];
  EXPECT_TRUE(failed.failed);
  EXPECT_EQ(failed.advice.action, PositionAction::Hold);
  EXPECT_DOUBLE_EQ(failed.advice.confidence, 0.0);
  EXPECT_EQ(failed.advice.reasoning, "Advisor failed: oracle timeout");
}

TEST(PositionDebateTest, AllStancesFailedIsNeutralHold) {
  ScriptedAdvisor advisor([](const AdviceRequest&) -> Advice {
    throw std::runtime_error("down");
  });
  PositionDebate debate(advisor);

  auto verdict = debate.analyze(position("XYZ"));

  EXPECT_EQ(verdict.final_action, PositionAction::Hold);
  EXPECT_DOUBLE_EQ(verdict.confidence, 0.0);
  EXPECT_DOUBLE_EQ(verdict.risk_score, 50.0);
  EXPECT_NE(verdict.summary.find("0 of 3 stances agree"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 4. judge() and the score scale on their own.
// -----------------------------------------------------------------------------
TEST(PositionDebateTest, JudgeAndScale) {
  std::vector<DebateArgument> args(2);
  args[0].advice = advice(PositionAction::Hold, 0.5);
  args[1].advice = advice(PositionAction::Exit, 0.5);
  auto verdict = PositionDebate::judge("T", args);
  EXPECT_EQ(verdict.final_action, PositionAction::Exit);
  EXPECT_DOUBLE_EQ(verdict.risk_score, 70.0);

  EXPECT_DOUBLE_EQ(PositionDebate::severity(PositionAction::Reduce), 70.0);
  EXPECT_EQ(PositionDebate::levelForScore(75.0), RiskLevel::Critical);
  EXPECT_EQ(PositionDebate::levelForScore(74.9), RiskLevel::High);
  EXPECT_EQ(PositionDebate::levelForScore(50.0), RiskLevel::High);
  EXPECT_EQ(PositionDebate::levelForScore(25.0), RiskLevel::Moderate);
  EXPECT_EQ(PositionDebate::levelForScore(24.9), RiskLevel::Low);
}

// -----------------------------------------------------------------------------
// 5. Portfolio roll-up.
// -----------------------------------------------------------------------------
TEST(PositionDebateTest, PortfolioRecommendations) {
  ScriptedAdvisor advisor([](const AdviceRequest& r) {
    if (r.position.symbol == "LOSER") return advice(PositionAction::Exit, 0.9);
    if (r.position.symbol == "WINNER") return advice(PositionAction::Add, 0.9);
    return advice(PositionAction::Hold, 0.9);
  });
  PositionDebate debate(advisor);

  auto report = debate.portfolioRecommendations(
      {position("LOSER"), position("WINNER"), position("FLAT")});

  EXPECT_EQ(advisor.calls.load(), 9);
  EXPECT_EQ(report.to_exit, std::vector<std::string>{"LOSER"});
  EXPECT_EQ(report.to_add, std::vector<std::string>{"WINNER"});
  EXPECT_EQ(report.to_hold, std::vector<std::string>{"FLAT"});
  EXPECT_TRUE(report.to_reduce.empty());
  EXPECT_NEAR(report.average_risk_score, (100.0 + 20.0 + 40.0) / 3.0, 1e-9);
  EXPECT_EQ(report.risk_level, RiskLevel::High);
  ASSERT_EQ(report.verdicts.size(), 3u);
  EXPECT_EQ(report.verdicts[1].symbol, "WINNER");
}

TEST(PositionDebateTest, EmptyPortfolioIsLowRisk) {
  riskguard::advisory::RuleBasedAdvisor advisor;
  PositionDebate debate(advisor);

  auto report = debate.portfolioRecommendations({});
  EXPECT_DOUBLE_EQ(report.average_risk_score, 0.0);
  EXPECT_EQ(report.risk_level, RiskLevel::Low);
  EXPECT_TRUE(report.verdicts.empty());
}

// -----------------------------------------------------------------------------
// 6. With the offline advisor the debate reflects the stances' disagreement.
// -----------------------------------------------------------------------------
TEST(PositionDebateTest, RuleBasedDebateOnDip) {
  riskguard::advisory::RuleBasedAdvisor advisor;
  PositionDebate debate(advisor);

  // -8%: conservative exits (0.8), aggressive (0.6) and neutral (0.7) hold.
  PositionRiskAssessment dip = position("DIP");
  dip.current_price = 92.0;
  dip.market_value = 920.0;
  dip.unrealized_pnl_pct = -8.0;
  dip.concentration = 9.2;

  auto verdict = debate.analyze(dip);
  EXPECT_EQ(verdict.final_action, PositionAction::Hold);
  EXPECT_NEAR(verdict.confidence, 1.3 / 2.1, 1e-9);
}
