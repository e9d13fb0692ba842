// =============================================================================
// rebalancer_test.cpp
// =============================================================================
// Unit tests for riskguard::Rebalancer.
//
// Validates:
//   - Per-type decisions (stop loss, take profit, concentration, critical
//     risk, idle capital) and trade sizing
//   - Throttle: per-symbol cooldown, daily cap, lazy day rollover
//   - Minimum trade value (bypassed by SELL_ALL)
//   - Dry run vs live execution, failures recorded as data
//   - Gate: stopped, disabled, urgency tiers
//   - Listener notification and isolation
//   - Manual rebalance over the alert source's snapshot
//   - Daily cap holds under concurrent alerts
//
// Time is driven by SimulationTimeProvider so cooldowns and day boundaries
// are deterministic.
// =============================================================================

#include "riskguard/errors.hpp"
#include "riskguard/monitor/snapshot_cache.hpp"
#include "riskguard/rebalance/rebalancer.hpp"
#include "riskguard/store/in_memory_portfolio_store.hpp"
#include "riskguard/time/simulation_time_provider.hpp"
#include "riskguard/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using riskguard::domain::ActionUrgency;
using riskguard::domain::Alert;
using riskguard::domain::AlertType;
using riskguard::domain::RebalanceAction;
using riskguard::domain::RebalanceConfig;
using riskguard::domain::TradeExecution;

namespace {

// 2024-01-02T10:00:00Z
constexpr std::int64_t kStartMs = 1704189600000;
constexpr std::int64_t kMinute = riskguard::kMillisPerMinute;
constexpr std::int64_t kDay = riskguard::kMillisPerDay;

Alert makeAlert(AlertType type, const std::string& symbol,
                std::map<std::string, double> data,
                ActionUrgency urgency = ActionUrgency::High) {
  Alert a;
  a.alert_type = type;
  a.urgency = urgency;
  if (!symbol.empty()) {
    a.symbol = symbol;
  }
  a.title = std::string(riskguard::domain::toString(type)) + " " + symbol;
  a.data = std::move(data);
  return a;
}

Alert stopLoss(const std::string& symbol, double pnl, double price) {
  return makeAlert(AlertType::StopLossHit, symbol,
                   {{"pnl_pct", pnl}, {"current_price", price}},
                   ActionUrgency::Immediate);
}

// Store decorator whose applyTrade() always fails.
class FailingStore final : public riskguard::IPortfolioStore {
 public:
  explicit FailingStore(const riskguard::IPortfolioStore& inner)
      : inner_(inner) {}

  std::optional<riskguard::domain::Account> account(
      const std::string& id) const override {
    return inner_.account(id);
  }
  std::vector<riskguard::domain::Position> positions(
      const std::string& id) const override {
    return inner_.positions(id);
  }
  std::optional<riskguard::domain::Position> position(
      const std::string& id, const std::string& symbol) const override {
    return inner_.position(id, symbol);
  }
  riskguard::domain::OrderId applyTrade(
      const riskguard::domain::Order&) override {
    throw riskguard::ExecutionError("broker rejected order");
  }

 private:
  const riskguard::IPortfolioStore& inner_;
};

}  // namespace

// =============================================================================
// Fixture: one account holding 100 AAPL, 100 MSFT and 100 TSLA, live mode.
// =============================================================================
class RebalancerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store.upsertAccount({"acct-1", 10000.0});
    for (const char* symbol : {"AAPL", "MSFT", "TSLA"}) {
      riskguard::domain::Position p;
      p.symbol = symbol;
      p.quantity = 100.0;
      p.entry_price = 100.0;
      p.current_price = 100.0;
      store.upsertPosition("acct-1", p);
    }
    config.dry_run = false;
  }

  riskguard::Rebalancer& make() {
    rebalancer.emplace("acct-1", store, clock, config);
    rebalancer->start(source);
    return *rebalancer;
  }

  double held(const std::string& symbol) const {
    auto p = store.position("acct-1", symbol);
    return p ? p->quantity : 0.0;
  }

  riskguard::InMemoryPortfolioStore store;
  riskguard::SimulationTimeProvider clock{kStartMs};
  riskguard::SnapshotCache source;
  RebalanceConfig config;
  std::optional<riskguard::Rebalancer> rebalancer;
};

// -----------------------------------------------------------------------------
// 1. A loss beyond auto_exit_loss_pct sells the whole position.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, DeepStopLossSellsAll) {
  auto& r = make();
  r.handleAlert(stopLoss("AAPL", -20.0, 80.0));

  auto history = r.getTradeHistory();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].action, RebalanceAction::SellAll);
  EXPECT_DOUBLE_EQ(history[0].quantity, 100.0);
  EXPECT_DOUBLE_EQ(history[0].total_value, 8000.0);
  EXPECT_TRUE(history[0].success);
  EXPECT_EQ(history[0].alert_type, AlertType::StopLossHit);
  EXPECT_EQ(history[0].reason, "Stop-loss triggered at -20.0% loss");
  EXPECT_DOUBLE_EQ(held("AAPL"), 0.0);
  EXPECT_DOUBLE_EQ(store.account("acct-1")->cash_balance, 18000.0);
}

// -----------------------------------------------------------------------------
// 2. A milder stop loss sells half, capped at max_single_trade_pct (25%).
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, MildStopLossSellsCappedHalf) {
  auto& r = make();
  r.handleAlert(stopLoss("AAPL", -12.0, 90.0));

  auto history = r.getTradeHistory();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].action, RebalanceAction::Sell);
  EXPECT_DOUBLE_EQ(history[0].quantity, 25.0);
  EXPECT_DOUBLE_EQ(held("AAPL"), 75.0);
}

TEST_F(RebalancerTest, MildStopLossSellsHalfWhenUncapped) {
  config.max_single_trade_pct = 100.0;
  auto& r = make();
  r.handleAlert(stopLoss("AAPL", -12.0, 90.0));
  EXPECT_DOUBLE_EQ(held("AAPL"), 50.0);
}

// -----------------------------------------------------------------------------
// 3. Take profit only above auto_reduce_gain_pct.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, TakeProfitAboveThreshold) {
  auto& r = make();
  r.handleAlert(makeAlert(AlertType::TakeProfit, "AAPL",
                          {{"pnl_pct", 25.0}, {"current_price", 125.0}}));
  EXPECT_TRUE(r.getTradeHistory().empty());

  r.handleAlert(makeAlert(AlertType::TakeProfit, "AAPL",
                          {{"pnl_pct", 35.0}, {"current_price", 135.0}}));
  auto history = r.getTradeHistory();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].action, RebalanceAction::Sell);
  EXPECT_DOUBLE_EQ(history[0].quantity, 25.0);
  EXPECT_EQ(history[0].reason, "Taking profits at 35.0% gain");
}

// -----------------------------------------------------------------------------
// 4. Concentration: (conc - target) / conc, capped. With conc 40 and target 5
//    the formula asks for 87.5%; the 25% cap wins and the position is left
//    above target.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, ConcentrationReductionIsCapped) {
  auto& r = make();
  r.handleAlert(makeAlert(AlertType::Concentration, "MSFT",
                          {{"concentration_pct", 40.0},
                           {"current_price", 100.0}}));

  auto history = r.getTradeHistory();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_DOUBLE_EQ(history[0].quantity, 25.0);
  EXPECT_EQ(history[0].reason, "Reducing concentration from 40.0% to ~5.0%");
}

TEST_F(RebalancerTest, ConcentrationFormulaWhenUncapped) {
  config.max_single_trade_pct = 100.0;
  auto& r = make();
  r.handleAlert(makeAlert(AlertType::Concentration, "MSFT",
                          {{"concentration_pct", 40.0},
                           {"current_price", 100.0}}));
  EXPECT_DOUBLE_EQ(held("MSFT"), 12.5);
}

TEST_F(RebalancerTest, ConcentrationBelowThresholdIsIgnored) {
  auto& r = make();
  r.handleAlert(makeAlert(AlertType::Concentration, "MSFT",
                          {{"concentration_pct", 30.0},
                           {"current_price", 100.0}}));
  EXPECT_TRUE(r.getTradeHistory().empty());
}

// -----------------------------------------------------------------------------
// 5. Critical risk sells everything; idle capital never trades.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, RiskThresholdSellsAll) {
  auto& r = make();
  r.handleAlert(makeAlert(AlertType::RiskThreshold, "TSLA",
                          {{"current_price", 50.0}},
                          ActionUrgency::Immediate));
  EXPECT_DOUBLE_EQ(held("TSLA"), 0.0);
  ASSERT_EQ(r.getTradeHistory().size(), 1u);
  EXPECT_EQ(r.getTradeHistory()[0].reason, "Critical risk threshold exceeded");
}

TEST_F(RebalancerTest, IdleCapitalAndMissingSymbolDoNothing) {
  auto& r = make();
  r.handleAlert(makeAlert(AlertType::IdleCapital, "", {{"idle_pct", 45.0}}));
  r.handleAlert(makeAlert(AlertType::RiskThreshold, "", {}));
  EXPECT_TRUE(r.getTradeHistory().empty());
  EXPECT_EQ(r.getDailyStats().trades_today, 0);
}

// -----------------------------------------------------------------------------
// 6. No holding: nothing recorded, "No position found" logged.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, AlertForUnheldSymbolIsSkipped) {
  auto& r = make();

  testing::internal::CaptureStderr();
  r.handleAlert(stopLoss("NVDA", -30.0, 400.0));
  const std::string err = testing::internal::GetCapturedStderr();

  EXPECT_TRUE(r.getTradeHistory().empty());
  EXPECT_NE(err.find("No position found for NVDA"), std::string::npos);
  EXPECT_EQ(r.getDailyStats().trades_today, 0);
}

// -----------------------------------------------------------------------------
// 7. Cooldown: a second alert on the same symbol 5 minutes later is refused;
//    after the full cooldown it goes through.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, CooldownBlocksSecondTradeOnSymbol) {
  auto& r = make();

  r.handleAlert(stopLoss("AAPL", -12.0, 90.0));
  clock.advance_by(5 * kMinute);

  testing::internal::CaptureStderr();
  r.handleAlert(stopLoss("AAPL", -13.0, 89.0));
  const std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(r.getTradeHistory().size(), 1u);
  EXPECT_NE(err.find("Cooldown active (10 min left)"), std::string::npos);
  EXPECT_FALSE(r.canTrade("AAPL"));
  EXPECT_FALSE(r.canTrade("aapl"));
  EXPECT_TRUE(r.canTrade("MSFT"));

  clock.advance_by(10 * kMinute);
  EXPECT_TRUE(r.canTrade("AAPL"));
  r.handleAlert(stopLoss("AAPL", -13.0, 89.0));
  EXPECT_EQ(r.getTradeHistory().size(), 2u);
}

// -----------------------------------------------------------------------------
// 8. Daily cap, then reset on the next UTC day.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, DailyCapAndRollover) {
  config.max_daily_trades = 2;
  auto& r = make();

  r.handleAlert(stopLoss("AAPL", -12.0, 90.0));
  r.handleAlert(stopLoss("MSFT", -12.0, 90.0));
  r.handleAlert(stopLoss("TSLA", -12.0, 90.0));

  EXPECT_EQ(r.getTradeHistory().size(), 2u);
  auto stats = r.getDailyStats();
  EXPECT_EQ(stats.trades_today, 2);
  EXPECT_EQ(stats.trades_remaining, 0);
  EXPECT_FALSE(r.canTrade("TSLA"));

  clock.advance_by(kDay);
  EXPECT_EQ(r.getDailyStats().trades_remaining, 2);
  EXPECT_EQ(r.getDailyStats().trades_today, 0);

  r.handleAlert(stopLoss("TSLA", -12.0, 90.0));
  EXPECT_EQ(r.getTradeHistory().size(), 3u);
  EXPECT_EQ(r.getDailyStats().trades_today, 1);
}

// -----------------------------------------------------------------------------
// 9. Minimum notional applies to SELL but not SELL_ALL.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, MinimumTradeValue) {
  auto& r = make();

  // 25 shares at $2 = $50 < $100.
  r.handleAlert(stopLoss("AAPL", -12.0, 2.0));
  EXPECT_TRUE(r.getTradeHistory().empty());
  EXPECT_TRUE(r.canTrade("AAPL"));

  // SELL_ALL with no usable price: value 0, still executed.
  r.handleAlert(makeAlert(AlertType::RiskThreshold, "MSFT", {}));
  auto history = r.getTradeHistory();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_DOUBLE_EQ(history[0].total_value, 0.0);
  EXPECT_DOUBLE_EQ(history[0].quantity, 100.0);
}

// -----------------------------------------------------------------------------
// 10. Dry run records and throttles but never touches the store.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, DryRunLeavesStoreUntouched) {
  config.dry_run = true;
  auto& r = make();

  r.handleAlert(stopLoss("AAPL", -20.0, 80.0));

  EXPECT_EQ(r.getTradeHistory().size(), 1u);
  EXPECT_DOUBLE_EQ(held("AAPL"), 100.0);
  EXPECT_TRUE(store.orders().empty());
  EXPECT_TRUE(r.getDailyStats().dry_run);
  EXPECT_FALSE(r.canTrade("AAPL"));
}

TEST_F(RebalancerTest, LiveTradeIsLoggedAsOrder) {
  auto& r = make();
  r.handleAlert(stopLoss("AAPL", -12.0, 90.0));

  auto orders = store.orders();
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].symbol, "AAPL");
  EXPECT_EQ(orders[0].side, riskguard::domain::Side::Sell);
  EXPECT_DOUBLE_EQ(orders[0].quantity, 25.0);
  EXPECT_DOUBLE_EQ(orders[0].price, 90.0);
}

// -----------------------------------------------------------------------------
// 11. A store failure is recorded, counted and notified; it does not throw.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, ExecutionFailureIsRecordedAsData) {
  FailingStore failing(store);
  riskguard::Rebalancer r("acct-1", failing, clock, config);
  r.start(source);

  std::vector<TradeExecution> notified;
  r.setTradeListener(
      [&notified](const TradeExecution& t) { notified.push_back(t); });

  EXPECT_NO_THROW(r.handleAlert(stopLoss("AAPL", -12.0, 90.0)));

  auto history = r.getTradeHistory();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_FALSE(history[0].success);
  ASSERT_TRUE(history[0].error.has_value());
  EXPECT_EQ(*history[0].error, "broker rejected order");

  auto stats = r.getDailyStats();
  EXPECT_EQ(stats.trades_today, 1);
  EXPECT_EQ(stats.failure_count, 1);
  EXPECT_EQ(stats.success_count, 0);
  EXPECT_DOUBLE_EQ(stats.total_volume, 0.0);
  EXPECT_FALSE(r.canTrade("AAPL"));
  ASSERT_EQ(notified.size(), 1u);
  EXPECT_FALSE(notified[0].success);
}

// -----------------------------------------------------------------------------
// 12. Gate: urgency tiers, disabled config, stopped rebalancer.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, MediumAndLowUrgencyIgnoredByDefault) {
  auto& r = make();
  r.handleAlert(makeAlert(AlertType::RiskThreshold, "AAPL",
                          {{"current_price", 90.0}}, ActionUrgency::Medium));
  r.handleAlert(makeAlert(AlertType::RiskThreshold, "MSFT",
                          {{"current_price", 90.0}}, ActionUrgency::Low));
  EXPECT_TRUE(r.getTradeHistory().empty());
}

TEST_F(RebalancerTest, MediumUrgencyActedOnWhenEnabled) {
  config.act_on_medium = true;
  auto& r = make();
  r.handleAlert(makeAlert(AlertType::RiskThreshold, "AAPL",
                          {{"current_price", 90.0}}, ActionUrgency::Medium));
  EXPECT_EQ(r.getTradeHistory().size(), 1u);
}

TEST_F(RebalancerTest, DisabledRebalancerDiscards) {
  config.enabled = false;
  auto& r = make();
  r.handleAlert(stopLoss("AAPL", -20.0, 80.0));
  EXPECT_TRUE(r.getTradeHistory().empty());
  EXPECT_DOUBLE_EQ(held("AAPL"), 100.0);
}

TEST_F(RebalancerTest, StoppedRebalancerDiscards) {
  auto& r = make();
  r.stop();
  r.stop();
  EXPECT_FALSE(r.isRunning());

  r.handleAlert(stopLoss("AAPL", -20.0, 80.0));
  EXPECT_TRUE(r.getTradeHistory().empty());
}

// -----------------------------------------------------------------------------
// 13. Listeners: one call per trade; a throwing listener is contained.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, ThrowingListenerDoesNotBreakPipeline) {
  rebalancer.emplace("acct-1", store, clock, config);
  int calls = 0;
  rebalancer->setTradeListener([&calls](const TradeExecution&) {
    ++calls;
    throw std::runtime_error("listener down");
  });
  rebalancer->start(source);

  EXPECT_NO_THROW(rebalancer->handleAlert(stopLoss("AAPL", -20.0, 80.0)));
  EXPECT_NO_THROW(rebalancer->handleAlert(stopLoss("MSFT", -20.0, 80.0)));

  EXPECT_EQ(calls, 2);
  EXPECT_EQ(rebalancer->getTradeHistory().size(), 2u);
}

TEST_F(RebalancerTest, NonStandardListenerExceptionIsContained) {
  rebalancer.emplace("acct-1", store, clock, config);
  rebalancer->setTradeListener([](const TradeExecution&) { throw 42; });
  rebalancer->start(source);

  testing::internal::CaptureStderr();
  EXPECT_NO_THROW(rebalancer->handleAlert(stopLoss("AAPL", -20.0, 80.0)));
  const std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(rebalancer->getTradeHistory().size(), 1u);
  EXPECT_NE(err.find("Trade listener threw"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 14. History is bounded by the requested limit and keeps the newest.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, HistoryLimit) {
  config.cooldown_minutes = 0;
  auto& r = make();
  r.handleAlert(stopLoss("AAPL", -12.0, 90.0));
  r.handleAlert(stopLoss("MSFT", -12.0, 91.0));
  r.handleAlert(stopLoss("TSLA", -12.0, 92.0));

  auto last_two = r.getTradeHistory(2);
  ASSERT_EQ(last_two.size(), 2u);
  EXPECT_EQ(last_two[0].symbol, "MSFT");
  EXPECT_EQ(last_two[1].symbol, "TSLA");
  EXPECT_EQ(r.getTradeHistory(50).size(), 3u);
}

// -----------------------------------------------------------------------------
// 15. Manual rebalance: needs a source; replays the snapshot's alerts.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, ManualRebalanceRequiresStart) {
  riskguard::Rebalancer r("acct-1", store, clock, config);
  EXPECT_THROW(r.manualRebalance(), riskguard::NotConnectedError);
}

TEST_F(RebalancerTest, ManualRebalanceReplaysSnapshotAlerts) {
  auto& r = make();

  std::optional<riskguard::domain::RebalanceResult> reported;
  r.setRebalanceListener(
      [&reported](const riskguard::domain::RebalanceResult& res) {
        reported = res;
      });

  riskguard::domain::PortfolioSnapshot snap;
  snap.account_id = "acct-1";
  snap.alerts.push_back(stopLoss("AAPL", -20.0, 80.0));
  snap.alerts.push_back(
      makeAlert(AlertType::IdleCapital, "", {{"idle_pct", 40.0}}));
  snap.alerts.push_back(stopLoss("NVDA", -20.0, 80.0));
  source.update(snap);

  auto result = r.manualRebalance();

  EXPECT_EQ(result.alerts_processed, 3);
  ASSERT_EQ(result.trades_executed.size(), 1u);
  EXPECT_EQ(result.trades_executed[0].symbol, "AAPL");
  EXPECT_FALSE(result.dry_run);
  ASSERT_TRUE(result.snapshot_before.has_value());
  EXPECT_EQ(result.snapshot_before->alerts.size(), 3u);
  EXPECT_EQ(result.summary(),
            "Rebalance at 10:00:00: 1 trades, $8,000.00 total");
  ASSERT_TRUE(reported.has_value());
  EXPECT_EQ(reported->trades_executed.size(), 1u);
}

TEST_F(RebalancerTest, ManualRebalanceWithoutSnapshotIsEmpty) {
  auto& r = make();
  auto result = r.manualRebalance();
  EXPECT_EQ(result.alerts_processed, 0);
  EXPECT_TRUE(result.trades_executed.empty());
  EXPECT_FALSE(result.snapshot_before.has_value());
}

// -----------------------------------------------------------------------------
// 16. Alerts and a manual rebalance racing from several threads share one
//     daily quota.
// Why: the cap check and the counter update happen under one lock; a second
//      trade slipping through would overspend the day's allowance.
// -----------------------------------------------------------------------------
TEST_F(RebalancerTest, ConcurrentAlertsRespectDailyCap) {
  config.max_daily_trades = 1;
  auto& r = make();

  riskguard::domain::PortfolioSnapshot snap;
  snap.account_id = "acct-1";
  for (const char* symbol : {"AAPL", "MSFT", "TSLA"}) {
    snap.alerts.push_back(stopLoss(symbol, -20.0, 80.0));
  }
  source.update(snap);

  std::vector<std::thread> threads;
  for (int round = 0; round < 4; ++round) {
    for (const char* symbol : {"AAPL", "MSFT", "TSLA"}) {
      threads.emplace_back(
          [&r, symbol] { r.handleAlert(stopLoss(symbol, -20.0, 80.0)); });
    }
  }
  threads.emplace_back([&r] { r.manualRebalance(); });
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(r.getTradeHistory().size(), 1u);
  EXPECT_EQ(r.getDailyStats().trades_today, 1);
  EXPECT_EQ(r.getDailyStats().trades_remaining, 0);
  EXPECT_EQ(store.orders().size(), 1u);
}
