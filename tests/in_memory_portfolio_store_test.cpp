// =============================================================================
// in_memory_portfolio_store_test.cpp
// =============================================================================
// Unit tests for riskguard::InMemoryPortfolioStore.
//
// Validates:
//   - Seeding and lookups
//   - Sell: cash credited, holding reduced, closed at zero
//   - Buy: weighted-average entry, cash debited
//   - All-or-nothing failures (oversell, unknown account, insufficient cash)
//   - Order ids are unique and increasing
// =============================================================================

#include "riskguard/errors.hpp"
#include "riskguard/store/in_memory_portfolio_store.hpp"

#include <gtest/gtest.h>

#include <string>

using riskguard::domain::Order;
using riskguard::domain::Side;

class InMemoryPortfolioStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store.upsertAccount({"acct-1", 1000.0});

    riskguard::domain::Position aapl;
    aapl.symbol = "AAPL";
    aapl.quantity = 10.0;
    aapl.entry_price = 100.0;
    aapl.current_price = 120.0;
    store.upsertPosition("acct-1", aapl);
  }

  static Order makeOrder(Side side, const std::string& symbol, double qty,
                         double price) {
    Order o;
    o.account_id = "acct-1";
    o.symbol = symbol;
    o.side = side;
    o.quantity = qty;
    o.price = price;
    return o;
  }

  riskguard::InMemoryPortfolioStore store;
};

TEST_F(InMemoryPortfolioStoreTest, SeedAndLookup) {
  ASSERT_TRUE(store.account("acct-1").has_value());
  EXPECT_DOUBLE_EQ(store.account("acct-1")->cash_balance, 1000.0);
  EXPECT_FALSE(store.account("other").has_value());

  EXPECT_EQ(store.positions("acct-1").size(), 1u);
  EXPECT_TRUE(store.positions("other").empty());
  EXPECT_TRUE(store.position("acct-1", "AAPL").has_value());
  EXPECT_FALSE(store.position("acct-1", "MSFT").has_value());
}

TEST_F(InMemoryPortfolioStoreTest, UpsertPositionNeedsAccount) {
  riskguard::domain::Position p;
  p.symbol = "X";
  EXPECT_THROW(store.upsertPosition("missing", p), riskguard::NotFoundError);
}

TEST_F(InMemoryPortfolioStoreTest, UpdatePrice) {
  EXPECT_TRUE(store.updatePrice("acct-1", "AAPL", 130.0));
  EXPECT_DOUBLE_EQ(*store.position("acct-1", "AAPL")->current_price, 130.0);
  EXPECT_FALSE(store.updatePrice("acct-1", "MSFT", 1.0));
}

// -----------------------------------------------------------------------------
// Sell half, then the rest: cash credited each time, holding removed at zero.
// -----------------------------------------------------------------------------
TEST_F(InMemoryPortfolioStoreTest, SellReducesThenCloses) {
  store.applyTrade(makeOrder(Side::Sell, "AAPL", 4.0, 120.0));
  EXPECT_DOUBLE_EQ(store.position("acct-1", "AAPL")->quantity, 6.0);
  EXPECT_DOUBLE_EQ(store.account("acct-1")->cash_balance, 1480.0);

  store.applyTrade(makeOrder(Side::Sell, "AAPL", 6.0, 100.0));
  EXPECT_FALSE(store.position("acct-1", "AAPL").has_value());
  EXPECT_DOUBLE_EQ(store.account("acct-1")->cash_balance, 2080.0);
}

TEST_F(InMemoryPortfolioStoreTest, BuyAveragesEntryPrice) {
  store.applyTrade(makeOrder(Side::Buy, "AAPL", 10.0, 50.0));

  auto p = store.position("acct-1", "AAPL");
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(p->quantity, 20.0);
  EXPECT_DOUBLE_EQ(p->entry_price, 75.0);
  EXPECT_DOUBLE_EQ(store.account("acct-1")->cash_balance, 500.0);

  store.applyTrade(makeOrder(Side::Buy, "MSFT", 1.0, 300.0));
  EXPECT_DOUBLE_EQ(store.position("acct-1", "MSFT")->entry_price, 300.0);
}

// -----------------------------------------------------------------------------
// A rejected order leaves the book exactly as it was.
// -----------------------------------------------------------------------------
TEST_F(InMemoryPortfolioStoreTest, FailuresLeaveStateUntouched) {
  EXPECT_THROW(store.applyTrade(makeOrder(Side::Sell, "AAPL", 11.0, 120.0)),
               riskguard::ExecutionError);
  EXPECT_THROW(store.applyTrade(makeOrder(Side::Sell, "MSFT", 1.0, 10.0)),
               riskguard::ExecutionError);
  EXPECT_THROW(store.applyTrade(makeOrder(Side::Buy, "AAPL", 100.0, 100.0)),
               riskguard::ExecutionError);
  EXPECT_THROW(store.applyTrade(makeOrder(Side::Sell, "AAPL", 0.0, 100.0)),
               riskguard::ExecutionError);

  Order foreign = makeOrder(Side::Sell, "AAPL", 1.0, 100.0);
  foreign.account_id = "other";
  EXPECT_THROW(store.applyTrade(foreign), riskguard::ExecutionError);

  EXPECT_DOUBLE_EQ(store.position("acct-1", "AAPL")->quantity, 10.0);
  EXPECT_DOUBLE_EQ(store.account("acct-1")->cash_balance, 1000.0);
  EXPECT_TRUE(store.orders().empty());
}

TEST_F(InMemoryPortfolioStoreTest, OrderIdsIncrease) {
  auto first = store.applyTrade(makeOrder(Side::Sell, "AAPL", 1.0, 120.0));
  auto second = store.applyTrade(makeOrder(Side::Sell, "AAPL", 1.0, 120.0));
  EXPECT_LT(first, second);

  auto log = store.orders();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0].id, first);
  EXPECT_EQ(log[1].id, second);
}
