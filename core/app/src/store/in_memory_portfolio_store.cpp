#include "riskguard/store/in_memory_portfolio_store.hpp"

#include "riskguard/errors.hpp"

#include <algorithm>
#include <mutex>

namespace riskguard {

namespace {

// Residual quantities below this are treated as a closed position.
constexpr double kQuantityEpsilon = 1e-9;

template <typename Positions>
auto findHolding(Positions& positions, const std::string& symbol) {
  return std::find_if(
      positions.begin(), positions.end(),
      [&symbol](const domain::Position& p) { return p.symbol == symbol; });
}

}  // namespace

void InMemoryPortfolioStore::upsertAccount(const domain::Account& account) {
  std::unique_lock lock(mutex_);
  books_[account.account_id].account = account;
}

void InMemoryPortfolioStore::upsertPosition(const std::string& account_id,
                                            const domain::Position& position) {
  std::unique_lock lock(mutex_);
  auto book = books_.find(account_id);
  if (book == books_.end()) {
    throw NotFoundError("Account " + account_id + " not found");
  }
  auto& positions = book->second.positions;
  auto it = findHolding(positions, position.symbol);
  if (it == positions.end()) {
    positions.push_back(position);
  } else {
    *it = position;
  }
}

bool InMemoryPortfolioStore::updatePrice(const std::string& account_id,
                                         const std::string& symbol,
                                         double price) {
  std::unique_lock lock(mutex_);
  auto book = books_.find(account_id);
  if (book == books_.end()) {
    return false;
  }
  auto it = findHolding(book->second.positions, symbol);
  if (it == book->second.positions.end()) {
    return false;
  }
  it->current_price = price;
  return true;
}

std::optional<domain::Account> InMemoryPortfolioStore::account(
    const std::string& account_id) const {
  std::shared_lock lock(mutex_);
  auto book = books_.find(account_id);
  if (book == books_.end()) {
    return std::nullopt;
  }
  return book->second.account;
}

std::vector<domain::Position> InMemoryPortfolioStore::positions(
    const std::string& account_id) const {
  std::shared_lock lock(mutex_);
  auto book = books_.find(account_id);
  if (book == books_.end()) {
    return {};
  }
  return book->second.positions;
}

std::optional<domain::Position> InMemoryPortfolioStore::position(
    const std::string& account_id, const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto book = books_.find(account_id);
  if (book == books_.end()) {
    return std::nullopt;
  }
  auto it = findHolding(book->second.positions, symbol);
  if (it == book->second.positions.end()) {
    return std::nullopt;
  }
  return *it;
}

domain::OrderId InMemoryPortfolioStore::applyTrade(const domain::Order& order) {
  if (order.quantity <= 0.0 || order.price < 0.0) {
    throw ExecutionError("Invalid order for " + order.symbol +
                         ": quantity must be positive, price non-negative");
  }

  std::unique_lock lock(mutex_);
  auto book = books_.find(order.account_id);
  if (book == books_.end()) {
    throw ExecutionError("Account " + order.account_id + " not found");
  }
  auto& cash = book->second.account.cash_balance;
  auto& positions = book->second.positions;
  auto it = findHolding(positions, order.symbol);
  const double notional = order.quantity * order.price;

  // --- Validate everything before touching state -----------------------------
  if (order.side == domain::Side::Sell) {
    if (it == positions.end()) {
      throw ExecutionError("No position in " + order.symbol + " to sell");
    }
    if (order.quantity > it->quantity + kQuantityEpsilon) {
      throw ExecutionError("Sell quantity exceeds holding for " +
                           order.symbol);
    }
  } else if (notional > cash + kQuantityEpsilon) {
    throw ExecutionError("Insufficient cash to buy " + order.symbol);
  }

  // --- Apply -----------------------------------------------------------------
  if (order.side == domain::Side::Sell) {
    it->quantity -= order.quantity;
    cash += notional;
    if (it->quantity <= kQuantityEpsilon) {
      positions.erase(it);
    }
  } else {
    if (it == positions.end()) {
      domain::Position opened;
      opened.symbol = order.symbol;
      opened.quantity = order.quantity;
      opened.entry_price = order.price;
      opened.current_price = order.price;
      positions.push_back(opened);
    } else {
      const double total_qty = it->quantity + order.quantity;
      it->entry_price =
          (it->quantity * it->entry_price + order.quantity * order.price) /
          total_qty;
      it->quantity = total_qty;
      it->current_price = order.price;
    }
    cash -= notional;
  }

  domain::Order logged = order;
  logged.id = id_gen_.next_id();
  order_log_.push_back(logged);
  return logged.id;
}

std::vector<domain::Order> InMemoryPortfolioStore::orders() const {
  std::shared_lock lock(mutex_);
  return order_log_;
}

}  // namespace riskguard
