#pragma once

#include "riskguard/concurrent/order_id_generator.hpp"
#include "riskguard/store/i_portfolio_store.hpp"

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace riskguard {

// -----------------------------------------------------------------------------
// InMemoryPortfolioStore
// -----------------------------------------------------------------------------
//
// @brief  IPortfolioStore held in process memory. Used by the daemon when no
//         external store is wired in, and by every test.
//
// @details
// Trade application rules:
//   Sell  quantity must be > 0 and <= held quantity. Proceeds
//         (quantity * price) are credited to cash. A position whose quantity
//         falls to zero is removed.
//   Buy   quantity * price must be <= cash. The position's entry price
//         becomes the quantity-weighted average of old and new lots.
// Any violation throws ExecutionError before anything is modified.
//
// Thread model:
//   std::shared_mutex. Readers take a shared lock, applyTrade and the
//   seeding methods take an exclusive lock.
// -----------------------------------------------------------------------------
class InMemoryPortfolioStore final : public IPortfolioStore {
 public:
  InMemoryPortfolioStore() = default;

  InMemoryPortfolioStore(const InMemoryPortfolioStore&) = delete;
  InMemoryPortfolioStore& operator=(const InMemoryPortfolioStore&) = delete;

  // --- Seeding ---------------------------------------------------------------
  void upsertAccount(const domain::Account& account);

  // Replaces the holding with the same symbol or appends a new one. Throws
  // NotFoundError if the account does not exist.
  void upsertPosition(const std::string& account_id,
                      const domain::Position& position);

  // Updates the last quote of a holding. Returns false if it is not held.
  bool updatePrice(const std::string& account_id, const std::string& symbol,
                   double price);

  // --- IPortfolioStore -------------------------------------------------------
  std::optional<domain::Account> account(
      const std::string& account_id) const override;
  std::vector<domain::Position> positions(
      const std::string& account_id) const override;
  std::optional<domain::Position> position(
      const std::string& account_id,
      const std::string& symbol) const override;
  domain::OrderId applyTrade(const domain::Order& order) override;

  // Every order applied so far, oldest first.
  std::vector<domain::Order> orders() const;

 private:
  struct Book {
    domain::Account account;
    std::vector<domain::Position> positions;
  };

  mutable std::shared_mutex mutex_;
  std::map<std::string, Book> books_;
  std::vector<domain::Order> order_log_;
  OrderIdGenerator id_gen_;
};

}  // namespace riskguard
