#pragma once

#include "riskguard/domain/assessment.hpp"
#include "riskguard/risk/portfolio_composer.hpp"
#include "riskguard/store/i_portfolio_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace riskguard {

// -----------------------------------------------------------------------------
// PortfolioRiskService
// -----------------------------------------------------------------------------
//
// @brief  Binds the pure assessment rules to an account store: every call
//         reads one fresh snapshot of the account and its holdings.
//
// @details
// Throws NotFoundError for an unknown account. A healthy portfolio is not an
// error: it yields an assessment with empty suggestion lists.
//
// Thread model: Reads only. Safe from any thread as long as the store is.
// Ownership: Holds a const reference to the store; does not own it.
// -----------------------------------------------------------------------------
class PortfolioRiskService {
 public:
  PortfolioRiskService(const IPortfolioStore& store,
                       const domain::RiskThresholds& thresholds = {});

  domain::PortfolioRiskAssessment assessPortfolio(
      const std::string& account_id) const;

  std::vector<domain::ReallocationSuggestion> reallocationSuggestions(
      const std::string& account_id,
      const std::vector<domain::Opportunity>& opportunities = {}) const;

  // Symbol match is case-insensitive. std::nullopt when not held.
  std::optional<domain::PositionRiskAssessment> positionRecommendation(
      const std::string& account_id, const std::string& symbol) const;

  const PortfolioComposer& composer() const { return composer_; }

 private:
  const IPortfolioStore& store_;
  const PortfolioComposer composer_;
};

}  // namespace riskguard
