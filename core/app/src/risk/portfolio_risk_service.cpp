#include "riskguard/risk/portfolio_risk_service.hpp"

#include "riskguard/errors.hpp"

namespace riskguard {

PortfolioRiskService::PortfolioRiskService(
    const IPortfolioStore& store, const domain::RiskThresholds& thresholds)
    : store_(store), composer_(thresholds) {}

domain::PortfolioRiskAssessment PortfolioRiskService::assessPortfolio(
    const std::string& account_id) const {
  std::optional<domain::Account> account = store_.account(account_id);
  if (!account) {
    throw NotFoundError("Account " + account_id + " not found");
  }
  return composer_.assessPortfolio(*account, store_.positions(account_id));
}

std::vector<domain::ReallocationSuggestion>
PortfolioRiskService::reallocationSuggestions(
    const std::string& account_id,
    const std::vector<domain::Opportunity>& opportunities) const {
  return composer_.reallocationSuggestions(assessPortfolio(account_id),
                                           opportunities);
}

std::optional<domain::PositionRiskAssessment>
PortfolioRiskService::positionRecommendation(const std::string& account_id,
                                             const std::string& symbol) const {
  return PortfolioComposer::findPosition(assessPortfolio(account_id), symbol);
}

}  // namespace riskguard
