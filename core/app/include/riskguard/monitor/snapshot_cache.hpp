#pragma once

#include "riskguard/monitor/i_alert_source.hpp"

#include <mutex>

namespace riskguard {

// -----------------------------------------------------------------------------
// SnapshotCache
// -----------------------------------------------------------------------------
// IAlertSource that remembers the latest snapshot handed to update(). The
// alert gateway writes it from its receive thread; the Rebalancer reads it
// during a manual rebalance. A newer snapshot replaces the older one whole.
// -----------------------------------------------------------------------------
class SnapshotCache final : public IAlertSource {
 public:
  SnapshotCache() = default;

  SnapshotCache(const SnapshotCache&) = delete;
  SnapshotCache& operator=(const SnapshotCache&) = delete;

  void update(domain::PortfolioSnapshot snapshot);
  void clear();

  std::optional<domain::PortfolioSnapshot> currentSnapshot() const override;

 private:
  mutable std::mutex mutex_;
  std::optional<domain::PortfolioSnapshot> latest_;
};

}  // namespace riskguard
