#include "riskguard/monitor/snapshot_cache.hpp"

#include <utility>

namespace riskguard {

void SnapshotCache::update(domain::PortfolioSnapshot snapshot) {
  std::lock_guard lock(mutex_);
  latest_ = std::move(snapshot);
}

void SnapshotCache::clear() {
  std::lock_guard lock(mutex_);
  latest_.reset();
}

std::optional<domain::PortfolioSnapshot> SnapshotCache::currentSnapshot()
    const {
  std::lock_guard lock(mutex_);
  return latest_;
}

}  // namespace riskguard
