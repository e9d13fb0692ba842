#pragma once

#include <atomic>
#include <cstdint>

namespace riskguard {

// -----------------------------------------------------------------------------
// OrderIdGenerator — thread-safe, monotonically increasing order ids
// -----------------------------------------------------------------------------
//
// @details
// Starts at 1; 0 is the "unassigned" sentinel carried by dry-run trades.
// One per position store; each store has its own id sequence.
//
// Thread model: next_id() may be called concurrently (relaxed fetch_add).
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace riskguard
