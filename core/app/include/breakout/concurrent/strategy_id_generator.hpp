#pragma once

#include "breakout/domain/strategy_config.hpp"

#include <atomic>
#include <cstdint>

namespace breakout {

// -----------------------------------------------------------------------------
// StrategyIdGenerator: thread-safe, monotonically increasing strategy ids
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique StrategyId values. Id 0 is reserved as "unset".
//
// @details
// Strategies are created from the control surface (IPC thread), from the
// startup list (main thread) and from tests concurrently, so the counter is
// an atomic rather than a plain integer under the manager's lock.
//
// After a checkpoint restore the generator must never re-issue an id that a
// restored strategy already holds; advancePast() raises the counter above a
// given id without ever lowering it.
//
// Ownership:
//   Owned by StrategyManager as a value member.
// -----------------------------------------------------------------------------
class StrategyIdGenerator {
 public:
  StrategyIdGenerator() = default;

  StrategyIdGenerator(const StrategyIdGenerator&) = delete;
  StrategyIdGenerator& operator=(const StrategyIdGenerator&) = delete;
  StrategyIdGenerator(StrategyIdGenerator&&) = delete;
  StrategyIdGenerator& operator=(StrategyIdGenerator&&) = delete;

  // Returns the next unique id. Safe to call concurrently.
  domain::StrategyId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // -------------------------------------------------------------------------
  // advancePast(id)
  // -------------------------------------------------------------------------
  // @brief  Ensures every later next_id() returns a value greater than `id`.
  //
  // @details
  // CAS loop: the counter only moves forward, so concurrent callers and
  // concurrent next_id() calls cannot produce a duplicate.
  // -------------------------------------------------------------------------
  void advancePast(domain::StrategyId id) {
    domain::StrategyId current = next_id_.load(std::memory_order_relaxed);
    while (current <= id &&
           !next_id_.compare_exchange_weak(current, id + 1,
                                           std::memory_order_relaxed)) {
    }
  }

  // The id the next call to next_id() would return. Used by checkpoints.
  domain::StrategyId peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::StrategyId> next_id_{1};
};

}  // namespace breakout
