#pragma once

#include "predict/domain/bet.hpp"

#include <atomic>
#include <cstdint>

namespace predict {

// -----------------------------------------------------------------------------
// BetIdGenerator — monotonically increasing Bet id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out ids starting at 1. Id 0 means "unset".
//
// @details
// Owned by AgentLoop and used only on the tick thread, but atomic so that
// advance_past() during a warm start and next_id() can never race.
//
// After a restart the journal already holds ids 1..N. advance_past(N)
// moves the counter so the next Bet gets N + 1 and the journal keeps a
// single id space across process lifetimes.
// -----------------------------------------------------------------------------
class BetIdGenerator {
 public:
  BetIdGenerator() = default;

  BetIdGenerator(const BetIdGenerator&) = delete;
  BetIdGenerator& operator=(const BetIdGenerator&) = delete;
  BetIdGenerator(BetIdGenerator&&) = delete;
  BetIdGenerator& operator=(BetIdGenerator&&) = delete;

  domain::BetId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Ensures every later next_id() is greater than `used`.
  void advance_past(domain::BetId used) {
    domain::BetId current = next_id_.load(std::memory_order_relaxed);
    while (current <= used &&
           !next_id_.compare_exchange_weak(current, used + 1,
                                           std::memory_order_relaxed)) {
    }
  }

  domain::BetId peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::BetId> next_id_{1};
};

}  // namespace predict
