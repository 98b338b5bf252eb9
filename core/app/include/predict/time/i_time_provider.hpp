#pragma once

#include <cstdint>

namespace predict {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract "now"
// -----------------------------------------------------------------------------
//
// @brief  Every component that stamps or ages data asks this interface for
//         the time instead of reading the system clock.
//
// @details
//   LiveTimeProvider        wall clock (paper / live).
//   SimulationTimeProvider  set by BacktestRunner to each historical period.
//
// Swapping the provider (and the matching ITicker) is the only difference
// between a backtest and a paper run. Quote staleness, day rollover, bet
// and equity timestamps all follow it.
//
// Milliseconds since the Unix epoch, UTC. Implementations must be safe for
// concurrent reads; components hold a const reference and never own it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  virtual std::int64_t now_ms() const = 0;
};

}  // namespace predict
