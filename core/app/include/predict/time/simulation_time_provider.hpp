#pragma once

#include "predict/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace predict {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock for backtests
// -----------------------------------------------------------------------------
//
// @brief  now_ms() returns whatever advance_time() last stored.
//
// @details
// BacktestRunner advances the clock to each period start before running
// the tick, so the engine only ever sees time the historical data has
// revealed. Nothing enforces monotonicity; the runner walks periods in
// order and tests are free to set arbitrary times.
//
// Atomic so the IPC thread may read a status timestamp while a backtest
// tick advances the clock.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms);

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms (may be negative in tests).
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace predict
