#pragma once

#include "predict/time/i_ticker.hpp"
#include "predict/time/simulation_time_provider.hpp"

namespace predict {

// Advances the simulation clock straight to the deadline; never blocks.
class SimulationTicker final : public ITicker {
 public:
  explicit SimulationTicker(SimulationTimeProvider& clock);

  bool sleepUntil(std::int64_t deadline_ms,
                  const std::atomic<bool>& stop) override;

 private:
  SimulationTimeProvider& clock_;
};

}  // namespace predict
