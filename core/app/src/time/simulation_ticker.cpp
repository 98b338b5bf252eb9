#include "predict/time/simulation_ticker.hpp"

namespace predict {

SimulationTicker::SimulationTicker(SimulationTimeProvider& clock)
    : clock_(clock) {}

bool SimulationTicker::sleepUntil(std::int64_t deadline_ms,
                                  const std::atomic<bool>& stop) {
  if (stop.load()) {
    return false;
  }
  if (clock_.now_ms() < deadline_ms) {
    clock_.advance_time(deadline_ms);
  }
  return true;
}

}  // namespace predict
