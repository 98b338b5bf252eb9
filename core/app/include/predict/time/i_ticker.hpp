#pragma once

#include <atomic>
#include <cstdint>

namespace predict {

// -----------------------------------------------------------------------------
// ITicker — how AgentLoop::run() waits for the next tick slot
// -----------------------------------------------------------------------------
//
// @brief  Pairs with an ITimeProvider. LiveTicker actually sleeps;
//         SimulationTicker jumps its SimulationTimeProvider forward.
//
// sleepUntil(deadline_ms, stop)
//   Returns true once the clock has reached deadline_ms, false if `stop`
//   became true first. Must return promptly (within a poll slice) after
//   stop is set.
// -----------------------------------------------------------------------------
class ITicker {
 public:
  virtual ~ITicker() = default;

  virtual bool sleepUntil(std::int64_t deadline_ms,
                          const std::atomic<bool>& stop) = 0;
};

}  // namespace predict
