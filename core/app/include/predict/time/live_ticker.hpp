#pragma once

#include "predict/time/i_ticker.hpp"
#include "predict/time/i_time_provider.hpp"

namespace predict {

// -----------------------------------------------------------------------------
// LiveTicker
// -----------------------------------------------------------------------------
// Sleeps in slices of at most poll_slice_ms against the given clock so a
// stop request (SIGINT, IPC) is honoured within one slice.
// -----------------------------------------------------------------------------
class LiveTicker final : public ITicker {
 public:
  explicit LiveTicker(const ITimeProvider& clock,
                      std::int64_t poll_slice_ms = 100);

  bool sleepUntil(std::int64_t deadline_ms,
                  const std::atomic<bool>& stop) override;

 private:
  const ITimeProvider& clock_;
  std::int64_t poll_slice_ms_;
};

}  // namespace predict
