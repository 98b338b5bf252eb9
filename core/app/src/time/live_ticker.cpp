#include "predict/time/live_ticker.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace predict {

LiveTicker::LiveTicker(const ITimeProvider& clock, std::int64_t poll_slice_ms)
    : clock_(clock), poll_slice_ms_(std::max<std::int64_t>(1, poll_slice_ms)) {}

bool LiveTicker::sleepUntil(std::int64_t deadline_ms,
                            const std::atomic<bool>& stop) {
  while (!stop.load()) {
    const std::int64_t remaining = deadline_ms - clock_.now_ms();
    if (remaining <= 0) {
      return true;
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(std::min(remaining, poll_slice_ms_)));
  }
  return false;
}

}  // namespace predict
