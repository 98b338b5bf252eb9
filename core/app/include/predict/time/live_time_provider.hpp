#pragma once

#include "predict/time/i_time_provider.hpp"

namespace predict {

// Wall-clock time from std::chrono::system_clock.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace predict
