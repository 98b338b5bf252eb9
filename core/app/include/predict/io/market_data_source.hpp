#pragma once

#include "predict/domain/market.hpp"
#include "predict/domain/resolution.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// IMarketDataSource
// -----------------------------------------------------------------------------
//
// fetchMarkets(timeout)
//   Current quotes for the tradeable universe. updated_at_ms must be the
//   observation time so EdgeEvaluator can age them.
//
// fetchResolutions(open_market_ids, timeout)
//   Resolutions known for any of the given markets. Redelivery is allowed;
//   ExecutionSimulator::resolve() is idempotent.
//
// Both throw TransientIoError for retryable failures.
// -----------------------------------------------------------------------------
class IMarketDataSource {
 public:
  virtual ~IMarketDataSource() = default;

  virtual std::vector<domain::MarketQuote> fetchMarkets(
      std::chrono::milliseconds timeout) = 0;

  virtual std::vector<domain::Resolution> fetchResolutions(
      const std::vector<std::string>& open_market_ids,
      std::chrono::milliseconds timeout) = 0;
};

}  // namespace predict
