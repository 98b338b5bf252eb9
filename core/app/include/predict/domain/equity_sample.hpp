#pragma once

#include <cstdint>
#include <string>

namespace predict {
namespace domain {

// -----------------------------------------------------------------------------
// EquitySample — one point on the equity curve
// -----------------------------------------------------------------------------
// Append-only. equity is bankroll plus the cost basis of open positions
// (positions marked at cost); bankroll is the cash part alone. Returns,
// Sharpe and drawdown use bankroll unless MetricsOptions selects equity;
// the kill switch always watches equity.
// -----------------------------------------------------------------------------
struct EquitySample {
  std::string day_key;
  std::int64_t timestamp_ms{0};
  double bankroll{0.0};
  double equity{0.0};
};

}  // namespace domain
}  // namespace predict
