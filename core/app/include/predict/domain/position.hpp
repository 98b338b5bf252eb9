#pragma once

#include "predict/domain/direction.hpp"

#include <cstdint>
#include <string>

namespace predict {
namespace domain {

enum class PositionStatus { Open, Resolved };

inline const char* toString(PositionStatus s) {
  switch (s) {
    case PositionStatus::Open:     return "open";
    case PositionStatus::Resolved: return "resolved";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// Position — aggregate holding in one market
// -----------------------------------------------------------------------------
//
// @brief  Shares of one outcome token bought across one or more Bets.
//
// @details
// Exactly one open Position exists per market_id, owned by the execution
// engine. A second Bet in the same direction merges in with a size-weighted
// average:
//
//   new_avg = (shares * avg_price + fill_shares * fill_price)
//             / (shares + fill_shares)
//
// cost_basis is the sum of stakes, so shares * avg_price == cost_basis up
// to rounding. On resolution the winner is paid shares * $1.
//
// Value type; the authoritative copy lives inside ExecutionSimulator and
// events carry snapshots.
// -----------------------------------------------------------------------------
struct Position {
  std::string market_id;
  Direction direction{Direction::Yes};
  double shares{0.0};
  double avg_price{0.0};
  double cost_basis{0.0};
  PositionStatus status{PositionStatus::Open};
  std::int64_t opened_at_ms{0};
  int bet_count{0};
};

}  // namespace domain
}  // namespace predict
