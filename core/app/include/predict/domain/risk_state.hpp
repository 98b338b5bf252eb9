#pragma once

#include <cstdint>
#include <string>

namespace predict {
namespace domain {

// -----------------------------------------------------------------------------
// RiskState — portfolio figures the RiskManager gates on
// -----------------------------------------------------------------------------
//
// @brief  Cash bankroll, today's realized P&L and the open book summary.
//
// @details
// Owned by the execution engine and mutated only inside a tick's Acting and
// Tracking phases (placeBet, resolve, rollDay). Everything else receives a
// const reference.
//
// bankroll               cash available to stake. Stakes are debited at
//                        placement; payouts are credited at resolution.
// daily_pnl              realized P&L of resolutions since the last rollDay.
// start_of_day_bankroll  equity (cash + open cost basis) when the current
//                        day began; denominator of the daily loss gate.
// open_exposure          sum of cost basis across open positions.
// day_key                UTC "YYYY-MM-DD" of the current trading day.
// -----------------------------------------------------------------------------
struct RiskState {
  double bankroll{0.0};
  double daily_pnl{0.0};
  double start_of_day_bankroll{0.0};
  int open_position_count{0};
  double open_exposure{0.0};
  std::string day_key;
};

}  // namespace domain
}  // namespace predict
