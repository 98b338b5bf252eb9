#pragma once

#include "predict/domain/direction.hpp"
#include "predict/domain/signal.hpp"

#include <cstdint>

namespace predict {
namespace domain {

using BetId = std::uint64_t;

// -----------------------------------------------------------------------------
// Bet — one committed stake
// -----------------------------------------------------------------------------
//
// @brief  Created once by the TradingPipeline after every gate has passed,
//         then handed to the execution engine. Never modified afterwards.
//
// @details
// Invariant at placement: stake_amount <= max_bet_pct * bankroll. The
// KellySizer caps the fraction and the RiskManager exposure gate re-checks
// the combined market exposure, so a Bet that reaches placeBet() already
// satisfies it.
//
// execution_price is the signal's effective (slippage-adjusted) price. The
// number of shares bought is stake_amount / execution_price.
//
// A Bet becomes terminal when its market resolves; the terminal record is a
// Settlement keyed by bet id.
// -----------------------------------------------------------------------------
struct Bet {
  BetId id{0};
  Signal signal;
  double stake_amount{0.0};
  double kelly_fraction_applied{0.0};
  TradingMode mode{TradingMode::Paper};
  double execution_price{0.0};
  std::int64_t placed_at_ms{0};

  const std::string& marketId() const { return signal.market_id; }
  Direction direction() const { return signal.direction; }
  double shares() const {
    return execution_price > 0.0 ? stake_amount / execution_price : 0.0;
  }
};

}  // namespace domain
}  // namespace predict
