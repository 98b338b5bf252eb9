#pragma once

#include "predict/domain/signal.hpp"

namespace predict {

struct SizingParams {
  double kelly_fraction{0.5};
  double max_bet_pct{0.05};
};

// -------------------------------------------------------------------------
// kellyFraction(p, b, configured_fraction)
// -------------------------------------------------------------------------
// @brief  max(0, (p*b - (1 - p)) / b) * configured_fraction.
//
// @details
// The uncapped, scaled Kelly fraction for win probability p and decimal
// net odds b (profit per dollar staked on a win). 0 when b <= 0.
//
//   kellyFraction(0.6, 1.0, 0.5) == 0.1
// -------------------------------------------------------------------------
double kellyFraction(double p, double b, double configured_fraction);

// Net odds of buying a $1-payout share at `price`: 1/price - 1.
double decimalOddsFromPrice(double price);

struct StakeSizing {
  double raw_kelly{0.0};       // unscaled, may be negative
  double stake_fraction{0.0};  // scaled and capped, in [0, max_bet_pct]
  double stake_amount{0.0};
};

// -----------------------------------------------------------------------------
// KellySizer
// -----------------------------------------------------------------------------
//
// @brief  Pure mapping (signal, bankroll) -> stake.
//
// @details
//   b              = 1 / effective_price - 1
//   raw_kelly      = (p * b - (1 - p)) / b
//   stake_fraction = min(max(0, raw_kelly) * kelly_fraction, max_bet_pct)
//   stake_amount   = stake_fraction * bankroll
//
// Zero stake for non-positive edge, odds, bankroll, kelly_fraction or
// max_bet_pct. No rounding, no state: identical inputs give identical
// stakes, which deterministic backtests rely on.
// -----------------------------------------------------------------------------
class KellySizer {
 public:
  explicit KellySizer(const SizingParams& params);

  StakeSizing size(const domain::Signal& signal, double bankroll) const;

  StakeSizing size(double estimated_prob, double effective_price, double edge,
                   double bankroll) const;

  const SizingParams& params() const { return params_; }

 private:
  const SizingParams params_;
};

}  // namespace predict
