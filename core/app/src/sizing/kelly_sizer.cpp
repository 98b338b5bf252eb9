#include "predict/sizing/kelly_sizer.hpp"

#include <algorithm>
#include <cmath>

namespace predict {

double kellyFraction(double p, double b, double configured_fraction) {
  if (!(b > 0.0)) {
    return 0.0;
  }
  const double raw = (p * b - (1.0 - p)) / b;
  return std::max(0.0, raw) * configured_fraction;
}

double decimalOddsFromPrice(double price) {
  if (!(price > 0.0)) {
    return 0.0;
  }
  return 1.0 / price - 1.0;
}

KellySizer::KellySizer(const SizingParams& params) : params_(params) {}

StakeSizing KellySizer::size(const domain::Signal& signal,
                             double bankroll) const {
  return size(signal.estimated_prob, signal.effective_price, signal.edge,
              bankroll);
}

StakeSizing KellySizer::size(double estimated_prob, double effective_price,
                             double edge, double bankroll) const {
  StakeSizing out;
  const double b = decimalOddsFromPrice(effective_price);
  if (b > 0.0) {
    out.raw_kelly = (estimated_prob * b - (1.0 - estimated_prob)) / b;
  }

  if (!(edge > 0.0) || !(b > 0.0) || !(bankroll > 0.0) ||
      !(params_.kelly_fraction > 0.0) || !(params_.max_bet_pct > 0.0) ||
      !std::isfinite(bankroll)) {
    return out;
  }

  out.stake_fraction =
      std::min(kellyFraction(estimated_prob, b, params_.kelly_fraction),
               params_.max_bet_pct);
  out.stake_amount = out.stake_fraction * bankroll;
  return out;
}

}  // namespace predict
