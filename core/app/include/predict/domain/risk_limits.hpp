#pragma once

namespace predict {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — portfolio-level hard thresholds
// -----------------------------------------------------------------------------
//
// @brief  Parameters of the RiskManager gate, copied into it at
//         construction and constant for the engine's lifetime.
//
// @details
// All percentages are fractions (0.05 == 5%).
//
//   min_edge                  minimum fee-adjusted EV per dollar.
//   max_concurrent_positions  cap on distinct open markets.
//   max_daily_loss_pct        realized loss floor for the day, relative to
//                             start-of-day bankroll.
//   max_volume_pct            stake cap relative to the market's 24h volume.
//   max_bet_pct               cap on combined exposure in one market,
//                             relative to the current bankroll.
//
// Loaded from the "trading" section of the engine config; the defaults are
// the conservative paper-trading settings.
// -----------------------------------------------------------------------------
struct RiskLimits {
  double min_edge{0.05};
  int max_concurrent_positions{10};
  double max_daily_loss_pct{0.10};
  double max_volume_pct{0.10};
  double max_bet_pct{0.05};
};

}  // namespace domain
}  // namespace predict
