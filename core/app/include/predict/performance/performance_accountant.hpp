#pragma once

#include "predict/domain/bet.hpp"
#include "predict/domain/equity_sample.hpp"
#include "predict/domain/resolution.hpp"

#include <cstdint>
#include <vector>

namespace predict {

// Which EquitySample field returns, Sharpe and drawdown are computed on.
//   Bankroll  cash only: a stake leaves the curve when placed and its
//             payout returns when the market resolves.
//   Equity    cash plus open positions at cost: moves only on resolution.
enum class EquitySeries { Bankroll, Equity };

const char* toString(EquitySeries s);

struct MetricsOptions {
  EquitySeries series{EquitySeries::Bankroll};
  // Equity samples per year; Sharpe is scaled by its square root.
  double periods_per_year{365.0};
};

struct PerformanceMetrics {
  int num_bets{0};
  int num_resolved{0};
  int wins{0};
  int losses{0};
  double win_rate{0.0};
  double avg_edge{0.0};
  double total_staked{0.0};
  double total_realized_pnl{0.0};
  double roi{0.0};
  double sharpe_ratio{0.0};
  double max_drawdown{0.0};
  double current_drawdown{0.0};
  // Current drawdown of the Equity series whatever the selected one. Cash
  // tied up in open positions is not a loss, so the kill switch reads this.
  double equity_drawdown{0.0};
  double start_equity{0.0};
  double end_equity{0.0};
};

// -----------------------------------------------------------------------------
// PerformanceAccountant
// -----------------------------------------------------------------------------
//
// @brief  Stateless aggregation over the append-only ledgers: Bets,
//         Settlements and the equity curve.
//
// @details
// Recomputed from scratch on every call, never updated incrementally, so a
// warm-started simulator and a fresh one with the same ledgers report the
// same numbers.
//
//   win_rate      wins / num_resolved                  (settlements)
//   avg_edge      mean(edge_at_entry)                  (settlements)
//   roi           total_realized_pnl / resolved stake  (settlements)
//   returns_i     (v_i - v_{i-1}) / v_{i-1}            (selected series)
//   sharpe        mean(returns) / stdev(returns) * sqrt(periods_per_year)
//   max_drawdown  max_i (peak_i - v_i) / peak_i
//
// v is the series MetricsOptions selects, bankroll by default.
// start_equity and end_equity are its first and last points.
// periodsPerYear() converts the sampling interval to periods_per_year: a
// daily curve is 365, an hourly one 8760, a weekly one 365/7.
//
// Degenerate inputs yield 0, never NaN: an empty ledger, fewer than two
// equity samples, zero-variance returns. stdev is the population standard
// deviation. Returns are skipped where the previous equity is not
// positive, and so are drawdown points whose running peak is not positive.
// -----------------------------------------------------------------------------
class PerformanceAccountant {
 public:
  static PerformanceMetrics compute(
      const std::vector<domain::Bet>& bets,
      const std::vector<domain::Settlement>& settlements,
      const std::vector<domain::EquitySample>& equity_curve,
      const MetricsOptions& options = {});

  static std::vector<double> equityValues(
      const std::vector<domain::EquitySample>& equity_curve,
      EquitySeries series = EquitySeries::Bankroll);

  static std::vector<double> dailyReturns(const std::vector<double>& equity);

  static double sharpeRatio(const std::vector<double>& returns,
                            double periods_per_year = kPeriodsPerYear);

  // 365 for a daily interval, scaled inversely for any other one. A
  // non-positive interval counts as daily.
  static double periodsPerYear(std::int64_t sample_interval_ms);

  static double maxDrawdown(const std::vector<double>& equity);

  // Drawdown of the last point from the running peak.
  static double currentDrawdown(const std::vector<double>& equity);

  static constexpr double kPeriodsPerYear = 365.0;
};

}  // namespace predict
