#include "predict/engine/backtest_runner.hpp"

#include "predict/domain/errors.hpp"

#include <iomanip>
#include <iostream>

namespace predict {

BacktestRunner::BacktestRunner(SimulationTimeProvider& clock, AgentLoop& loop,
                               IExecutionEngine& engine)
    : clock_(clock), loop_(loop), engine_(engine) {}

// -----------------------------------------------------------------------------
// run(): one tick per period over [start, end)
// -----------------------------------------------------------------------------
BacktestResult BacktestRunner::run(const BacktestOptions& options) {
  // A bad range is a config mistake, refused before any tick runs.
  if (options.period_ms <= 0) {
    throw ConfigError("backtest period must be positive");
  }
  if (options.end_ms <= options.start_ms) {
    throw ConfigError("backtest end " + time_utils::isoTimestamp(options.end_ms) +
                      " is not after start " +
                      time_utils::isoTimestamp(options.start_ms));
  }

  // Equity, not cash: a warm-started engine may already hold positions.
  BacktestResult result;
  result.initial_bankroll = engine_.equity();

  std::cout << "[BacktestRunner] " << time_utils::isoTimestamp(options.start_ms)
            << " -> " << time_utils::isoTimestamp(options.end_ms)
            << " period=" << options.period_ms << "ms\n";

  // Opening sample on the cash series: the first tick's bets leave the
  // bankroll, so its sample is not the starting point. Marked equity cannot
  // move before the first resolution, so that series starts at tick one.
  MetricsOptions metrics = loop_.metricsOptions();
  metrics.periods_per_year = PerformanceAccountant::periodsPerYear(options.period_ms);
  if (metrics.series == EquitySeries::Bankroll && engine_.equityCurve().empty()) {
    engine_.recordEquitySample(engine_.equitySample(options.start_ms));
  }

  // The clock jumps straight to each period start; snapshot sources serve
  // what was recorded for [t, t + period). A failed tick is counted by the
  // loop and the replay moves on, as a live run would.
  for (std::int64_t t = options.start_ms; t < options.end_ms;
       t += options.period_ms) {
    clock_.advance_time(t);
    loop_.runTick();
    ++result.periods;
  }

  // Results are read back from the engine's ledgers, the same source the
  // live STATUS command reports from.
  const AgentStatus status = loop_.getStatus();
  result.ticks_failed = status.ticks_failed;
  result.bets = engine_.bets();
  result.settlements = engine_.settlements();
  result.equity_curve = engine_.equityCurve();
  result.metrics = PerformanceAccountant::compute(
      result.bets, result.settlements, result.equity_curve, metrics);
  result.final_bankroll = engine_.riskState().bankroll;
  result.final_equity = engine_.equity();
  result.open_positions = engine_.riskState().open_position_count;

  const auto& m = result.metrics;
  std::cout << std::fixed << std::setprecision(4)
            << "[BacktestRunner] done. periods=" << result.periods
            << " failed=" << result.ticks_failed << " bets=" << m.num_bets
            << " resolved=" << m.num_resolved << " win_rate=" << m.win_rate
            << " pnl=" << m.total_realized_pnl << " roi=" << m.roi
            << " sharpe=" << m.sharpe_ratio
            << " max_dd=" << m.max_drawdown << " ("
            << toString(metrics.series) << ")"
            << " equity=" << result.final_equity << "\n"
            << std::defaultfloat;
  return result;
}

}  // namespace predict
