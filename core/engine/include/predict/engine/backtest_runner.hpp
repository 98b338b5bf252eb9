#pragma once

#include "predict/domain/bet.hpp"
#include "predict/domain/equity_sample.hpp"
#include "predict/domain/resolution.hpp"
#include "predict/engine/agent_loop.hpp"
#include "predict/execution/i_execution_engine.hpp"
#include "predict/performance/performance_accountant.hpp"
#include "predict/time/simulation_time_provider.hpp"
#include "predict/time/time_utils.hpp"

#include <cstdint>
#include <vector>

namespace predict {

struct BacktestOptions {
  std::int64_t start_ms{0};  // inclusive
  std::int64_t end_ms{0};    // exclusive
  std::int64_t period_ms{time_utils::kMsPerDay};
};

struct BacktestResult {
  PerformanceMetrics metrics;
  int periods{0};
  std::uint64_t ticks_failed{0};
  double initial_bankroll{0.0};
  double final_bankroll{0.0};
  double final_equity{0.0};
  int open_positions{0};
  std::vector<domain::Bet> bets;
  std::vector<domain::Settlement> settlements;
  std::vector<domain::EquitySample> equity_curve;
};

// -----------------------------------------------------------------------------
// BacktestRunner — replays history through the live decision path
// -----------------------------------------------------------------------------
//
// @brief  Steps a SimulationTimeProvider over [start, end) in fixed periods
//         and calls AgentLoop::runTick() once per period.
//
// @details
// The AgentLoop must have been built over the same SimulationTimeProvider,
// snapshot-backed sources and PerTick equity sampling; the runner adds
// nothing to the decision logic. Each period's tick records one
// EquitySample. When metrics run on the bankroll series the runner first
// records an opening sample at start, the cash before any bet; on the
// equity series the first tick's sample is the baseline. Metrics use the
// loop's series, annualized by period_ms.
//
// Synchronous and deterministic: the same snapshots and config produce the
// same bets, settlements and equity curve.
// -----------------------------------------------------------------------------
class BacktestRunner {
 public:
  BacktestRunner(SimulationTimeProvider& clock, AgentLoop& loop,
                 IExecutionEngine& engine);

  // Throws ConfigError when end <= start or period_ms <= 0.
  BacktestResult run(const BacktestOptions& options);

 private:
  SimulationTimeProvider& clock_;
  AgentLoop& loop_;
  IExecutionEngine& engine_;
};

}  // namespace predict
