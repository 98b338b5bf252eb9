#pragma once

#include "predict/performance/performance_accountant.hpp"

#include <string>

namespace predict {

struct KillSwitchParams {
  bool enabled{true};
  double max_drawdown_pct{0.25};
  int max_consecutive_failures{5};
};

struct KillSwitchVerdict {
  bool trip{false};
  std::string reason;  // "MAX_DRAWDOWN" / "CONSECUTIVE_FAILURES"
  double current_value{0.0};
  double limit_value{0.0};
};

// -----------------------------------------------------------------------------
// KillSwitchPolicy
// -----------------------------------------------------------------------------
//
// @brief  Decides, after each tick, whether new bets must be suspended.
//
// @details
// Policy only: it reads the metrics and the loop's failure counter and
// returns a verdict. AgentLoop acts on it by halting the RiskManager and
// publishing a RiskViolationEvent. Open positions keep being tracked and
// resolved while halted; an operator RESUME lifts the halt.
//
//   MAX_DRAWDOWN          equity_drawdown >= max_drawdown_pct (cash plus
//                         positions at cost below its running peak by that
//                         fraction; staking alone never trips it)
//   CONSECUTIVE_FAILURES  consecutive failed ticks >= max_consecutive_failures
//
// A non-positive threshold disables that criterion. The verdict is a level,
// not an edge: AgentLoop halts only when it turns from clear to tripped, so
// an operator RESUME during a standing breach is not immediately undone.
// -----------------------------------------------------------------------------
class KillSwitchPolicy {
 public:
  explicit KillSwitchPolicy(const KillSwitchParams& params);

  KillSwitchVerdict evaluate(const PerformanceMetrics& metrics,
                             int consecutive_failures) const;

  const KillSwitchParams& params() const { return params_; }

 private:
  const KillSwitchParams params_;
};

}  // namespace predict
