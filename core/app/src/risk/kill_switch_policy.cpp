#include "predict/risk/kill_switch_policy.hpp"

namespace predict {

KillSwitchPolicy::KillSwitchPolicy(const KillSwitchParams& params)
    : params_(params) {}

KillSwitchVerdict KillSwitchPolicy::evaluate(const PerformanceMetrics& metrics,
                                             int consecutive_failures) const {
  KillSwitchVerdict v;
  if (!params_.enabled) {
    return v;
  }

  if (params_.max_drawdown_pct > 0.0 &&
      metrics.equity_drawdown >= params_.max_drawdown_pct) {
    v.trip = true;
    v.reason = "MAX_DRAWDOWN";
    v.current_value = metrics.equity_drawdown;
    v.limit_value = params_.max_drawdown_pct;
    return v;
  }

  if (params_.max_consecutive_failures > 0 &&
      consecutive_failures >= params_.max_consecutive_failures) {
    v.trip = true;
    v.reason = "CONSECUTIVE_FAILURES";
    v.current_value = consecutive_failures;
    v.limit_value = params_.max_consecutive_failures;
  }
  return v;
}

}  // namespace predict
