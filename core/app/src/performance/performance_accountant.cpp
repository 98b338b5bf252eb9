#include "predict/performance/performance_accountant.hpp"

#include "predict/time/time_utils.hpp"

#include <algorithm>
#include <cmath>

namespace predict {

namespace {
constexpr double kMinStdev = 1e-12;
}  // namespace

const char* toString(EquitySeries s) {
  switch (s) {
    case EquitySeries::Bankroll: return "bankroll";
    case EquitySeries::Equity:   return "equity";
  }
  return "bankroll";
}

PerformanceMetrics PerformanceAccountant::compute(
    const std::vector<domain::Bet>& bets,
    const std::vector<domain::Settlement>& settlements,
    const std::vector<domain::EquitySample>& equity_curve,
    const MetricsOptions& options) {
  PerformanceMetrics m;

  m.num_bets = static_cast<int>(bets.size());
  for (const auto& bet : bets) {
    m.total_staked += bet.stake_amount;
  }

  double edge_sum = 0.0;
  double resolved_stake = 0.0;
  for (const auto& s : settlements) {
    ++m.num_resolved;
    if (s.won) {
      ++m.wins;
    } else {
      ++m.losses;
    }
    edge_sum += s.edge_at_entry;
    resolved_stake += s.stake;
    m.total_realized_pnl += s.pnl;
  }
  if (m.num_resolved > 0) {
    m.win_rate = static_cast<double>(m.wins) / m.num_resolved;
    m.avg_edge = edge_sum / m.num_resolved;
  }
  if (resolved_stake > 0.0) {
    m.roi = m.total_realized_pnl / resolved_stake;
  }

  const std::vector<double> series = equityValues(equity_curve, options.series);
  if (!series.empty()) {
    m.start_equity = series.front();
    m.end_equity = series.back();
  }
  m.sharpe_ratio = sharpeRatio(dailyReturns(series), options.periods_per_year);
  m.max_drawdown = maxDrawdown(series);
  m.current_drawdown = currentDrawdown(series);
  m.equity_drawdown =
      options.series == EquitySeries::Equity
          ? m.current_drawdown
          : currentDrawdown(equityValues(equity_curve, EquitySeries::Equity));
  return m;
}

std::vector<double> PerformanceAccountant::equityValues(
    const std::vector<domain::EquitySample>& equity_curve,
    EquitySeries series) {
  std::vector<double> out;
  out.reserve(equity_curve.size());
  for (const auto& sample : equity_curve) {
    out.push_back(series == EquitySeries::Equity ? sample.equity
                                                 : sample.bankroll);
  }
  return out;
}

std::vector<double> PerformanceAccountant::dailyReturns(
    const std::vector<double>& equity) {
  std::vector<double> out;
  for (std::size_t i = 1; i < equity.size(); ++i) {
    const double prev = equity[i - 1];
    if (prev > 0.0) {
      out.push_back((equity[i] - prev) / prev);
    }
  }
  return out;
}

double PerformanceAccountant::sharpeRatio(const std::vector<double>& returns,
                                          double periods_per_year) {
  if (returns.size() < 2) {
    return 0.0;
  }
  const double n = static_cast<double>(returns.size());
  double mean = 0.0;
  for (double r : returns) {
    mean += r;
  }
  mean /= n;

  double var = 0.0;
  for (double r : returns) {
    var += (r - mean) * (r - mean);
  }
  var /= n;
  const double stdev = std::sqrt(var);
  if (!(stdev > kMinStdev)) {
    return 0.0;
  }
  return mean / stdev * std::sqrt(std::max(periods_per_year, 0.0));
}

double PerformanceAccountant::periodsPerYear(std::int64_t sample_interval_ms) {
  if (sample_interval_ms <= 0) {
    return kPeriodsPerYear;
  }
  return kPeriodsPerYear * static_cast<double>(time_utils::kMsPerDay) /
         static_cast<double>(sample_interval_ms);
}

double PerformanceAccountant::maxDrawdown(const std::vector<double>& equity) {
  if (equity.size() < 2) {
    return 0.0;
  }
  double peak = equity.front();
  double worst = 0.0;
  for (double value : equity) {
    peak = std::max(peak, value);
    if (peak <= 0.0) {
      continue;
    }
    worst = std::max(worst, (peak - value) / peak);
  }
  return worst;
}

double PerformanceAccountant::currentDrawdown(
    const std::vector<double>& equity) {
  if (equity.size() < 2) {
    return 0.0;
  }
  const double peak = *std::max_element(equity.begin(), equity.end());
  if (peak <= 0.0) {
    return 0.0;
  }
  return std::max(0.0, (peak - equity.back()) / peak);
}

}  // namespace predict
