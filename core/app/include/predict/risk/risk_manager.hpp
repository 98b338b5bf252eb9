#pragma once

#include "predict/domain/risk_limits.hpp"
#include "predict/domain/risk_state.hpp"
#include "predict/domain/signal.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace predict {

enum class RiskCheck {
  Passed,
  TradingHalted,
  MinEdge,
  MaxConcurrent,
  DailyLoss,
  MarketVolume,
  MarketExposure,
};

// "PASSED", "TRADING_HALTED", "MIN_EDGE", "MAX_CONCURRENT", "DAILY_LOSS",
// "MARKET_VOLUME", "MARKET_EXPOSURE"
const char* toString(RiskCheck c);

struct RiskDecision {
  bool accepted{true};
  RiskCheck reason{RiskCheck::Passed};
  std::string detail;

  static RiskDecision pass() { return RiskDecision{}; }
  static RiskDecision reject(RiskCheck why, std::string detail) {
    return RiskDecision{false, why, std::move(detail)};
  }
};

// -----------------------------------------------------------------------------
// MarketExposure — what the gate needs to know about the target market
// -----------------------------------------------------------------------------
//   volume_24h        from the quote the Signal was priced on.
//   open_cost_basis   cost basis of the engine's open Position there (0 if
//                     none).
//   has_open_position whether a Position is open there; a merge does not
//                     raise the open position count.
// -----------------------------------------------------------------------------
struct MarketExposure {
  double volume_24h{0.0};
  double open_cost_basis{0.0};
  bool has_open_position{false};
};

// -----------------------------------------------------------------------------
// RiskManager
// -----------------------------------------------------------------------------
//
// @brief  Ordered, short-circuiting portfolio gate between sizing and
//         execution.
//
// @details
// check() runs, in order, and returns the first failure:
//
//   0. TradingHalted   kill switch or operator HALT is active.
//   1. MinEdge         signal.edge < min_edge. Repeats the EdgeEvaluator
//                      threshold so a Signal built elsewhere cannot slip
//                      through.
//   2. MaxConcurrent   open count (+1 if this market has no Position yet)
//                      <= max_concurrent_positions.
//   3. DailyLoss       daily_pnl >= -max_daily_loss_pct *
//                      start_of_day_bankroll.
//   4. MarketVolume    volume_24h > 0 and stake <= max_volume_pct *
//                      volume_24h.
//   5. MarketExposure  open_cost_basis + stake <= max_bet_pct * bankroll.
//
// Each gate is also a static function over explicit arguments so it can be
// tested and reasoned about alone. Nothing here reads a clock or does I/O;
// the same inputs give the same decision in backtest, paper and live.
//
// Rejection is an ordinary result, not an exception.
//
// Thread model:
//   check() runs on the tick thread. haltTrading()/resumeTrading() may be
//   called from the IPC thread; the flag is atomic and the reason string
//   is guarded by a mutex.
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  explicit RiskManager(const domain::RiskLimits& limits);

  RiskManager(const RiskManager&) = delete;
  RiskManager& operator=(const RiskManager&) = delete;

  RiskDecision check(const domain::Signal& signal, double stake,
                     const domain::RiskState& state,
                     const MarketExposure& market) const;

  static RiskDecision checkMinEdge(double edge, double min_edge);
  static RiskDecision checkMaxConcurrent(int open_positions,
                                         bool has_open_position,
                                         int max_concurrent);
  static RiskDecision checkDailyLoss(double daily_pnl,
                                     double start_of_day_bankroll,
                                     double max_daily_loss_pct);
  static RiskDecision checkMarketVolume(double stake, double volume_24h,
                                        double max_volume_pct);
  static RiskDecision checkMarketExposure(double open_cost_basis, double stake,
                                          double bankroll, double max_bet_pct);

  // -------------------------------------------------------------------------
  // haltTrading(reason) / resumeTrading()
  // -------------------------------------------------------------------------
  // @brief  Suspends (or re-enables) new bets. Tracking of open positions
  //         is unaffected; only check() consults the flag.
  //
  // Thread-safety: safe from any thread.
  // -------------------------------------------------------------------------
  void haltTrading(const std::string& reason);
  void resumeTrading();
  bool isHalted() const;
  std::string haltReason() const;

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  const domain::RiskLimits limits_;
  std::atomic<bool> halted_{false};
  mutable std::mutex reason_mutex_;
  std::string halt_reason_;
};

}  // namespace predict
