#include "predict/risk/risk_manager.hpp"

#include <iostream>
#include <sstream>

namespace predict {

namespace {
// Absorbs floating-point noise when a Kelly stake sits exactly on a cap.
constexpr double kTolerance = 1e-9;
}  // namespace

const char* toString(RiskCheck c) {
  switch (c) {
    case RiskCheck::Passed:         return "PASSED";
    case RiskCheck::TradingHalted:  return "TRADING_HALTED";
    case RiskCheck::MinEdge:        return "MIN_EDGE";
    case RiskCheck::MaxConcurrent:  return "MAX_CONCURRENT";
    case RiskCheck::DailyLoss:      return "DAILY_LOSS";
    case RiskCheck::MarketVolume:   return "MARKET_VOLUME";
    case RiskCheck::MarketExposure: return "MARKET_EXPOSURE";
  }
  return "UNKNOWN";
}

RiskManager::RiskManager(const domain::RiskLimits& limits) : limits_(limits) {}

// -----------------------------------------------------------------------------
// check(): ordered gate, first failure wins
// -----------------------------------------------------------------------------
RiskDecision RiskManager::check(const domain::Signal& signal, double stake,
                                const domain::RiskState& state,
                                const MarketExposure& market) const {
  if (halted_.load()) {
    return RiskDecision::reject(RiskCheck::TradingHalted, haltReason());
  }

  RiskDecision d = checkMinEdge(signal.edge, limits_.min_edge);
  if (!d.accepted) {
    return d;
  }
  d = checkMaxConcurrent(state.open_position_count, market.has_open_position,
                         limits_.max_concurrent_positions);
  if (!d.accepted) {
    return d;
  }
  d = checkDailyLoss(state.daily_pnl, state.start_of_day_bankroll,
                     limits_.max_daily_loss_pct);
  if (!d.accepted) {
    return d;
  }
  d = checkMarketVolume(stake, market.volume_24h, limits_.max_volume_pct);
  if (!d.accepted) {
    return d;
  }
  return checkMarketExposure(market.open_cost_basis, stake, state.bankroll,
                             limits_.max_bet_pct);
}

RiskDecision RiskManager::checkMinEdge(double edge, double min_edge) {
  if (edge < min_edge) {
    std::ostringstream os;
    os << "edge " << edge << " < min_edge " << min_edge;
    return RiskDecision::reject(RiskCheck::MinEdge, os.str());
  }
  return RiskDecision::pass();
}

RiskDecision RiskManager::checkMaxConcurrent(int open_positions,
                                             bool has_open_position,
                                             int max_concurrent) {
  const int projected = open_positions + (has_open_position ? 0 : 1);
  if (projected > max_concurrent) {
    std::ostringstream os;
    os << "projected open positions " << projected << " > "
       << max_concurrent;
    return RiskDecision::reject(RiskCheck::MaxConcurrent, os.str());
  }
  return RiskDecision::pass();
}

RiskDecision RiskManager::checkDailyLoss(double daily_pnl,
                                         double start_of_day_bankroll,
                                         double max_daily_loss_pct) {
  const double floor = -max_daily_loss_pct * start_of_day_bankroll;
  if (daily_pnl < floor) {
    std::ostringstream os;
    os << "daily pnl " << daily_pnl << " below floor " << floor;
    return RiskDecision::reject(RiskCheck::DailyLoss, os.str());
  }
  return RiskDecision::pass();
}

RiskDecision RiskManager::checkMarketVolume(double stake, double volume_24h,
                                            double max_volume_pct) {
  if (!(volume_24h > 0.0)) {
    return RiskDecision::reject(RiskCheck::MarketVolume,
                                "no 24h volume reported");
  }
  const double cap = max_volume_pct * volume_24h;
  if (stake > cap + kTolerance) {
    std::ostringstream os;
    os << "stake " << stake << " > " << cap << " (" << max_volume_pct
       << " of 24h volume " << volume_24h << ")";
    return RiskDecision::reject(RiskCheck::MarketVolume, os.str());
  }
  return RiskDecision::pass();
}

RiskDecision RiskManager::checkMarketExposure(double open_cost_basis,
                                              double stake, double bankroll,
                                              double max_bet_pct) {
  const double cap = max_bet_pct * bankroll;
  const double combined = open_cost_basis + stake;
  if (combined > cap + kTolerance) {
    std::ostringstream os;
    os << "market exposure " << combined << " > " << cap;
    return RiskDecision::reject(RiskCheck::MarketExposure, os.str());
  }
  return RiskDecision::pass();
}

void RiskManager::haltTrading(const std::string& reason) {
  {
    std::lock_guard lock(reason_mutex_);
    halt_reason_ = reason;
  }
  halted_.store(true);
  std::cerr << "[RiskManager] CRITICAL: new bets halted (" << reason << ")\n";
}

void RiskManager::resumeTrading() {
  {
    std::lock_guard lock(reason_mutex_);
    halt_reason_.clear();
  }
  halted_.store(false);
  std::cout << "[RiskManager] trading resumed\n";
}

bool RiskManager::isHalted() const { return halted_.load(); }

std::string RiskManager::haltReason() const {
  std::lock_guard lock(reason_mutex_);
  return halt_reason_;
}

}  // namespace predict
