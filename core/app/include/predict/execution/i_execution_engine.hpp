#pragma once

#include "predict/domain/bet.hpp"
#include "predict/domain/equity_sample.hpp"
#include "predict/domain/position.hpp"
#include "predict/domain/resolution.hpp"
#include "predict/domain/risk_state.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// IExecutionEngine — where accepted Bets are applied
// -----------------------------------------------------------------------------
//
// @brief  Owner of bankroll, Positions and the Bet / Settlement / equity
//         ledgers. The only component allowed to mutate them.
//
// @details
// ExecutionSimulator implements it for backtest and paper trading. A live
// venue adapter would implement the same contract, filling at the venue
// and reporting back, so AgentLoop and TradingPipeline never change.
//
// Mutators (placeBet, resolve, rollDay, recordEquitySample) are called only
// from the tick thread during Acting / Tracking. Readers get const
// references valid until the next mutator call.
//
// Error contract:
//   validate(bet)  throws exactly what placeBet(bet) would throw, changes
//                  nothing. Lets the pipeline journal a Bet before
//                  committing it.
//   placeBet(bet)  all-or-nothing. Throws an ExecutionError subclass and
//                  leaves state untouched, or debits the stake, creates /
//                  merges the Position and appends the Bet.
//   resolve(r)     never throws for state conflicts; reports them through
//                  ResolveStatus.
// -----------------------------------------------------------------------------
class IExecutionEngine {
 public:
  virtual ~IExecutionEngine() = default;

  virtual void validate(const domain::Bet& bet) const = 0;
  virtual const domain::Position& placeBet(const domain::Bet& bet) = 0;
  virtual domain::ResolveResult resolve(const domain::Resolution& resolution) = 0;

  // Starts a new trading day: daily_pnl = 0, start_of_day_bankroll = equity.
  // No-op when day_key is already the current day.
  virtual void rollDay(const std::string& day_key) = 0;

  // The point the curve would get at timestamp_ms, without appending it.
  // AgentLoop journals it before recordEquitySample() commits it.
  virtual domain::EquitySample equitySample(std::int64_t timestamp_ms) const = 0;
  virtual const domain::EquitySample& recordEquitySample(
      const domain::EquitySample& sample) = 0;

  // Open position in market_id, or nullptr.
  virtual const domain::Position* position(const std::string& market_id) const = 0;
  virtual std::vector<domain::Position> openPositions() const = 0;
  virtual std::vector<std::string> openMarketIds() const = 0;
  virtual bool isResolved(const std::string& market_id) const = 0;

  virtual const domain::RiskState& riskState() const = 0;
  // Cash bankroll plus open cost basis.
  virtual double equity() const = 0;

  virtual const std::vector<domain::Bet>& bets() const = 0;
  virtual const std::vector<domain::Settlement>& settlements() const = 0;
  virtual const std::vector<domain::EquitySample>& equityCurve() const = 0;
};

}  // namespace predict
