#pragma once

#include "predict/eventbus/event_bus.hpp"
#include "predict/execution/i_execution_engine.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// ExecutionSimulator — paper / backtest execution engine
// -----------------------------------------------------------------------------
//
// @brief  Fills every valid Bet in full at its execution price and settles
//         Positions when their market resolves.
//
// @details
// Per-market state machine:
//
//   NoPosition --placeBet--> Open --placeBet (same direction)--> Open
//                             |
//                             +--resolve--> Resolved (terminal)
//
// placeBet from NoPosition:
//   shares = stake / price, avg_price = price, cost_basis = stake.
// placeBet from Open (same direction):
//   shares += stake / price, cost_basis += stake,
//   avg_price = cost_basis / shares (size-weighted average).
// placeBet from Open (opposite direction) -> PositionConflictError.
// placeBet into a Resolved market          -> MarketResolvedError.
// stake > bankroll                         -> InsufficientBankrollError.
// stake <= 0, price outside (0, 1), empty
// market id, duplicate bet id              -> InvalidBetError.
//
// resolve from Open:
//   winner: payout = shares * $1, pnl = payout - cost_basis
//   loser:  payout = 0,           pnl = -cost_basis
//   bankroll += payout, daily_pnl += pnl, one Settlement per Bet in that
//   market, Position moves to the resolved set.
// resolve from Resolved   -> AlreadyResolved, nothing changes.
// resolve from NoPosition -> UnknownMarket, nothing changes.
//
// Event publication (optional bus): BetPlacedEvent and PositionUpdateEvent
// after a committed placeBet, PositionUpdateEvent and ResolutionEvent after
// a committed resolve. Events are suppressed while restore() replays the
// journal.
//
// Thread model:
//   Not internally synchronized. Mutated on the tick thread only; other
//   threads read AgentLoop's status snapshot instead.
// -----------------------------------------------------------------------------
class ExecutionSimulator final : public IExecutionEngine {
 public:
  explicit ExecutionSimulator(double initial_bankroll, EventBus* bus = nullptr);

  ExecutionSimulator(const ExecutionSimulator&) = delete;
  ExecutionSimulator& operator=(const ExecutionSimulator&) = delete;

  void validate(const domain::Bet& bet) const override;
  const domain::Position& placeBet(const domain::Bet& bet) override;
  domain::ResolveResult resolve(const domain::Resolution& resolution) override;
  void rollDay(const std::string& day_key) override;
  domain::EquitySample equitySample(std::int64_t timestamp_ms) const override;
  const domain::EquitySample& recordEquitySample(
      const domain::EquitySample& sample) override;

  const domain::Position* position(const std::string& market_id) const override;
  std::vector<domain::Position> openPositions() const override;
  std::vector<std::string> openMarketIds() const override;
  bool isResolved(const std::string& market_id) const override;

  const domain::RiskState& riskState() const override { return state_; }
  double equity() const override;

  const std::vector<domain::Bet>& bets() const override { return bets_; }
  const std::vector<domain::Settlement>& settlements() const override {
    return settlements_;
  }
  const std::vector<domain::EquitySample>& equityCurve() const override {
    return equity_curve_;
  }

  // Resolved position for market_id, or nullptr.
  const domain::Position* resolvedPosition(const std::string& market_id) const;

  double initialBankroll() const { return initial_bankroll_; }

  // -------------------------------------------------------------------------
  // restore(bets, resolutions, equity_curve)
  // -------------------------------------------------------------------------
  // @brief  Warm start from the journal.
  //
  // @details
  // Replays Bets and Resolutions merged by timestamp (a Bet sorts before a
  // Resolution with the same timestamp), rolling the trading day as the
  // replay crosses UTC midnight, so bankroll, Positions, daily P&L and the
  // settlement ledger come out exactly as they were when the records were
  // written. The saved equity samples are appended verbatim.
  //
  // Must be called on a freshly constructed simulator. A journaled Bet the
  // simulator refuses means the journal and the configured bankroll
  // disagree: throws PersistenceError.
  // -------------------------------------------------------------------------
  void restore(const std::vector<domain::Bet>& bets,
               const std::vector<domain::Resolution>& resolutions,
               const std::vector<domain::EquitySample>& equity_curve = {});

 private:
  void publish(const Event& event);
  void recomputeOpenBook();

  const double initial_bankroll_;
  EventBus* bus_;
  bool replaying_{false};

  domain::RiskState state_;
  std::map<std::string, domain::Position> open_;
  std::map<std::string, domain::Position> resolved_;
  std::set<domain::BetId> bet_ids_;

  std::vector<domain::Bet> bets_;
  std::vector<domain::Settlement> settlements_;
  std::vector<domain::EquitySample> equity_curve_;
};

}  // namespace predict
