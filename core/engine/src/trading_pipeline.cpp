#include "predict/engine/trading_pipeline.hpp"

#include "predict/domain/errors.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace predict {

namespace {

// Journal reason code for an ExecutionError subclass. Most specific first;
// an engine that throws the plain base type still gets a code.
const char* executionReason(const ExecutionError& e) {
  if (dynamic_cast<const InsufficientBankrollError*>(&e)) {
    return "INSUFFICIENT_BANKROLL";
  }
  if (dynamic_cast<const PositionConflictError*>(&e)) {
    return "POSITION_CONFLICT";
  }
  if (dynamic_cast<const MarketResolvedError*>(&e)) {
    return "MARKET_RESOLVED";
  }
  if (dynamic_cast<const InvalidBetError*>(&e)) {
    return "INVALID_BET";
  }
  return "EXECUTION_REJECTED";
}

}  // namespace

TradingPipeline::TradingPipeline(const EdgeEvaluator& evaluator,
                                 const KellySizer& sizer,
                                 const RiskManager& risk,
                                 IExecutionEngine& engine,
                                 IPersistenceSink& sink, BetIdGenerator& ids,
                                 domain::TradingMode mode, EventBus* bus)
    : evaluator_(evaluator),
      sizer_(sizer),
      risk_(risk),
      engine_(engine),
      sink_(sink),
      ids_(ids),
      mode_(mode),
      bus_(bus) {}

// -----------------------------------------------------------------------------
// screen(): zero-stake edge evaluation, no side effects
// -----------------------------------------------------------------------------
Candidate TradingPipeline::screen(const domain::RawSignal& raw,
                                  const domain::MarketQuote* quote,
                                  std::int64_t now_ms) const {
  Candidate c;
  c.raw = raw;

  // Copied: a Candidate is a plain value and never points into the tick's
  // market snapshot.
  if (quote != nullptr) {
    c.quote = *quote;
  }

  // Stake 0 means no slippage. This is the price the signal saw; act()
  // re-prices at the sized stake.
  c.screened = evaluator_.evaluate(raw, quote, 0.0, now_ms);
  return c;
}

// -----------------------------------------------------------------------------
// act(): screen -> size -> re-price -> risk -> dry-run -> journal -> commit
// -----------------------------------------------------------------------------
PipelineOutcome TradingPipeline::act(const Candidate& candidate,
                                     std::int64_t now_ms) {
  PipelineOutcome out;
  out.signal = candidate.screened.signal;

  // ---  1) Screen ----------------------------------------------------------
  // A rejected screen may not have built a Signal at all (unknown market,
  // malformed input). Fill the identifying fields from the RawSignal so
  // the journal record still says what was rejected.
  if (!candidate.screened.accepted()) {
    out.stage = stage::kEdge;
    out.reason = toString(candidate.screened.rejection);
    out.detail = candidate.screened.detail;
    if (out.signal.market_id.empty()) {
      out.signal.market_id = candidate.raw.market_id;
      out.signal.direction = candidate.raw.direction;
      out.signal.headline = candidate.raw.headline;
      out.signal.strategy = candidate.raw.strategy;
      out.signal.timestamp_ms = now_ms;
    }
    return finish(std::move(out), now_ms);
  }

  // Read once: bets placed earlier in this tick have already reduced it.
  const double bankroll = engine_.riskState().bankroll;

  // ---  2) Size on the screened price ---------------------------------------
  const StakeSizing first = sizer_.size(candidate.screened.signal, bankroll);
  if (first.stake_amount <= 0.0) {
    out.stage = stage::kSizing;
    out.reason = "ZERO_STAKE";
    std::ostringstream os;
    os << "raw kelly " << first.raw_kelly << " with bankroll " << bankroll;
    out.detail = os.str();
    return finish(std::move(out), now_ms);
  }

  // ---  3) Re-price with slippage at that stake, then re-size ----------------
  // Slippage grows with stake, so the first size overstates the edge. The
  // re-sized stake is kept only if it is smaller; one pass, no iteration.
  const EdgeEvaluation priced = evaluator_.evaluate(
      candidate.raw, candidate.quote ? &*candidate.quote : nullptr,
      first.stake_amount, now_ms);
  out.signal = priced.signal;
  if (!priced.accepted()) {
    out.stage = stage::kEdge;
    out.reason = toString(priced.rejection);
    out.detail = priced.detail + " (after slippage at stake " +
                 std::to_string(first.stake_amount) + ")";
    return finish(std::move(out), now_ms);
  }
  const StakeSizing second = sizer_.size(priced.signal, bankroll);
  const StakeSizing& sizing =
      second.stake_amount < first.stake_amount ? second : first;
  out.stake = sizing.stake_amount;
  if (out.stake <= 0.0) {
    out.stage = stage::kSizing;
    out.reason = "ZERO_STAKE";
    out.detail = "no kelly stake after slippage";
    return finish(std::move(out), now_ms);
  }

  // ---  4) Portfolio gate ----------------------------------------------------
  // RiskManager sees the engine's live RiskState plus what this market
  // already holds, so per-market and portfolio limits use the same numbers.
  MarketExposure exposure;
  exposure.volume_24h = candidate.quote ? candidate.quote->volume_24h : 0.0;
  if (const domain::Position* pos = engine_.position(out.signal.market_id)) {
    exposure.has_open_position = true;
    exposure.open_cost_basis = pos->cost_basis;
  }
  const RiskDecision decision =
      risk_.check(out.signal, out.stake, engine_.riskState(), exposure);
  if (!decision.accepted) {
    out.stage = stage::kRisk;
    out.reason = toString(decision.reason);
    out.detail = decision.detail;
    if (bus_ != nullptr) {
      bus_->publish(RiskRejectEvent{out.signal.market_id, out.reason,
                                    out.detail, now_ms});
    }
    return finish(std::move(out), now_ms);
  }

  // ---  5) Build and dry-run the Bet -----------------------------------------
  // validate() runs every check placeBet() would, without mutating. An
  // ExecutionError here is an ordinary rejection: journaled, tick goes on.
  domain::Bet bet;
  bet.id = ids_.next_id();
  bet.signal = out.signal;
  bet.stake_amount = out.stake;
  bet.kelly_fraction_applied = sizing.stake_fraction;
  bet.mode = mode_;
  bet.execution_price = out.signal.effective_price;
  bet.placed_at_ms = now_ms;

  try {
    engine_.validate(bet);
  } catch (const ExecutionError& e) {
    out.stage = stage::kExecution;
    out.reason = executionReason(e);
    out.detail = e.what();
    return finish(std::move(out), now_ms);
  }

  // ---  6) Write-ahead, 7) commit ---------------------------------------------
  // The journal sees the Bet before the engine does. A PersistenceError
  // from appendBet() propagates out of act() with nothing committed, and
  // AgentLoop fails the tick.
  sink_.appendBet(bet);
  engine_.placeBet(bet);

  out.placed = true;
  out.stage = stage::kPlaced;
  out.reason = "PLACED";
  out.bet = bet;

  std::cout << "[TradingPipeline] bet " << bet.id << " "
            << domain::toString(bet.direction()) << " " << bet.marketId()
            << " stake=" << bet.stake_amount
            << " price=" << bet.execution_price
            << " edge=" << bet.signal.edge << "\n";
  return finish(std::move(out), now_ms);
}

// -----------------------------------------------------------------------------
// finish(): one SignalRecord and one SignalEvaluatedEvent per outcome
// -----------------------------------------------------------------------------
PipelineOutcome TradingPipeline::finish(PipelineOutcome outcome,
                                        std::int64_t now_ms) {
  // Every decision is journaled, placed or not, with the stage that made it.
  SignalRecord record;
  record.signal = outcome.signal;
  record.accepted = outcome.placed;
  record.stage = outcome.stage;
  record.reason = outcome.reason;
  record.detail = outcome.detail;
  record.stake = outcome.stake;
  record.bet_id = outcome.bet ? outcome.bet->id : 0;
  sink_.appendSignal(record);

  if (!outcome.placed) {
    std::cout << "[TradingPipeline] rejected " << outcome.signal.market_id
              << " at " << outcome.stage << ": " << outcome.reason;
    if (!outcome.detail.empty()) {
      std::cout << " (" << outcome.detail << ")";
    }
    std::cout << "\n";
  }

  if (bus_ != nullptr) {
    bus_->publish(SignalEvaluatedEvent{outcome.signal, outcome.placed,
                                       outcome.reason, outcome.stake, now_ms});
  }
  return outcome;
}

}  // namespace predict
