#pragma once

#include "predict/concurrent/bet_id_generator.hpp"
#include "predict/domain/bet.hpp"
#include "predict/domain/market.hpp"
#include "predict/domain/signal.hpp"
#include "predict/edge/edge_evaluator.hpp"
#include "predict/eventbus/event_bus.hpp"
#include "predict/execution/i_execution_engine.hpp"
#include "predict/io/persistence_sink.hpp"
#include "predict/risk/risk_manager.hpp"
#include "predict/sizing/kelly_sizer.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace predict {

// One RawSignal after the Thinking phase: the screened evaluation at zero
// stake and the quote it was screened against (absent when the market was
// not in the snapshot).
struct Candidate {
  domain::RawSignal raw;
  std::optional<domain::MarketQuote> quote;
  EdgeEvaluation screened;
};

// Where a candidate left the pipeline. Also the "stage" of its SignalRecord.
namespace stage {
inline constexpr const char* kEdge = "EDGE";
inline constexpr const char* kSizing = "SIZING";
inline constexpr const char* kRisk = "RISK";
inline constexpr const char* kExecution = "EXECUTION";
inline constexpr const char* kPlaced = "PLACED";
}  // namespace stage

struct PipelineOutcome {
  bool placed{false};
  std::string stage;
  std::string reason;
  std::string detail;
  domain::Signal signal;
  double stake{0.0};
  std::optional<domain::Bet> bet;
};

// -----------------------------------------------------------------------------
// TradingPipeline — Evaluate -> Size -> Gate -> Execute
// -----------------------------------------------------------------------------
//
// @brief  The single decision path from a screened candidate to a committed
//         Bet. AgentLoop runs it in every mode; backtest, paper and live
//         differ only in the sources and clock around it.
//
// @details
// act() steps, each of which may end the candidate:
//
//   1. EDGE       the zero-stake screen must have passed.
//   2. SIZING     KellySizer on the screened Signal. A zero stake stops
//                 here ("ZERO_STAKE").
//   3. EDGE       re-evaluate at the sized stake, so slippage is priced in;
//                 the Signal may now fall below min_edge. The stake is then
//                 re-sized on the slipped price and the smaller of the two
//                 sizings is used.
//   4. RISK       RiskManager::check() on the final Signal and stake.
//   5. EXECUTION  IExecutionEngine::validate() on the constructed Bet.
//                 ExecutionError subclasses become per-signal rejections.
//   6. journal    IPersistenceSink::appendBet() (write-ahead). A
//                 PersistenceError propagates and nothing is placed.
//   7. PLACED     IExecutionEngine::placeBet().
//
// Every candidate, placed or not, is journaled once as a SignalRecord and
// published as a SignalEvaluatedEvent. Risk rejections also publish a
// RiskRejectEvent.
//
// Thread model:
//   Runs on the tick thread inside the Acting phase only. Holds references
//   to components owned elsewhere; all of them must outlive it.
// -----------------------------------------------------------------------------
class TradingPipeline {
 public:
  TradingPipeline(const EdgeEvaluator& evaluator, const KellySizer& sizer,
                  const RiskManager& risk, IExecutionEngine& engine,
                  IPersistenceSink& sink, BetIdGenerator& ids,
                  domain::TradingMode mode, EventBus* bus = nullptr);

  TradingPipeline(const TradingPipeline&) = delete;
  TradingPipeline& operator=(const TradingPipeline&) = delete;

  // Thinking-phase screen at zero stake. Pure.
  Candidate screen(const domain::RawSignal& raw,
                   const domain::MarketQuote* quote,
                   std::int64_t now_ms) const;

  // Acting-phase decision for one candidate. Throws only PersistenceError
  // (journal unusable); every other outcome is returned.
  PipelineOutcome act(const Candidate& candidate, std::int64_t now_ms);

 private:
  PipelineOutcome finish(PipelineOutcome outcome, std::int64_t now_ms);

  const EdgeEvaluator& evaluator_;
  const KellySizer& sizer_;
  const RiskManager& risk_;
  IExecutionEngine& engine_;
  IPersistenceSink& sink_;
  BetIdGenerator& ids_;
  const domain::TradingMode mode_;
  EventBus* bus_;
};

}  // namespace predict
