#pragma once

#include "predict/domain/bet.hpp"
#include "predict/domain/position.hpp"
#include "predict/domain/resolution.hpp"
#include "predict/domain/signal.hpp"

#include <cstdint>
#include <string>

namespace predict {

// -----------------------------------------------------------------------------
// Event payloads
// -----------------------------------------------------------------------------
// Every payload is a plain value carrying its own snapshot, never a
// reference into component state, so it stays valid after publish() and can
// be copied onto the IPC telemetry queue.
//
// timestamp_ms is engine time (ITimeProvider), not wall-clock, so backtest
// telemetry carries simulated timestamps.
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// SignalEvaluatedEvent
// -----------------------------------------------------------------------------
// One per RawSignal that reached the pipeline. accepted == false carries the
// rejecting stage and reason ("EDGE:BELOW_MIN_EDGE", "RISK:DAILY_LOSS", ...).
// -----------------------------------------------------------------------------
struct SignalEvaluatedEvent {
  domain::Signal signal;
  bool accepted{false};
  std::string reason;
  double stake{0.0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// BetPlacedEvent
// -----------------------------------------------------------------------------
// Published by ExecutionSimulator after placeBet() has committed.
// -----------------------------------------------------------------------------
struct BetPlacedEvent {
  domain::Bet bet;
  double bankroll_after{0.0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
// Snapshot of a Position after a fill or a resolution.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::Position position;
  std::int64_t timestamp_ms{0};
};

struct ResolutionEvent {
  domain::Resolution resolution;
  domain::ResolveResult result;
  double bankroll_after{0.0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// RiskRejectEvent
// -----------------------------------------------------------------------------
// A RiskManager gate refused a signal. Expected control flow.
// -----------------------------------------------------------------------------
struct RiskRejectEvent {
  std::string market_id;
  std::string reason;
  std::string detail;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// RiskViolationEvent
// -----------------------------------------------------------------------------
//
// @brief  Published when the kill-switch policy trips (drawdown or
//         consecutive tick failures) and new bets are suspended.
//
// @details
//   reason         "MAX_DRAWDOWN" or "CONSECUTIVE_FAILURES".
//   current_value  the observed figure (drawdown fraction, failure count).
//   limit_value    the configured threshold it breached.
// -----------------------------------------------------------------------------
struct RiskViolationEvent {
  std::string reason;
  double current_value{0.0};
  double limit_value{0.0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// TickEvent
// -----------------------------------------------------------------------------
// Emitted once at the end of every AgentLoop tick, success or failure.
// -----------------------------------------------------------------------------
struct TickEvent {
  std::uint64_t tick_number{0};
  bool ok{true};
  std::string error;
  int bets_placed{0};
  int resolutions_applied{0};
  double bankroll{0.0};
  double equity{0.0};
  std::int64_t timestamp_ms{0};
};

}  // namespace predict
