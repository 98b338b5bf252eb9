#pragma once

#include "predict/domain/bet.hpp"
#include "predict/domain/equity_sample.hpp"
#include "predict/domain/resolution.hpp"
#include "predict/domain/signal.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// SignalRecord — journal entry for one pipeline decision
// -----------------------------------------------------------------------------
//   stage   "EDGE", "SIZING", "RISK", "EXECUTION" or "PLACED".
//   reason  rejection code of that stage ("BELOW_MIN_EDGE", "DAILY_LOSS",
//           ...), or "ACCEPTED".
// bet_id is non-zero only for PLACED.
// -----------------------------------------------------------------------------
struct SignalRecord {
  domain::Signal signal;
  bool accepted{false};
  std::string stage;
  std::string reason;
  std::string detail;
  double stake{0.0};
  domain::BetId bet_id{0};
};

// -----------------------------------------------------------------------------
// IPersistenceSink — append-only, date-keyed record of decisions
// -----------------------------------------------------------------------------
//
// @brief  Durable audit trail and warm-start source.
//
// @details
// Every append* either persists the record or throws PersistenceError.
// AgentLoop appends a Bet before ExecutionSimulator commits it
// (write-ahead), so after a crash the journal may hold a Bet the simulator
// never applied but never the reverse; restore() then replays it.
//
// Read-back returns records in append order, oldest day first.
// -----------------------------------------------------------------------------
class IPersistenceSink {
 public:
  virtual ~IPersistenceSink() = default;

  virtual void appendSignal(const SignalRecord& record) = 0;
  virtual void appendBet(const domain::Bet& bet) = 0;
  virtual void appendResolution(const domain::Resolution& resolution) = 0;
  virtual void appendEquitySample(const domain::EquitySample& sample) = 0;

  virtual std::vector<SignalRecord> loadSignals() const = 0;
  virtual std::vector<domain::Bet> loadBets() const = 0;
  virtual std::vector<domain::Resolution> loadResolutions() const = 0;
  virtual std::vector<domain::EquitySample> loadEquitySamples() const = 0;
};

}  // namespace predict
