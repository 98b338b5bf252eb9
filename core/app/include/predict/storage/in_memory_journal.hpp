#pragma once

#include "predict/io/persistence_sink.hpp"

#include <mutex>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// InMemoryJournal
// -----------------------------------------------------------------------------
// IPersistenceSink kept in vectors. Used by backtests that do not ask for a
// journal directory and by tests. Guarded by a mutex so a reporting thread
// may read while a tick appends.
// -----------------------------------------------------------------------------
class InMemoryJournal final : public IPersistenceSink {
 public:
  void appendSignal(const SignalRecord& record) override;
  void appendBet(const domain::Bet& bet) override;
  void appendResolution(const domain::Resolution& resolution) override;
  void appendEquitySample(const domain::EquitySample& sample) override;

  std::vector<SignalRecord> loadSignals() const override;
  std::vector<domain::Bet> loadBets() const override;
  std::vector<domain::Resolution> loadResolutions() const override;
  std::vector<domain::EquitySample> loadEquitySamples() const override;

  void clear();

 private:
  mutable std::mutex mutex_;
  std::vector<SignalRecord> signals_;
  std::vector<domain::Bet> bets_;
  std::vector<domain::Resolution> resolutions_;
  std::vector<domain::EquitySample> equity_;
};

}  // namespace predict
