#pragma once

#include "predict/io/persistence_sink.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// JsonlJournal — file-backed IPersistenceSink
// -----------------------------------------------------------------------------
//
// @brief  One JSON object per line, one file per record kind and UTC day:
//
//   <dir>/signals/YYYY-MM-DD.jsonl
//   <dir>/bets/YYYY-MM-DD.jsonl
//   <dir>/resolutions/YYYY-MM-DD.jsonl
//   <dir>/equity/YYYY-MM-DD.jsonl
//
// @details
// The day comes from the record's own timestamp (signal time, placed_at,
// resolved_at, sample time), not from the wall clock, so a backtest journal
// is laid out by simulated date.
//
// Every append opens, writes, flushes and closes. Throws PersistenceError
// if the directory cannot be created or the line cannot be written.
//
// Loading walks each kind's files in date order. A line that does not parse
// (typically the torn tail of a crash) is skipped with a warning.
// -----------------------------------------------------------------------------
class JsonlJournal final : public IPersistenceSink {
 public:
  explicit JsonlJournal(std::filesystem::path dir);

  void appendSignal(const SignalRecord& record) override;
  void appendBet(const domain::Bet& bet) override;
  void appendResolution(const domain::Resolution& resolution) override;
  void appendEquitySample(const domain::EquitySample& sample) override;

  std::vector<SignalRecord> loadSignals() const override;
  std::vector<domain::Bet> loadBets() const override;
  std::vector<domain::Resolution> loadResolutions() const override;
  std::vector<domain::EquitySample> loadEquitySamples() const override;

  const std::filesystem::path& dir() const { return dir_; }

  static constexpr const char* kSignals = "signals";
  static constexpr const char* kBets = "bets";
  static constexpr const char* kResolutions = "resolutions";
  static constexpr const char* kEquity = "equity";

 private:
  void appendLine(const char* kind, std::int64_t timestamp_ms,
                  const std::string& line);

  template <typename T>
  std::vector<T> loadAll(const char* kind) const;

  std::filesystem::path dir_;
};

}  // namespace predict
