#pragma once

#include "predict/io/market_data_source.hpp"
#include "predict/io/news_source.hpp"
#include "predict/io/signal_extractor.hpp"
#include "predict/storage/snapshot_store.hpp"
#include "predict/time/i_time_provider.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// Snapshot-backed sources
// -----------------------------------------------------------------------------
//
// @brief  INewsSource / IMarketDataSource / ISignalExtractor replaying a
//         SnapshotStore against the engine clock.
//
// @details
// "The current period" is [now, now + period_ms) where now is the injected
// clock (a SimulationTimeProvider in backtests). Each source serves the day
// files that overlap the current period:
//
//   SnapshotNewsSource        articles newer than the watermark and
//                             published before the period ends, each at
//                             most once.
//   SnapshotMarketDataSource  the day's market snapshot stamped as observed
//                             at `now`; resolutions dated inside the period
//                             for the requested markets, plus resolved
//                             markets in the snapshot itself.
//   RecordedSignalExtractor   the extractor answers recorded for an
//                             article's headline, restricted to the
//                             candidate markets.
//
// Missing day files mean "no data", never an error.
// -----------------------------------------------------------------------------

class SnapshotNewsSource final : public INewsSource {
 public:
  SnapshotNewsSource(const SnapshotStore& store, const ITimeProvider& clock,
                     std::int64_t period_ms);

  std::vector<domain::Article> fetchSince(
      std::int64_t watermark_ms, std::chrono::milliseconds timeout) override;

 private:
  const SnapshotStore& store_;
  const ITimeProvider& clock_;
  std::int64_t period_ms_;
  std::set<std::string> seen_;
};

class SnapshotMarketDataSource final : public IMarketDataSource {
 public:
  SnapshotMarketDataSource(const SnapshotStore& store,
                           const ITimeProvider& clock, std::int64_t period_ms);

  std::vector<domain::MarketQuote> fetchMarkets(
      std::chrono::milliseconds timeout) override;

  std::vector<domain::Resolution> fetchResolutions(
      const std::vector<std::string>& open_market_ids,
      std::chrono::milliseconds timeout) override;

 private:
  const SnapshotStore& store_;
  const ITimeProvider& clock_;
  std::int64_t period_ms_;
};

class RecordedSignalExtractor final : public ISignalExtractor {
 public:
  // Looks answers up in the store's signals/ file for the clock's day.
  RecordedSignalExtractor(const SnapshotStore& store,
                          const ITimeProvider& clock);

  // Fixed answer set, independent of the date.
  explicit RecordedSignalExtractor(std::vector<domain::RawSignal> recorded);

  std::vector<domain::RawSignal> extract(
      const domain::Article& article,
      const std::vector<domain::MarketQuote>& candidates) override;

 private:
  const std::vector<domain::RawSignal>& answersFor(const std::string& day_key);

  const SnapshotStore* store_{nullptr};
  const ITimeProvider* clock_{nullptr};
  std::vector<domain::RawSignal> fixed_;
  std::string cached_day_;
  std::vector<domain::RawSignal> cached_;
};

}  // namespace predict
