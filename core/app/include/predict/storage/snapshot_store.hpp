#pragma once

#include "predict/domain/market.hpp"
#include "predict/domain/resolution.hpp"
#include "predict/domain/signal.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// SnapshotStore — date-keyed historical data for backtests
// -----------------------------------------------------------------------------
//
// @brief  Reads and writes the historical snapshot tree:
//
//   <dir>/news/YYYY-MM-DD.json         {"date": ..., "articles": [...]}
//   <dir>/markets/YYYY-MM-DD.json      {"date": ..., "markets": [...]}
//   <dir>/resolutions/YYYY-MM-DD.json  {"date": ..., "resolutions": [...]}
//   <dir>/signals/YYYY-MM-DD.json      {"date": ..., "signals": [...]}
//
// @details
// A paper run records what it saw each day; a backtest replays it. Signals
// hold the extractor's recorded answers (RawSignal plus the headline that
// produced it) so a replay needs no LLM.
//
// Recording:
//   recordNews         appends articles not already in the day file
//                      (key: url + headline). Returns how many were added.
//   recordMarkets      first snapshot of the day wins; later calls that
//                      day return false and leave the file alone.
//   recordResolutions  appends, de-duplicated by (market_id, outcome).
//   recordSignals      appends, de-duplicated by (headline, market_id,
//                      direction).
// Files are written to a temporary name and renamed into place.
//
// Loading a day with no file returns an empty list. A file that is not
// valid JSON, or lacks its list, throws PersistenceError. Individual
// entries that cannot be parsed are skipped with a warning.
// -----------------------------------------------------------------------------
class SnapshotStore {
 public:
  explicit SnapshotStore(std::filesystem::path dir);

  int recordNews(const std::string& day_key,
                 const std::vector<domain::Article>& articles) const;
  bool recordMarkets(const std::string& day_key,
                     const std::vector<domain::MarketQuote>& markets) const;
  int recordResolutions(const std::string& day_key,
                        const std::vector<domain::Resolution>& resolutions) const;
  int recordSignals(const std::string& day_key,
                    const std::vector<domain::RawSignal>& signals) const;

  std::vector<domain::Article> loadNews(const std::string& day_key) const;

  // Quotes without a timestamp get updated_at_ms = midnight of day_key.
  std::vector<domain::MarketQuote> loadMarkets(const std::string& day_key) const;

  // Resolutions without a timestamp get resolved_at_ms = midnight of day_key.
  std::vector<domain::Resolution> loadResolutions(
      const std::string& day_key) const;

  std::vector<domain::RawSignal> loadSignals(const std::string& day_key) const;

  // Sorted day keys that have a file of the given kind ("news", ...).
  std::vector<std::string> availableDays(const std::string& kind) const;

  const std::filesystem::path& dir() const { return dir_; }

 private:
  std::filesystem::path pathFor(const char* kind,
                                const std::string& day_key) const;

  std::filesystem::path dir_;
};

}  // namespace predict
