#pragma once

// =============================================================================
// test_fakes.hpp
// =============================================================================
// Shared builders and in-memory collaborators for the test suites:
//   - makeQuote / makeRaw / makeSignal / makeBet: domain records with sane
//     defaults so each test states only what it cares about
//   - FakeNewsSource / FakeMarketDataSource: scripted sources that can be
//     told to throw TransientIoError a number of times
//   - FailingJournal: an in-memory journal whose appends can be told to
//     throw PersistenceError
//   - ScratchDir: a unique temporary directory removed on destruction
// =============================================================================

#include "predict/domain/bet.hpp"
#include "predict/domain/errors.hpp"
#include "predict/domain/market.hpp"
#include "predict/domain/resolution.hpp"
#include "predict/domain/signal.hpp"
#include "predict/io/market_data_source.hpp"
#include "predict/io/news_source.hpp"
#include "predict/io/persistence_sink.hpp"
#include "predict/storage/in_memory_journal.hpp"
#include "predict/time/time_utils.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <random>
#include <string>
#include <system_error>
#include <vector>

namespace predict_test {

using predict::domain::Direction;

// 2024-03-01T00:00:00Z
inline constexpr std::int64_t kDay0 = 1709251200000;

inline predict::domain::MarketQuote makeQuote(const std::string& id,
                                              double yes_price,
                                              double volume = 100000.0,
                                              std::int64_t updated_at_ms = kDay0) {
  predict::domain::MarketQuote q;
  q.market_id = id;
  q.question = "Will " + id + " happen?";
  q.yes_price = yes_price;
  q.no_price = 1.0 - yes_price;
  q.volume_24h = volume;
  q.book_depth = 0.0;
  q.updated_at_ms = updated_at_ms;
  return q;
}

inline predict::domain::RawSignal makeRaw(const std::string& market_id,
                                          Direction d, double p,
                                          double confidence = 8.0,
                                          const std::string& headline = "") {
  predict::domain::RawSignal r;
  r.market_id = market_id;
  r.direction = d;
  r.estimated_prob = p;
  r.confidence = confidence;
  r.reasoning = "test";
  r.headline = headline;
  r.strategy = "test";
  return r;
}

inline predict::domain::Signal makeSignal(const std::string& market_id,
                                          Direction d, double p, double price,
                                          double edge) {
  predict::domain::Signal s;
  s.timestamp_ms = kDay0;
  s.market_id = market_id;
  s.question = "Will " + market_id + " happen?";
  s.direction = d;
  s.quoted_price = price;
  s.effective_price = price;
  s.estimated_prob = p;
  s.edge = edge;
  s.confidence = 8.0;
  s.strategy = "test";
  return s;
}

inline predict::domain::Bet makeBet(predict::domain::BetId id,
                                    const std::string& market_id, Direction d,
                                    double stake, double price,
                                    std::int64_t placed_at_ms = kDay0) {
  predict::domain::Bet b;
  b.id = id;
  b.signal = makeSignal(market_id, d, 0.7, price, 0.1);
  b.stake_amount = stake;
  b.kelly_fraction_applied = 0.05;
  b.mode = predict::domain::TradingMode::Backtest;
  b.execution_price = price;
  b.placed_at_ms = placed_at_ms;
  return b;
}

inline predict::domain::Article makeArticle(const std::string& headline,
                                            std::int64_t published_at_ms,
                                            const std::string& url = "") {
  predict::domain::Article a;
  a.headline = headline;
  a.summary = headline;
  a.source = "wire";
  a.url = url.empty() ? "https://news.example/" + std::to_string(published_at_ms)
                      : url;
  a.published_at_ms = published_at_ms;
  a.category = "politics";
  return a;
}

// -----------------------------------------------------------------------------
// FakeNewsSource: returns the scripted articles newer than the watermark.
// -----------------------------------------------------------------------------
class FakeNewsSource : public predict::INewsSource {
 public:
  std::vector<predict::domain::Article> articles;
  int fail_next{0};
  int calls{0};
  std::int64_t last_watermark{-1};

  std::vector<predict::domain::Article> fetchSince(
      std::int64_t watermark_ms, std::chrono::milliseconds) override {
    ++calls;
    last_watermark = watermark_ms;
    if (fail_next > 0) {
      --fail_next;
      throw predict::TransientIoError("news feed timeout");
    }
    std::vector<predict::domain::Article> out;
    for (const auto& a : articles) {
      if (a.published_at_ms > watermark_ms) {
        out.push_back(a);
      }
    }
    return out;
  }
};

// -----------------------------------------------------------------------------
// FakeMarketDataSource: fixed quotes plus resolutions keyed by market id.
// -----------------------------------------------------------------------------
class FakeMarketDataSource : public predict::IMarketDataSource {
 public:
  std::vector<predict::domain::MarketQuote> quotes;
  std::map<std::string, predict::domain::Resolution> resolutions;
  int fail_markets_next{0};
  int fail_resolutions_next{0};
  int market_calls{0};

  std::vector<predict::domain::MarketQuote> fetchMarkets(
      std::chrono::milliseconds) override {
    ++market_calls;
    if (fail_markets_next > 0) {
      --fail_markets_next;
      throw predict::TransientIoError("market api timeout");
    }
    return quotes;
  }

  std::vector<predict::domain::Resolution> fetchResolutions(
      const std::vector<std::string>& open_market_ids,
      std::chrono::milliseconds) override {
    if (fail_resolutions_next > 0) {
      --fail_resolutions_next;
      throw predict::TransientIoError("resolution api timeout");
    }
    std::vector<predict::domain::Resolution> out;
    for (const auto& id : open_market_ids) {
      auto it = resolutions.find(id);
      if (it != resolutions.end()) {
        out.push_back(it->second);
      }
    }
    return out;
  }
};

// -----------------------------------------------------------------------------
// FailingJournal: InMemoryJournal whose next N bet / resolution / equity
// appends throw PersistenceError and store nothing.
// -----------------------------------------------------------------------------
class FailingJournal : public predict::IPersistenceSink {
 public:
  int fail_bets_next{0};
  int fail_resolutions_next{0};
  int fail_equity_next{0};

  void appendSignal(const predict::SignalRecord& record) override {
    inner_.appendSignal(record);
  }
  void appendBet(const predict::domain::Bet& bet) override {
    failIf(fail_bets_next, "bet");
    inner_.appendBet(bet);
  }
  void appendResolution(const predict::domain::Resolution& resolution) override {
    failIf(fail_resolutions_next, "resolution");
    inner_.appendResolution(resolution);
  }
  void appendEquitySample(const predict::domain::EquitySample& sample) override {
    failIf(fail_equity_next, "equity");
    inner_.appendEquitySample(sample);
  }

  std::vector<predict::SignalRecord> loadSignals() const override {
    return inner_.loadSignals();
  }
  std::vector<predict::domain::Bet> loadBets() const override {
    return inner_.loadBets();
  }
  std::vector<predict::domain::Resolution> loadResolutions() const override {
    return inner_.loadResolutions();
  }
  std::vector<predict::domain::EquitySample> loadEquitySamples() const override {
    return inner_.loadEquitySamples();
  }

 private:
  static void failIf(int& counter, const std::string& what) {
    if (counter > 0) {
      --counter;
      throw predict::PersistenceError("disk full writing " + what);
    }
  }

  predict::InMemoryJournal inner_;
};

// -----------------------------------------------------------------------------
// ScratchDir: unique directory under the system temp dir.
// -----------------------------------------------------------------------------
class ScratchDir {
 public:
  ScratchDir() {
    static std::atomic<int> counter{0};
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("predict_test_" + std::to_string(rd()) + "_" +
             std::to_string(counter.fetch_add(1)));
    std::filesystem::create_directories(path_);
  }
  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace predict_test
