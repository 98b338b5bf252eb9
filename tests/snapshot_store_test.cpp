// =============================================================================
// snapshot_store_test.cpp
// =============================================================================
// Tests for predict::SnapshotStore and the snapshot-backed sources that feed
// the backtest (SnapshotNewsSource, SnapshotMarketDataSource,
// RecordedSignalExtractor).
// =============================================================================

#include "predict/storage/snapshot_sources.hpp"
#include "predict/storage/snapshot_store.hpp"
#include "predict/time/simulation_time_provider.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <fstream>

using predict::SnapshotStore;
using predict_test::Direction;
using predict_test::kDay0;
using predict_test::makeArticle;
using predict_test::makeQuote;
using predict_test::ScratchDir;

namespace {
constexpr std::int64_t kHour = predict::time_utils::kMsPerHour;
constexpr std::int64_t kDay = predict::time_utils::kMsPerDay;
}  // namespace

// -----------------------------------------------------------------------------
// 1. News appends dedupe on (url, headline).
// -----------------------------------------------------------------------------
TEST(SnapshotStoreTest, RecordNewsDedupes) {
  ScratchDir dir;
  SnapshotStore store(dir.path());

  const auto a = makeArticle("Senate passes bill", kDay0 + kHour);
  const auto b = makeArticle("Fed holds rates", kDay0 + 2 * kHour);

  EXPECT_EQ(store.recordNews("2024-03-01", {a, b}), 2);
  EXPECT_EQ(store.recordNews("2024-03-01", {a}), 0);
  EXPECT_EQ(store.recordNews("2024-03-01", {}), 0);

  const auto loaded = store.loadNews("2024-03-01");
  ASSERT_EQ(loaded.size(), 2u);
  EXPECT_EQ(loaded[0].headline, "Senate passes bill");
  EXPECT_EQ(loaded[0].published_at_ms, kDay0 + kHour);
  EXPECT_TRUE(store.loadNews("2024-03-02").empty());
}

TEST(SnapshotStoreTest, MarketsAreWrittenOncePerDay) {
  ScratchDir dir;
  SnapshotStore store(dir.path());

  EXPECT_TRUE(store.recordMarkets("2024-03-01", {makeQuote("m1", 0.55)}));
  EXPECT_FALSE(store.recordMarkets("2024-03-01", {makeQuote("m1", 0.90)}));

  const auto markets = store.loadMarkets("2024-03-01");
  ASSERT_EQ(markets.size(), 1u);
  EXPECT_DOUBLE_EQ(markets[0].yes_price, 0.55);
  EXPECT_EQ(store.availableDays("markets"),
            std::vector<std::string>{"2024-03-01"});
}

TEST(SnapshotStoreTest, MalformedFileIsPersistenceError) {
  ScratchDir dir;
  std::filesystem::create_directories(dir.path() / "news");
  {
    std::ofstream out(dir.path() / "news" / "2024-03-01.json");
    out << "[1, 2, 3";
  }
  SnapshotStore store(dir.path());
  EXPECT_THROW(store.loadNews("2024-03-01"), predict::PersistenceError);
}

TEST(SnapshotStoreTest, ForeignMarketShapesAreNormalized) {
  ScratchDir dir;
  std::filesystem::create_directories(dir.path() / "markets");
  {
    std::ofstream out(dir.path() / "markets" / "2024-03-01.json");
    out << R"({"date": "2024-03-01", "markets": [
      {"id": 12, "question": "Q?", "outcomes": "[\"Yes\", \"No\"]",
       "outcomePrices": "[\"0.3\", \"0.7\"]", "volume24hr": "5000"},
      {"question": "no id"}
    ]})";
  }
  SnapshotStore store(dir.path());
  const auto markets = store.loadMarkets("2024-03-01");
  ASSERT_EQ(markets.size(), 1u);
  EXPECT_EQ(markets[0].market_id, "12");
  EXPECT_DOUBLE_EQ(markets[0].yes_price, 0.3);
  EXPECT_DOUBLE_EQ(markets[0].no_price, 0.7);
  EXPECT_DOUBLE_EQ(markets[0].volume_24h, 5000.0);
  EXPECT_EQ(markets[0].updated_at_ms, kDay0);
}

// -----------------------------------------------------------------------------
// 2. Snapshot sources replay one period of recorded data per tick.
// -----------------------------------------------------------------------------
TEST(SnapshotSourcesTest, NewsSourceHonoursWatermarkAndSeenSet) {
  ScratchDir dir;
  SnapshotStore store(dir.path());
  store.recordNews("2024-03-01", {makeArticle("early", kDay0 + kHour),
                                  makeArticle("late", kDay0 + 9 * kHour)});

  predict::SimulationTimeProvider clock(kDay0);
  predict::SnapshotNewsSource news(store, clock, kDay);

  auto first = news.fetchSince(kDay0 + 2 * kHour, std::chrono::milliseconds(0));
  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first[0].headline, "late");

  auto second = news.fetchSince(0, std::chrono::milliseconds(0));
  ASSERT_EQ(second.size(), 1u);
  EXPECT_EQ(second[0].headline, "early");

  EXPECT_TRUE(news.fetchSince(0, std::chrono::milliseconds(0)).empty());
}

TEST(SnapshotSourcesTest, NewsSourceServesOnlyArticlesPublishedInPeriod) {
  ScratchDir dir;
  SnapshotStore store(dir.path());
  store.recordNews("2024-03-01", {makeArticle("morning", kDay0 + kHour),
                                  makeArticle("evening", kDay0 + 20 * kHour)});

  predict::SimulationTimeProvider clock(kDay0);
  predict::SnapshotNewsSource news(store, clock, 6 * kHour);

  const auto first = news.fetchSince(0, std::chrono::milliseconds(0));
  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first[0].headline, "morning");

  clock.advance_time(kDay0 + 12 * kHour);
  EXPECT_TRUE(news.fetchSince(kDay0 + kHour, std::chrono::milliseconds(0)).empty());

  clock.advance_time(kDay0 + 18 * kHour);
  const auto evening = news.fetchSince(kDay0 + kHour, std::chrono::milliseconds(0));
  ASSERT_EQ(evening.size(), 1u);
  EXPECT_EQ(evening[0].headline, "evening");
}

TEST(SnapshotSourcesTest, MarketSourceStampsQuotesWithClock) {
  ScratchDir dir;
  SnapshotStore store(dir.path());
  store.recordMarkets("2024-03-01", {makeQuote("m1", 0.55, 1e5, 0)});

  predict::SimulationTimeProvider clock(kDay0 + 3 * kHour);
  predict::SnapshotMarketDataSource markets(store, clock, kDay);

  const auto quotes = markets.fetchMarkets(std::chrono::milliseconds(0));
  ASSERT_EQ(quotes.size(), 1u);
  EXPECT_EQ(quotes[0].updated_at_ms, kDay0 + 3 * kHour);
}

TEST(SnapshotSourcesTest, ResolutionsWithinPeriodForOpenMarketsOnly) {
  ScratchDir dir;
  SnapshotStore store(dir.path());
  store.recordResolutions(
      "2024-03-01",
      {predict::domain::Resolution{"m1", Direction::Yes, kDay0 + 5 * kHour},
       predict::domain::Resolution{"m2", Direction::No, kDay0 + 6 * kHour}});
  store.recordResolutions(
      "2024-03-02",
      {predict::domain::Resolution{"m3", Direction::No, kDay0 + kDay + kHour}});

  predict::SimulationTimeProvider clock(kDay0);
  predict::SnapshotMarketDataSource markets(store, clock, kDay);

  const auto found = markets.fetchResolutions({"m1", "m3"},
                                              std::chrono::milliseconds(0));
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0].market_id, "m1");

  clock.advance_time(kDay0 + kDay);
  const auto next = markets.fetchResolutions({"m1", "m3"},
                                             std::chrono::milliseconds(0));
  ASSERT_EQ(next.size(), 1u);
  EXPECT_EQ(next[0].market_id, "m3");
}

TEST(SnapshotSourcesTest, RecordedExtractorMatchesHeadlineAndCandidates) {
  ScratchDir dir;
  SnapshotStore store(dir.path());
  store.recordSignals(
      "2024-03-01",
      {predict_test::makeRaw("m1", Direction::Yes, 0.7, 8.0, "Senate passes bill"),
       predict_test::makeRaw("m2", Direction::No, 0.6, 7.0, "Senate passes bill"),
       predict_test::makeRaw("m1", Direction::Yes, 0.8, 9.0, "Other news")});

  predict::SimulationTimeProvider clock(kDay0 + kHour);
  predict::RecordedSignalExtractor extractor(store, clock);

  const auto out = extractor.extract(makeArticle("Senate passes bill", kDay0),
                                     {makeQuote("m1", 0.5)});
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].market_id, "m1");
  EXPECT_DOUBLE_EQ(out[0].estimated_prob, 0.7);

  clock.advance_time(kDay0 + kDay);
  EXPECT_TRUE(extractor
                  .extract(makeArticle("Senate passes bill", kDay0),
                           {makeQuote("m1", 0.5)})
                  .empty());
}
