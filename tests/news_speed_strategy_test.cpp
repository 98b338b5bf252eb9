// =============================================================================
// news_speed_strategy_test.cpp
// =============================================================================
// Unit tests for the news-speed strategy: tokenizer, candidate market
// shortlist and the extractor hand-off.
// =============================================================================

#include "predict/storage/snapshot_sources.hpp"
#include "predict/strategy/news_speed_strategy.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

using predict_test::Direction;
using predict_test::kDay0;
using predict_test::makeArticle;
using predict_test::makeQuote;
using predict_test::makeRaw;

namespace {

predict::domain::MarketQuote question(const std::string& id,
                                      const std::string& text) {
  auto q = makeQuote(id, 0.5);
  q.question = text;
  return q;
}

}  // namespace

TEST(NewsSpeedStrategyTest, TokenizeDropsStopWordsAndShortWords) {
  const auto tokens = predict::tokenize("Will the Fed cut rates in March, 2024?");
  const std::vector<std::string> expected = {"fed", "cut", "rates", "march",
                                             "2024"};
  EXPECT_EQ(tokens, expected);
  EXPECT_TRUE(predict::tokenize("a an of to").empty());
}

TEST(NewsSpeedStrategyTest, CandidatesRankedByOverlap) {
  const std::vector<predict::domain::MarketQuote> markets = {
      question("weather", "Will it snow in Denver this week?"),
      question("fed", "Will the Fed cut rates in March?"),
      question("fed2", "Will the Fed hold rates?"),
  };
  const auto article = makeArticle("Fed signals March rate cut", kDay0);

  const auto picked = predict::selectCandidateMarkets(article, markets, 2);
  ASSERT_EQ(picked.size(), 2u);
  EXPECT_EQ(picked[0].market_id, "fed");
  EXPECT_EQ(picked[1].market_id, "fed2");
}

TEST(NewsSpeedStrategyTest, NoOverlapFallsBackToFirstOpenMarkets) {
  auto resolved = question("old", "Finished market");
  resolved.resolved = true;
  resolved.outcome = Direction::Yes;
  const std::vector<predict::domain::MarketQuote> markets = {
      resolved, question("a", "Alpha question"), question("b", "Beta question"),
      question("c", "Gamma question")};

  const auto picked = predict::selectCandidateMarkets(
      makeArticle("Completely unrelated headline", kDay0), markets, 2);
  ASSERT_EQ(picked.size(), 2u);
  EXPECT_EQ(picked[0].market_id, "a");
  EXPECT_EQ(picked[1].market_id, "b");
}

TEST(NewsSpeedStrategyTest, EmitsExtractorAnswersForShortlistOnly) {
  const std::string headline = "Fed signals March rate cut";
  predict::RecordedSignalExtractor extractor({
      makeRaw("fed", Direction::Yes, 0.75, 14.0, headline),
      makeRaw("weather", Direction::No, 0.60, 6.0, headline),
  });
  auto strategy = predict::makeNewsSpeedStrategy(extractor, {1});
  EXPECT_EQ(strategy.name, "news_speed");

  const std::vector<predict::domain::MarketQuote> markets = {
      question("weather", "Will it snow in Denver this week?"),
      question("fed", "Will the Fed cut rates in March?"),
  };
  const auto out =
      strategy.generate_signals({makeArticle(headline, kDay0)}, markets);

  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].market_id, "fed");
  EXPECT_DOUBLE_EQ(out[0].confidence, 10.0);
  EXPECT_EQ(out[0].strategy, "news_speed");
  EXPECT_EQ(out[0].headline, headline);
}

TEST(NewsSpeedStrategyTest, NothingToDoWithoutArticlesOrMarkets) {
  predict::RecordedSignalExtractor extractor(
      std::vector<predict::domain::RawSignal>{});
  auto strategy = predict::makeNewsSpeedStrategy(extractor);
  EXPECT_TRUE(strategy.generate_signals({}, {makeQuote("m1", 0.5)}).empty());
  EXPECT_TRUE(
      strategy.generate_signals({makeArticle("x", kDay0)}, {}).empty());
}
