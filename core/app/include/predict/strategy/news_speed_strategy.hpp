#pragma once

#include "predict/io/signal_extractor.hpp"
#include "predict/strategy/strategy.hpp"

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace predict {

struct NewsSpeedOptions {
  int max_markets_per_cycle{5};
};

// Lower-cased alphanumeric words longer than two characters, stop words
// removed.
std::vector<std::string> tokenize(std::string_view text);

// -------------------------------------------------------------------------
// selectCandidateMarkets
// -------------------------------------------------------------------------
// @brief  Picks the markets whose question shares the most tokens with the
//         article headline + summary.
//
// @details
// Unresolved markets only. Ties keep snapshot order. If no market shares
// a token (or the article has none), the first max_markets unresolved
// markets are returned so the extractor still sees something.
// -------------------------------------------------------------------------
std::vector<domain::MarketQuote> selectCandidateMarkets(
    const domain::Article& article,
    const std::vector<domain::MarketQuote>& markets, int max_markets);

// -----------------------------------------------------------------------------
// makeNewsSpeedStrategy
// -----------------------------------------------------------------------------
//
// @brief  "Trade the news before the market reprices it."
//
// @details
// For each new article: shortlist candidate markets by keyword overlap, ask
// the extractor which of them the article moves and how far, and emit its
// answers as RawSignals tagged "news_speed" with the article headline.
// Answers naming a market outside the shortlist are dropped; confidence is
// clamped to [1, 10]. Probability and edge are left for EdgeEvaluator.
//
// The extractor is held by reference and must outlive the Strategy.
// -----------------------------------------------------------------------------
Strategy makeNewsSpeedStrategy(ISignalExtractor& extractor,
                               NewsSpeedOptions options = {});

}  // namespace predict
