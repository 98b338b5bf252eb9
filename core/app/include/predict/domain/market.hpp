#pragma once

#include "predict/domain/direction.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace predict {
namespace domain {

// -----------------------------------------------------------------------------
// Article — one news item handed to the strategies
// -----------------------------------------------------------------------------
// (url, headline) identifies an article for de-duplication. published_at_ms
// drives the news watermark.
// -----------------------------------------------------------------------------
struct Article {
  std::string headline;
  std::string summary;
  std::string source;
  std::string url;
  std::int64_t published_at_ms{0};
  std::string category;

  std::string key() const { return url + "\n" + headline; }
};

// -----------------------------------------------------------------------------
// MarketQuote — snapshot of one binary market
// -----------------------------------------------------------------------------
//
// @brief  Best-ask prices for both outcome tokens plus the liquidity figures
//         used by slippage and the volume gate.
//
// @details
// Prices are in dollars per share, i.e. implied probabilities in (0, 1).
// yes_price and no_price are quoted independently and need not sum to 1.
//
// book_depth is an optional dollar depth figure from the venue. When it is
// zero the EdgeEvaluator falls back to volume_24h as the depth proxy.
//
// updated_at_ms is the time the quote was observed. EdgeEvaluator rejects
// quotes older than its max_quote_age_ms as stale.
// -----------------------------------------------------------------------------
struct MarketQuote {
  std::string market_id;
  std::string question;
  double yes_price{0.0};
  double no_price{0.0};
  double volume_24h{0.0};
  double book_depth{0.0};
  bool resolved{false};
  std::optional<Direction> outcome;
  std::int64_t updated_at_ms{0};

  // Best ask for the requested side.
  double priceFor(Direction d) const {
    return d == Direction::Yes ? yes_price : no_price;
  }
};

}  // namespace domain
}  // namespace predict
