#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace predict {
namespace domain {

// -----------------------------------------------------------------------------
// Direction — which side of a binary market a signal or position is on
// -----------------------------------------------------------------------------
//
// @brief  A binary market has exactly two outcome tokens. Buying YES pays
//         $1 per share if the market resolves YES; buying NO pays $1 per
//         share if it resolves NO.
//
// @details
// The engine only ever buys. "Selling YES" is expressed as buying NO, so
// a Position carries a Direction rather than a signed quantity.
// -----------------------------------------------------------------------------
enum class Direction { Yes, No };

// -----------------------------------------------------------------------------
// TradingMode — where a Bet is executed
// -----------------------------------------------------------------------------
// Recorded on every Bet for auditing. Decision logic never branches on it;
// only the clock and the data sources differ between modes.
// -----------------------------------------------------------------------------
enum class TradingMode { Backtest, Paper, Live };

inline const char* toString(Direction d) {
  switch (d) {
    case Direction::Yes: return "YES";
    case Direction::No:  return "NO";
  }
  return "UNKNOWN";
}

inline const char* toString(TradingMode m) {
  switch (m) {
    case TradingMode::Backtest: return "backtest";
    case TradingMode::Paper:    return "paper";
    case TradingMode::Live:     return "live";
  }
  return "unknown";
}

inline Direction opposite(Direction d) {
  return d == Direction::Yes ? Direction::No : Direction::Yes;
}

namespace detail {
inline std::string lowerTrimmed(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  std::string out(text.substr(begin, end - begin));
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}
}  // namespace detail

// -------------------------------------------------------------------------
// parseDirection
// -------------------------------------------------------------------------
// @brief  Accepts "YES"/"Y"/"NO"/"N" in any case, surrounding whitespace
//         ignored.
// @return std::nullopt for anything else.
// -------------------------------------------------------------------------
inline std::optional<Direction> parseDirection(std::string_view text) {
  const std::string v = detail::lowerTrimmed(text);
  if (v == "yes" || v == "y") {
    return Direction::Yes;
  }
  if (v == "no" || v == "n") {
    return Direction::No;
  }
  return std::nullopt;
}

inline std::optional<TradingMode> parseTradingMode(std::string_view text) {
  const std::string v = detail::lowerTrimmed(text);
  if (v == "backtest") {
    return TradingMode::Backtest;
  }
  if (v == "paper") {
    return TradingMode::Paper;
  }
  if (v == "live") {
    return TradingMode::Live;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace predict
