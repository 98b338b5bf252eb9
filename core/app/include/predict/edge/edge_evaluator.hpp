#pragma once

#include "predict/domain/market.hpp"
#include "predict/domain/signal.hpp"

#include <cstdint>
#include <string>

namespace predict {

// -----------------------------------------------------------------------------
// SlippageModel — price impact of a stake against available depth
// -----------------------------------------------------------------------------
//
//   depth = book_depth   if book_depth > 0
//           volume_24h   otherwise
//   slip  = min(max_slippage, impact_coefficient * stake / depth)
//
// Zero when the stake is zero or no positive depth figure exists. With the
// default impact_coefficient of 0 the model is disabled and the effective
// price equals the quoted ask.
// -----------------------------------------------------------------------------
struct SlippageModel {
  double impact_coefficient{0.0};
  double max_slippage{0.05};

  double slippageFor(double stake, const domain::MarketQuote& quote) const;
};

struct FeeModel {
  double taker_fee_rate{0.0};
  SlippageModel slippage;
};

struct EdgeParams {
  FeeModel fees;
  double min_edge{0.05};
  double min_confidence{6.0};
  std::int64_t max_quote_age_ms{5 * 60 * 1000};
};

enum class EdgeRejection {
  None,
  InvalidSignal,
  StaleMarketData,
  BelowMinEdge,
  BelowMinConfidence,
};

// "INVALID_SIGNAL", "STALE_MARKET_DATA", ...
const char* toString(EdgeRejection r);

// -----------------------------------------------------------------------------
// EdgeEvaluation — result of one evaluate() call
// -----------------------------------------------------------------------------
// signal is fully populated whenever the quote was usable, including for
// BelowMinEdge / BelowMinConfidence rejections, so the journal records the
// computed edge of refused candidates too.
// -----------------------------------------------------------------------------
struct EdgeEvaluation {
  EdgeRejection rejection{EdgeRejection::None};
  std::string detail;
  domain::Signal signal;

  bool accepted() const { return rejection == EdgeRejection::None; }
};

// -----------------------------------------------------------------------------
// EdgeEvaluator
// -----------------------------------------------------------------------------
//
// @brief  Turns an untrusted RawSignal plus the engine's own view of the
//         market into a priced Signal, or a rejection.
//
// @details
// Edge is the fee-adjusted expected value per dollar staked, computed at
// the slippage-adjusted price:
//
//   e  = min(quoted + slip(stake), 0.999)
//   ev = p * (1 - e) - (1 - p) * e - taker_fee_rate
//
// never the raw probability gap p - quoted.
//
// Checks in order, first failure wins:
//   1. InvalidSignal       empty market id, p outside [0, 1], non-finite p or
//                          confidence, negative stake.
//   2. StaleMarketData     no quote, quote resolved, side price outside
//                          (0, 1), or now - updated_at > max_quote_age_ms.
//   3. BelowMinConfidence  confidence < min_confidence.
//   4. BelowMinEdge        ev <= min_edge.
//
// Rejections are final for the tick; none is retried.
//
// Pure: no clock reads, no I/O, no mutable members. The caller passes
// now_ms, so a backtest and a paper run fed the same inputs produce
// byte-identical Signals.
// -----------------------------------------------------------------------------
class EdgeEvaluator {
 public:
  explicit EdgeEvaluator(const EdgeParams& params);

  // quote may be null (market missing from the snapshot).
  EdgeEvaluation evaluate(const domain::RawSignal& raw,
                          const domain::MarketQuote* quote, double stake,
                          std::int64_t now_ms) const;

  static double expectedValue(double estimated_prob, double effective_price,
                              double taker_fee_rate);

  double effectivePrice(double quoted_price, double stake,
                        const domain::MarketQuote& quote) const;

  const EdgeParams& params() const { return params_; }

  static constexpr double kMaxEffectivePrice = 0.999;

 private:
  const EdgeParams params_;
};

}  // namespace predict
