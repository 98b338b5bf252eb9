#include "predict/edge/edge_evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace predict {

double SlippageModel::slippageFor(double stake,
                                  const domain::MarketQuote& quote) const {
  if (stake <= 0.0 || impact_coefficient <= 0.0) {
    return 0.0;
  }
  const double depth = quote.book_depth > 0.0 ? quote.book_depth
                                              : quote.volume_24h;
  if (depth <= 0.0) {
    return 0.0;
  }
  return std::min(max_slippage, impact_coefficient * stake / depth);
}

const char* toString(EdgeRejection r) {
  switch (r) {
    case EdgeRejection::None:               return "NONE";
    case EdgeRejection::InvalidSignal:      return "INVALID_SIGNAL";
    case EdgeRejection::StaleMarketData:    return "STALE_MARKET_DATA";
    case EdgeRejection::BelowMinEdge:       return "BELOW_MIN_EDGE";
    case EdgeRejection::BelowMinConfidence: return "BELOW_MIN_CONFIDENCE";
  }
  return "UNKNOWN";
}

EdgeEvaluator::EdgeEvaluator(const EdgeParams& params) : params_(params) {}

double EdgeEvaluator::expectedValue(double estimated_prob,
                                    double effective_price,
                                    double taker_fee_rate) {
  return estimated_prob * (1.0 - effective_price) -
         (1.0 - estimated_prob) * effective_price - taker_fee_rate;
}

double EdgeEvaluator::effectivePrice(double quoted_price, double stake,
                                     const domain::MarketQuote& quote) const {
  const double slip = params_.fees.slippage.slippageFor(stake, quote);
  return std::min(quoted_price + slip, kMaxEffectivePrice);
}

// -----------------------------------------------------------------------------
// evaluate(): validate, price, gate
// -----------------------------------------------------------------------------
EdgeEvaluation EdgeEvaluator::evaluate(const domain::RawSignal& raw,
                                       const domain::MarketQuote* quote,
                                       double stake,
                                       std::int64_t now_ms) const {
  EdgeEvaluation out;
  auto reject = [&out](EdgeRejection why, std::string detail) {
    out.rejection = why;
    out.detail = std::move(detail);
    return out;
  };

  // --- 1. Input validation --------------------------------------------------
  if (raw.market_id.empty()) {
    return reject(EdgeRejection::InvalidSignal, "empty market_id");
  }
  if (!std::isfinite(raw.estimated_prob) || raw.estimated_prob < 0.0 ||
      raw.estimated_prob > 1.0) {
    std::ostringstream os;
    os << "estimated_prob " << raw.estimated_prob << " outside [0, 1]";
    return reject(EdgeRejection::InvalidSignal, os.str());
  }
  if (!std::isfinite(raw.confidence)) {
    return reject(EdgeRejection::InvalidSignal, "non-finite confidence");
  }
  if (!std::isfinite(stake) || stake < 0.0) {
    return reject(EdgeRejection::InvalidSignal, "negative stake");
  }

  // --- 2. Quote freshness ---------------------------------------------------
  if (quote == nullptr) {
    return reject(EdgeRejection::StaleMarketData,
                  "no quote for market " + raw.market_id);
  }
  if (quote->resolved) {
    return reject(EdgeRejection::StaleMarketData,
                  "market " + raw.market_id + " already resolved");
  }
  const double quoted = quote->priceFor(raw.direction);
  if (!std::isfinite(quoted) || quoted <= 0.0 || quoted >= 1.0) {
    std::ostringstream os;
    os << "quoted " << domain::toString(raw.direction) << " price " << quoted
       << " outside (0, 1)";
    return reject(EdgeRejection::StaleMarketData, os.str());
  }
  const std::int64_t age_ms = now_ms - quote->updated_at_ms;
  if (params_.max_quote_age_ms > 0 && age_ms > params_.max_quote_age_ms) {
    std::ostringstream os;
    os << "quote age " << age_ms << "ms exceeds " << params_.max_quote_age_ms
       << "ms";
    return reject(EdgeRejection::StaleMarketData, os.str());
  }

  // --- Price the signal -----------------------------------------------------
  const double effective = effectivePrice(quoted, stake, *quote);

  domain::Signal& s = out.signal;
  s.timestamp_ms = now_ms;
  s.market_id = raw.market_id;
  s.question = quote->question;
  s.direction = raw.direction;
  s.quoted_price = quoted;
  s.effective_price = effective;
  s.estimated_prob = raw.estimated_prob;
  s.edge = expectedValue(raw.estimated_prob, effective,
                         params_.fees.taker_fee_rate);
  s.confidence = raw.confidence;
  s.reasoning = raw.reasoning;
  s.headline = raw.headline;
  s.strategy = raw.strategy;

  // --- 3/4. Thresholds ------------------------------------------------------
  if (raw.confidence < params_.min_confidence) {
    std::ostringstream os;
    os << "confidence " << raw.confidence << " < " << params_.min_confidence;
    return reject(EdgeRejection::BelowMinConfidence, os.str());
  }
  if (s.edge <= params_.min_edge) {
    std::ostringstream os;
    os << "edge " << s.edge << " <= " << params_.min_edge;
    return reject(EdgeRejection::BelowMinEdge, os.str());
  }

  return out;
}

}  // namespace predict
