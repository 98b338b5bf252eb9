#pragma once

#include "predict/domain/market.hpp"
#include "predict/domain/signal.hpp"

#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// ISignalExtractor — relevance / probability judgement for one article
// -----------------------------------------------------------------------------
// Given an article and a short list of candidate markets, returns zero or
// more RawSignals. The output is untrusted: EdgeEvaluator validates it and
// re-prices it against the engine's own quote.
//
// The production extractor (an LLM behind an HTTP API) lives outside this
// repository; RecordedSignalExtractor replays its recorded output.
// -----------------------------------------------------------------------------
class ISignalExtractor {
 public:
  virtual ~ISignalExtractor() = default;

  virtual std::vector<domain::RawSignal> extract(
      const domain::Article& article,
      const std::vector<domain::MarketQuote>& candidates) = 0;
};

}  // namespace predict
