#pragma once

#include "predict/domain/market.hpp"
#include "predict/domain/signal.hpp"

#include <functional>
#include <string>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// Strategy — a named signal generator
// -----------------------------------------------------------------------------
//
// @brief  Capability value held in AgentLoop's strategy list. No base class:
//         a strategy is whatever callable turns (articles, markets) into
//         RawSignals.
//
// @details
// generate_signals runs in the Thinking phase and must not mutate engine
// state. Its output is untrusted and goes through EdgeEvaluator. Throwing
// fails the tick before anything is committed.
// -----------------------------------------------------------------------------
struct Strategy {
  using Generator = std::function<std::vector<domain::RawSignal>(
      const std::vector<domain::Article>&,
      const std::vector<domain::MarketQuote>&)>;

  std::string name;
  Generator generate_signals;
};

}  // namespace predict
