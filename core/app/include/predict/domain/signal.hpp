#pragma once

#include "predict/domain/direction.hpp"

#include <cstdint>
#include <string>

namespace predict {
namespace domain {

// -----------------------------------------------------------------------------
// RawSignal — untrusted strategy / extractor output
// -----------------------------------------------------------------------------
//
// @brief  "Buy <direction> in <market_id>, we think it is <estimated_prob>
//         likely, with <confidence> out of 10."
//
// @details
// Nothing in a RawSignal is trusted. The EdgeEvaluator range-checks the
// probability, looks up the live quote itself and recomputes the edge. The
// headline and strategy fields are carried through for the journal only.
// -----------------------------------------------------------------------------
struct RawSignal {
  std::string market_id;
  Direction direction{Direction::Yes};
  double estimated_prob{0.0};
  double confidence{0.0};
  std::string reasoning;
  std::string headline;
  std::string strategy;
};

// -----------------------------------------------------------------------------
// Signal — a RawSignal validated and priced by the EdgeEvaluator
// -----------------------------------------------------------------------------
//
// @brief  Lives for one tick. Never persisted as mutable state; the journal
//         keeps an immutable copy of each decision.
//
// @details
// quoted_price    best ask of the chosen side at evaluation time.
// effective_price quoted_price plus slippage for the contemplated stake.
// edge            fee-adjusted expected value per dollar staked:
//                   p * (1 - e) - (1 - p) * e - taker_fee_rate
//                 Only EdgeEvaluator writes this field.
// -----------------------------------------------------------------------------
struct Signal {
  std::int64_t timestamp_ms{0};
  std::string market_id;
  std::string question;
  Direction direction{Direction::Yes};
  double quoted_price{0.0};
  double effective_price{0.0};
  double estimated_prob{0.0};
  double edge{0.0};
  double confidence{0.0};
  std::string reasoning;
  std::string headline;
  std::string strategy;
};

}  // namespace domain
}  // namespace predict
