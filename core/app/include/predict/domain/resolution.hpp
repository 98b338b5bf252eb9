#pragma once

#include "predict/domain/bet.hpp"
#include "predict/domain/direction.hpp"

#include <cstdint>
#include <string>

namespace predict {
namespace domain {

// -----------------------------------------------------------------------------
// Resolution — the venue's final word on a market
// -----------------------------------------------------------------------------
// Redelivery is expected (sources poll). Closing a Position is idempotent:
// the second Resolution for an already-resolved market is a no-op.
// -----------------------------------------------------------------------------
struct Resolution {
  std::string market_id;
  Direction outcome{Direction::Yes};
  std::int64_t resolved_at_ms{0};
};

// -----------------------------------------------------------------------------
// ResolveStatus / ResolveResult — what resolve() did
// -----------------------------------------------------------------------------
// AlreadyResolved and UnknownMarket are state conflicts: logged, non-fatal,
// and they leave every balance untouched.
// -----------------------------------------------------------------------------
enum class ResolveStatus { Resolved, AlreadyResolved, UnknownMarket };

inline const char* toString(ResolveStatus s) {
  switch (s) {
    case ResolveStatus::Resolved:        return "RESOLVED";
    case ResolveStatus::AlreadyResolved: return "ALREADY_RESOLVED";
    case ResolveStatus::UnknownMarket:   return "UNKNOWN_MARKET";
  }
  return "UNKNOWN";
}

struct ResolveResult {
  ResolveStatus status{ResolveStatus::UnknownMarket};
  double payout{0.0};
  double realized_pnl{0.0};
  int settled_bets{0};
};

// -----------------------------------------------------------------------------
// Settlement — terminal record of one Bet
// -----------------------------------------------------------------------------
//
// @brief  Written once per Bet when its market resolves. The append-only
//         settlement ledger is what PerformanceAccountant aggregates.
//
// @details
//   won  -> pnl = shares - stake   (each share pays $1)
//   lost -> pnl = -stake
//
// edge_at_entry is copied from the Bet's Signal so win rate and average
// edge are computed over the same population.
// -----------------------------------------------------------------------------
struct Settlement {
  BetId bet_id{0};
  std::string market_id;
  Direction direction{Direction::Yes};
  double stake{0.0};
  double shares{0.0};
  Direction outcome{Direction::Yes};
  bool won{false};
  double pnl{0.0};
  double edge_at_entry{0.0};
  std::int64_t resolved_at_ms{0};
};

}  // namespace domain
}  // namespace predict
