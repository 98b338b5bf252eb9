#include "predict/execution/execution_simulator.hpp"

#include "predict/domain/errors.hpp"
#include "predict/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace predict {

namespace {
// Rounding slack on the bankroll check so a stake equal to the whole
// bankroll is not refused for a last-bit difference.
constexpr double kBankrollEpsilon = 1e-9;
}  // namespace

ExecutionSimulator::ExecutionSimulator(double initial_bankroll, EventBus* bus)
    : initial_bankroll_(initial_bankroll), bus_(bus) {
  state_.bankroll = initial_bankroll;
  state_.start_of_day_bankroll = initial_bankroll;
}

// -----------------------------------------------------------------------------
// validate(): every refusal placeBet() can raise, without side effects
// -----------------------------------------------------------------------------
void ExecutionSimulator::validate(const domain::Bet& bet) const {
  const std::string& market_id = bet.marketId();
  if (market_id.empty()) {
    throw InvalidBetError("bet has empty market_id");
  }
  if (!std::isfinite(bet.stake_amount) || bet.stake_amount <= 0.0) {
    std::ostringstream os;
    os << "non-positive stake " << bet.stake_amount << " in " << market_id;
    throw InvalidBetError(os.str());
  }
  if (!std::isfinite(bet.execution_price) || bet.execution_price <= 0.0 ||
      bet.execution_price >= 1.0) {
    std::ostringstream os;
    os << "execution price " << bet.execution_price << " outside (0, 1) in "
       << market_id;
    throw InvalidBetError(os.str());
  }
  if (bet_ids_.count(bet.id) != 0) {
    throw InvalidBetError("duplicate bet id " + std::to_string(bet.id));
  }
  if (resolved_.count(market_id) != 0) {
    throw MarketResolvedError("market " + market_id + " already resolved");
  }
  auto it = open_.find(market_id);
  if (it != open_.end() && it->second.direction != bet.direction()) {
    throw PositionConflictError(
        "open " + std::string(domain::toString(it->second.direction)) +
        " position in " + market_id + " conflicts with " +
        domain::toString(bet.direction()) + " bet");
  }
  if (bet.stake_amount > state_.bankroll + kBankrollEpsilon) {
    std::ostringstream os;
    os << "stake " << bet.stake_amount << " exceeds bankroll "
       << state_.bankroll;
    throw InsufficientBankrollError(os.str());
  }
}

// -----------------------------------------------------------------------------
// placeBet(): validate, build the new Position aside, then commit
// -----------------------------------------------------------------------------
const domain::Position& ExecutionSimulator::placeBet(const domain::Bet& bet) {
  validate(bet);

  const std::string& market_id = bet.marketId();
  const double fill_shares = bet.stake_amount / bet.execution_price;

  domain::Position next;
  auto it = open_.find(market_id);
  const bool existed = it != open_.end();
  if (existed) {
    next = it->second;
    next.shares += fill_shares;
    next.cost_basis += bet.stake_amount;
    next.avg_price = next.cost_basis / next.shares;
    next.bet_count += 1;
  } else {
    next.market_id = market_id;
    next.direction = bet.direction();
    next.shares = fill_shares;
    next.avg_price = bet.execution_price;
    next.cost_basis = bet.stake_amount;
    next.status = domain::PositionStatus::Open;
    next.opened_at_ms = bet.placed_at_ms;
    next.bet_count = 1;
  }

  // Allocating steps first, non-throwing arithmetic last.
  bets_.push_back(bet);
  try {
    bet_ids_.insert(bet.id);
    open_[market_id] = next;
  } catch (...) {
    bet_ids_.erase(bet.id);
    if (!existed) {
      open_.erase(market_id);
    }
    bets_.pop_back();
    throw;
  }

  state_.bankroll -= bet.stake_amount;
  recomputeOpenBook();

  const domain::Position& committed = open_.at(market_id);
  publish(BetPlacedEvent{bet, state_.bankroll, bet.placed_at_ms});
  publish(PositionUpdateEvent{committed, bet.placed_at_ms});
  return committed;
}

// -----------------------------------------------------------------------------
// resolve(): Open -> Resolved exactly once
// -----------------------------------------------------------------------------
domain::ResolveResult ExecutionSimulator::resolve(
    const domain::Resolution& resolution) {
  domain::ResolveResult result;
  const std::string& market_id = resolution.market_id;

  if (resolved_.count(market_id) != 0) {
    result.status = domain::ResolveStatus::AlreadyResolved;
    return result;
  }
  auto it = open_.find(market_id);
  if (it == open_.end()) {
    result.status = domain::ResolveStatus::UnknownMarket;
    return result;
  }

  domain::Position pos = it->second;
  const bool won = pos.direction == resolution.outcome;
  result.status = domain::ResolveStatus::Resolved;
  result.payout = won ? pos.shares : 0.0;
  result.realized_pnl = result.payout - pos.cost_basis;

  std::vector<domain::Settlement> fresh;
  for (const auto& bet : bets_) {
    if (bet.marketId() != market_id) {
      continue;
    }
    domain::Settlement s;
    s.bet_id = bet.id;
    s.market_id = market_id;
    s.direction = bet.direction();
    s.stake = bet.stake_amount;
    s.shares = bet.shares();
    s.outcome = resolution.outcome;
    s.won = won;
    s.pnl = won ? s.shares - s.stake : -s.stake;
    s.edge_at_entry = bet.signal.edge;
    s.resolved_at_ms = resolution.resolved_at_ms;
    fresh.push_back(s);
  }
  result.settled_bets = static_cast<int>(fresh.size());

  pos.status = domain::PositionStatus::Resolved;
  settlements_.reserve(settlements_.size() + fresh.size());
  resolved_[market_id] = pos;
  open_.erase(it);
  settlements_.insert(settlements_.end(), fresh.begin(), fresh.end());

  state_.bankroll += result.payout;
  state_.daily_pnl += result.realized_pnl;
  recomputeOpenBook();

  publish(PositionUpdateEvent{pos, resolution.resolved_at_ms});
  publish(ResolutionEvent{resolution, result, state_.bankroll,
                          resolution.resolved_at_ms});
  return result;
}

void ExecutionSimulator::rollDay(const std::string& day_key) {
  if (day_key == state_.day_key) {
    return;
  }
  state_.day_key = day_key;
  state_.daily_pnl = 0.0;
  state_.start_of_day_bankroll = equity();
}

domain::EquitySample ExecutionSimulator::equitySample(
    std::int64_t timestamp_ms) const {
  domain::EquitySample sample;
  sample.day_key = time_utils::dayKey(timestamp_ms);
  sample.timestamp_ms = timestamp_ms;
  sample.bankroll = state_.bankroll;
  sample.equity = equity();
  return sample;
}

const domain::EquitySample& ExecutionSimulator::recordEquitySample(
    const domain::EquitySample& sample) {
  equity_curve_.push_back(sample);
  return equity_curve_.back();
}

const domain::Position* ExecutionSimulator::position(
    const std::string& market_id) const {
  auto it = open_.find(market_id);
  return it != open_.end() ? &it->second : nullptr;
}

const domain::Position* ExecutionSimulator::resolvedPosition(
    const std::string& market_id) const {
  auto it = resolved_.find(market_id);
  return it != resolved_.end() ? &it->second : nullptr;
}

std::vector<domain::Position> ExecutionSimulator::openPositions() const {
  std::vector<domain::Position> out;
  out.reserve(open_.size());
  for (const auto& entry : open_) {
    out.push_back(entry.second);
  }
  return out;
}

std::vector<std::string> ExecutionSimulator::openMarketIds() const {
  std::vector<std::string> out;
  out.reserve(open_.size());
  for (const auto& entry : open_) {
    out.push_back(entry.first);
  }
  return out;
}

bool ExecutionSimulator::isResolved(const std::string& market_id) const {
  return resolved_.count(market_id) != 0;
}

double ExecutionSimulator::equity() const {
  return state_.bankroll + state_.open_exposure;
}

// -----------------------------------------------------------------------------
// restore(): replay the journal in time order
// -----------------------------------------------------------------------------
void ExecutionSimulator::restore(
    const std::vector<domain::Bet>& bets,
    const std::vector<domain::Resolution>& resolutions,
    const std::vector<domain::EquitySample>& equity_curve) {
  if (!bets_.empty() || !settlements_.empty() || !equity_curve_.empty()) {
    throw PersistenceError("restore() on a simulator that already has state");
  }

  // (timestamp, kind, index); kind 0 = bet, 1 = resolution.
  struct Step {
    std::int64_t ts;
    int kind;
    std::size_t index;
  };
  std::vector<Step> steps;
  steps.reserve(bets.size() + resolutions.size());
  for (std::size_t i = 0; i < bets.size(); ++i) {
    steps.push_back(Step{bets[i].placed_at_ms, 0, i});
  }
  for (std::size_t i = 0; i < resolutions.size(); ++i) {
    steps.push_back(Step{resolutions[i].resolved_at_ms, 1, i});
  }
  std::stable_sort(steps.begin(), steps.end(),
                   [](const Step& a, const Step& b) {
                     if (a.ts != b.ts) {
                       return a.ts < b.ts;
                     }
                     return a.kind < b.kind;
                   });

  replaying_ = true;
  int skipped = 0;
  try {
    for (const auto& step : steps) {
      rollDay(time_utils::dayKey(step.ts));
      if (step.kind == 0) {
        const domain::Bet& bet = bets[step.index];
        try {
          placeBet(bet);
        } catch (const ExecutionError& e) {
          throw PersistenceError("journaled bet " + std::to_string(bet.id) +
                                 " cannot be replayed: " + e.what());
        }
      } else if (resolve(resolutions[step.index]).status !=
                 domain::ResolveStatus::Resolved) {
        ++skipped;
      }
    }
  } catch (...) {
    replaying_ = false;
    throw;
  }
  replaying_ = false;

  equity_curve_ = equity_curve;

  std::cout << "[ExecutionSimulator] restored " << bets_.size() << " bets, "
            << settlements_.size() << " settlements, " << open_.size()
            << " open positions, bankroll=" << state_.bankroll;
  if (skipped > 0) {
    std::cout << " (" << skipped << " resolutions without a position)";
  }
  std::cout << "\n";
}

void ExecutionSimulator::publish(const Event& event) {
  if (bus_ != nullptr && !replaying_) {
    bus_->publish(event);
  }
}

void ExecutionSimulator::recomputeOpenBook() {
  double exposure = 0.0;
  for (const auto& entry : open_) {
    exposure += entry.second.cost_basis;
  }
  state_.open_position_count = static_cast<int>(open_.size());
  state_.open_exposure = exposure;
}

}  // namespace predict
