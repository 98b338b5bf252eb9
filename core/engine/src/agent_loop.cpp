#include "predict/engine/agent_loop.hpp"

#include "predict/domain/errors.hpp"
#include "predict/storage/json_codec.hpp"
#include "predict/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <sstream>
#include <utility>

namespace predict {

namespace {

// A PerDay loop that ticks more often than daily still samples once a day.
MetricsOptions metricsFor(const AgentLoopOptions& options) {
  std::int64_t sample_interval = options.interval_ms;
  if (options.equity_sampling == EquitySampling::PerDay) {
    sample_interval = std::max(sample_interval, time_utils::kMsPerDay);
  }
  MetricsOptions m;
  m.series = options.metrics_series;
  m.periods_per_year = PerformanceAccountant::periodsPerYear(sample_interval);
  return m;
}

}  // namespace

const char* toString(AgentState s) {
  switch (s) {
    case AgentState::Idle:     return "IDLE";
    case AgentState::Sensing:  return "SENSING";
    case AgentState::Thinking: return "THINKING";
    case AgentState::Acting:   return "ACTING";
    case AgentState::Tracking: return "TRACKING";
    case AgentState::Sleeping: return "SLEEPING";
  }
  return "UNKNOWN";
}

AgentLoop::AgentLoop(const AgentLoopOptions& options,
                     const AgentLoopDeps& deps,
                     std::vector<Strategy> strategies, Sleeper sleeper)
    : options_(options),
      metrics_options_(metricsFor(options)),
      clock_(deps.clock),
      news_(deps.news),
      markets_(deps.markets),
      risk_(deps.risk),
      engine_(deps.engine),
      sink_(deps.sink),
      bus_(deps.bus),
      sleeper_(std::move(sleeper)),
      strategies_(std::move(strategies)),
      pipeline_(deps.evaluator, deps.sizer, deps.risk, deps.engine, deps.sink,
                ids_, options.mode, deps.bus),
      kill_switch_(options.kill_switch),
      watermark_ms_(options.news_watermark_ms) {
  // A warm-started engine already holds journaled bets; never reuse an id.
  for (const auto& bet : engine_.bets()) {
    ids_.advance_past(bet.id);
  }
  if (!engine_.equityCurve().empty()) {
    last_sampled_day_ = engine_.equityCurve().back().day_key;
  }
  refreshStatus(AgentState::Idle);

  std::cout << "[AgentLoop] ready. mode=" << domain::toString(options_.mode)
            << " strategies=" << strategies_.size()
            << " metrics=" << toString(metrics_options_.series)
            << " next_bet_id=" << ids_.peek() << "\n";
}

void AgentLoop::setSnapshotRecorder(const SnapshotStore* recorder) {
  recorder_ = recorder;
}

// -----------------------------------------------------------------------------
// runTick(): one Sense -> Think -> Act -> Track pass
// -----------------------------------------------------------------------------
bool AgentLoop::runTick() {
  // Only one tick at a time, whichever thread asks (run loop or IPC TICK).
  // The loser returns false immediately instead of queueing.
  bool expected = false;
  if (!tick_in_progress_.compare_exchange_strong(expected, true)) {
    return false;
  }
  // RAII reset: the flag clears on every exit path.
  struct InProgressGuard {
    std::atomic<bool>& flag;
    ~InProgressGuard() { flag.store(false); }
  } guard{tick_in_progress_};

  // One timestamp for the whole tick: bets, resolutions and the equity
  // sample all carry it, so a backtest replays to identical records.
  ++tick_number_;
  const std::int64_t now = clock_.now_ms();
  TickCounts counts;
  std::string error;

  try {
    std::vector<domain::Article> articles;
    std::vector<domain::MarketQuote> markets;

    setState(AgentState::Sensing);
    sense(articles, markets);

    setState(AgentState::Thinking);
    const auto candidates = think(articles, markets, now);

    // The day rolls before any bet so the daily loss limit is measured
    // from this day's opening equity.
    setState(AgentState::Acting);
    engine_.rollDay(time_utils::dayKey(now));
    act(candidates, now, counts);

    setState(AgentState::Tracking);
    track(now, counts);
  } catch (const FatalError& e) {
    // Persistence or config broke mid-tick. The record that failed was not
    // committed; the next tick tries again and the kill switch counts it.
    error = std::string("fatal: ") + e.what();
  } catch (const TransientIoError& e) {
    error = std::string("transient i/o: ") + e.what();
  } catch (const Error& e) {
    error = e.what();
  } catch (const std::exception& e) {
    error = std::string("unexpected: ") + e.what();
  }

  // ---  Bookkeeping, on success and failure alike --------------------------
  const bool ok = error.empty();
  {
    std::lock_guard lock(status_mutex_);
    ++status_.ticks_run;
    status_.last_tick_ms = now;
    if (ok) {
      status_.consecutive_failures = 0;
    } else {
      ++status_.ticks_failed;
      ++status_.consecutive_failures;
      status_.last_error = error;
    }
  }
  if (!ok) {
    std::cerr << "[AgentLoop] WARNING: tick " << tick_number_
              << " failed: " << error << "\n";
  }

  // The kill switch sees this tick's failure count and metrics before the
  // status snapshot is published.
  evaluateKillSwitch(now);
  refreshStatus(AgentState::Sleeping);

  if (bus_ != nullptr) {
    TickEvent ev;
    ev.tick_number = tick_number_;
    ev.ok = ok;
    ev.error = error;
    ev.bets_placed = counts.bets_placed;
    ev.resolutions_applied = counts.resolutions_applied;
    ev.bankroll = engine_.riskState().bankroll;
    ev.equity = engine_.equity();
    ev.timestamp_ms = now;
    bus_->publish(ev);
  }

  std::cout << "[AgentLoop] tick " << tick_number_ << " @ "
            << time_utils::isoTimestamp(now) << (ok ? " ok" : " FAILED")
            << " bets=" << counts.bets_placed
            << " resolved=" << counts.resolutions_applied
            << " bankroll=" << engine_.riskState().bankroll
            << " equity=" << engine_.equity() << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// Sensing
// -----------------------------------------------------------------------------
void AgentLoop::sense(std::vector<domain::Article>& articles,
                      std::vector<domain::MarketQuote>& markets) {
  // Both fetches go through the retry policy; an exhausted retry throws
  // TransientIoError and the tick soft-fails before Thinking.
  const std::int64_t since = watermark_ms_;
  articles = retryCall(options_.retry, "news fetch", sleeper_,
                       [&](std::chrono::milliseconds timeout) {
                         return news_.fetchSince(since, timeout);
                       });
  markets = retryCall(options_.retry, "market fetch", sleeper_,
                      [&](std::chrono::milliseconds timeout) {
                        return markets_.fetchMarkets(timeout);
                      });

  // The watermark only moves forward, to the newest article seen.
  for (const auto& a : articles) {
    watermark_ms_ = std::max(watermark_ms_, a.published_at_ms);
  }

  // Live runs double as data collection for later backtests. Markets are
  // recorded once per UTC day, news as it arrives.
  if (recorder_ != nullptr) {
    const std::string day = time_utils::dayKey(clock_.now_ms());
    if (!articles.empty()) {
      recordSafely("news", [&] { recorder_->recordNews(day, articles); });
    }
    if (!markets.empty() && day != last_recorded_markets_day_) {
      recordSafely("markets", [&] { recorder_->recordMarkets(day, markets); });
      last_recorded_markets_day_ = day;
    }
  }
}

// -----------------------------------------------------------------------------
// Thinking
// -----------------------------------------------------------------------------
std::vector<Candidate> AgentLoop::think(
    const std::vector<domain::Article>& articles,
    const std::vector<domain::MarketQuote>& markets, std::int64_t now_ms) {
  // Strategies react to news; without news or quotes there is nothing to
  // think about.
  std::vector<Candidate> candidates;
  if (articles.empty() || markets.empty()) {
    return candidates;
  }

  // Index the snapshot once. A signal for a market not in it is screened
  // with no quote and rejected by the evaluator.
  std::map<std::string, const domain::MarketQuote*> by_id;
  for (const auto& m : markets) {
    by_id[m.market_id] = &m;
  }

  std::vector<domain::RawSignal> recorded;
  for (const auto& strategy : strategies_) {
    if (!strategy.generate_signals) {
      continue;
    }
    // A strategy that throws fails the whole tick: Thinking has no side
    // effects yet, so nothing needs undoing.
    const auto raws = strategy.generate_signals(articles, markets);
    for (auto raw : raws) {
      if (raw.strategy.empty()) {
        raw.strategy = strategy.name;
      }
      auto it = by_id.find(raw.market_id);
      const domain::MarketQuote* quote =
          it == by_id.end() ? nullptr : it->second;
      candidates.push_back(pipeline_.screen(raw, quote, now_ms));
      if (recorder_ != nullptr) {
        recorded.push_back(raw);
      }
    }
  }

  if (!recorded.empty()) {
    const std::string day = time_utils::dayKey(now_ms);
    recordSafely("signals", [&] { recorder_->recordSignals(day, recorded); });
  }
  return candidates;
}

// -----------------------------------------------------------------------------
// Acting
// -----------------------------------------------------------------------------
void AgentLoop::act(const std::vector<Candidate>& candidates,
                    std::int64_t now_ms, TickCounts& counts) {
  // In strategy order. Each placed bet lowers the bankroll the next
  // candidate is sized against.
  for (const auto& candidate : candidates) {
    const auto outcome = pipeline_.act(candidate, now_ms);
    if (outcome.placed) {
      ++counts.bets_placed;
    }
  }
}

// -----------------------------------------------------------------------------
// Tracking
// -----------------------------------------------------------------------------
void AgentLoop::track(std::int64_t now_ms, TickCounts& counts) {
  // Ask only about markets we hold; a book with no positions skips the
  // resolution fetch entirely.
  const auto open_ids = engine_.openMarketIds();
  if (!open_ids.empty()) {
    const auto resolutions =
        retryCall(options_.retry, "resolution fetch", sleeper_,
                  [&](std::chrono::milliseconds timeout) {
                    return markets_.fetchResolutions(open_ids, timeout);
                  });

    std::vector<domain::Resolution> applied;
    for (const auto& r : resolutions) {
      // Already resolved or never held: the engine reports the status and
      // changes nothing, so there is nothing to journal.
      if (engine_.position(r.market_id) == nullptr) {
        const auto result = engine_.resolve(r);
        std::cout << "[AgentLoop] resolution for " << r.market_id << ": "
                  << domain::toString(result.status) << "\n";
        continue;
      }
      // Write-ahead: the journal sees the resolution before the engine.
      sink_.appendResolution(r);
      const auto result = engine_.resolve(r);
      if (result.status == domain::ResolveStatus::Resolved) {
        ++counts.resolutions_applied;
        applied.push_back(r);
      }
    }

    if (recorder_ != nullptr && !applied.empty()) {
      const std::string day = time_utils::dayKey(now_ms);
      recordSafely("resolutions",
                   [&] { recorder_->recordResolutions(day, applied); });
    }
  }

  // Write-ahead, as for resolutions: the journal sees the sample first.
  const std::string day = time_utils::dayKey(now_ms);
  const bool sample = options_.equity_sampling == EquitySampling::PerTick ||
                      day != last_sampled_day_;
  if (sample) {
    const domain::EquitySample s = engine_.equitySample(now_ms);
    sink_.appendEquitySample(s);
    engine_.recordEquitySample(s);
    last_sampled_day_ = day;
  }

  metrics_ = PerformanceAccountant::compute(
      engine_.bets(), engine_.settlements(), engine_.equityCurve(),
      metrics_options_);
}

// -----------------------------------------------------------------------------
// Kill switch: halt on the clear -> tripped transition only
// -----------------------------------------------------------------------------
void AgentLoop::evaluateKillSwitch(std::int64_t now_ms) {
  int failures = 0;
  {
    std::lock_guard lock(status_mutex_);
    failures = status_.consecutive_failures;
  }
  // metrics_ is from the last tick that reached Tracking; a failed tick is
  // judged on its failure count.
  const KillSwitchVerdict verdict = kill_switch_.evaluate(metrics_, failures);
  if (!verdict.trip) {
    kill_tripped_ = false;
    return;
  }
  // Still tripped from an earlier tick: an operator RESUME in between is
  // left alone.
  if (kill_tripped_) {
    return;
  }
  kill_tripped_ = true;

  std::ostringstream os;
  os << "kill switch " << verdict.reason << ": " << verdict.current_value
     << " >= " << verdict.limit_value;
  risk_.haltTrading(os.str());

  if (bus_ != nullptr) {
    bus_->publish(RiskViolationEvent{verdict.reason, verdict.current_value,
                                     verdict.limit_value, now_ms});
  }
}

// -----------------------------------------------------------------------------
// run(): drive ticks off the ticker, skipping overrun slots
// -----------------------------------------------------------------------------
void AgentLoop::run(ITicker& ticker) {
  const std::int64_t interval = std::max<std::int64_t>(1, options_.interval_ms);
  std::int64_t next = clock_.now_ms();

  std::cout << "[AgentLoop] running every " << interval << "ms.\n";

  while (!stop_.load()) {
    runTick();
    next += interval;

    // Deadlines stay on the original grid. A tick that overran lands on
    // the next free slot; the slots it covered are counted, never run.
    const std::int64_t now = clock_.now_ms();
    if (now >= next) {
      const std::int64_t missed = (now - next) / interval + 1;
      next += missed * interval;
      {
        std::lock_guard lock(status_mutex_);
        status_.ticks_skipped += static_cast<std::uint64_t>(missed);
      }
      std::cerr << "[AgentLoop] WARNING: tick overran, skipped " << missed
                << " slot(s).\n";
    }

    if (!ticker.sleepUntil(next, stop_)) {
      break;
    }
  }

  refreshStatus(AgentState::Idle);
  std::cout << "[AgentLoop] stopped.\n";
}

void AgentLoop::requestStop() { stop_.store(true); }

AgentStatus AgentLoop::getStatus() const {
  AgentStatus copy;
  {
    std::lock_guard lock(status_mutex_);
    copy = status_;
  }
  copy.halted = risk_.isHalted();
  copy.halt_reason = risk_.haltReason();
  return copy;
}

// -----------------------------------------------------------------------------
// executeCommand(): operator commands from IpcServer
// -----------------------------------------------------------------------------
std::string AgentLoop::executeCommand(const std::string& cmd) {
  std::string verb;
  std::string arg;
  {
    std::istringstream in(cmd);
    in >> verb;
    std::getline(in, arg);
    const auto first = arg.find_first_not_of(" \t");
    arg = first == std::string::npos ? std::string() : arg.substr(first);
  }
  std::transform(verb.begin(), verb.end(), verb.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });

  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS") {
    const AgentStatus s = getStatus();
    response["status"] = "ok";
    response["state"] = toString(s.state);
    response["mode"] = domain::toString(options_.mode);
    response["halted"] = s.halted;
    if (s.halted) {
      response["halt_reason"] = s.halt_reason;
    }
    response["bankroll"] = s.bankroll;
    response["equity"] = s.equity;
    response["daily_pnl"] = s.daily_pnl;
    response["last_tick_ms"] = s.last_tick_ms;
    response["last_error"] = s.last_error;
    response["ticks_run"] = s.ticks_run;
    response["ticks_failed"] = s.ticks_failed;
    response["ticks_skipped"] = s.ticks_skipped;
    response["open_positions"] = s.open_positions.size();

    nlohmann::json positions_json = nlohmann::json::array();
    for (const auto& pos : s.open_positions) {
      positions_json.push_back(nlohmann::json(pos));
    }
    response["positions"] = std::move(positions_json);

    nlohmann::json m;
    m["num_bets"] = s.metrics.num_bets;
    m["num_resolved"] = s.metrics.num_resolved;
    m["win_rate"] = s.metrics.win_rate;
    m["avg_edge"] = s.metrics.avg_edge;
    m["total_realized_pnl"] = s.metrics.total_realized_pnl;
    m["sharpe_ratio"] = s.metrics.sharpe_ratio;
    m["max_drawdown"] = s.metrics.max_drawdown;
    m["series"] = toString(metrics_options_.series);
    response["metrics"] = std::move(m);
  } else if (verb == "TICK") {
    const bool ran = runTick();
    response["status"] = "ok";
    response["response"] = ran ? "Tick complete" : "Tick already in progress";
  } else if (verb == "HALT") {
    risk_.haltTrading(arg.empty() ? "operator halt" : arg);
    response["status"] = "ok";
    response["response"] = "Trading halted";
  } else if (verb == "RESUME") {
    risk_.resumeTrading();
    response["status"] = "ok";
    response["response"] = "Trading resumed";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

void AgentLoop::setState(AgentState s) { refreshStatus(s); }

void AgentLoop::refreshStatus(AgentState s) {
  const auto& rs = engine_.riskState();
  auto positions = engine_.openPositions();
  const double equity = engine_.equity();

  std::lock_guard lock(status_mutex_);
  status_.state = s;
  status_.open_positions = std::move(positions);
  status_.daily_pnl = rs.daily_pnl;
  status_.bankroll = rs.bankroll;
  status_.equity = equity;
  status_.metrics = metrics_;
}

void AgentLoop::recordSafely(const char* what,
                             const std::function<void()>& fn) {
  try {
    fn();
  } catch (const PersistenceError& e) {
    std::cerr << "[AgentLoop] WARNING: could not record " << what
              << " snapshot: " << e.what() << "\n";
  }
}

}  // namespace predict
