#pragma once

#include "predict/concurrent/bet_id_generator.hpp"
#include "predict/config/engine_config.hpp"
#include "predict/domain/position.hpp"
#include "predict/engine/trading_pipeline.hpp"
#include "predict/eventbus/event_bus.hpp"
#include "predict/execution/i_execution_engine.hpp"
#include "predict/io/market_data_source.hpp"
#include "predict/io/news_source.hpp"
#include "predict/io/persistence_sink.hpp"
#include "predict/io/retry_policy.hpp"
#include "predict/performance/performance_accountant.hpp"
#include "predict/risk/kill_switch_policy.hpp"
#include "predict/risk/risk_manager.hpp"
#include "predict/storage/snapshot_store.hpp"
#include "predict/strategy/strategy.hpp"
#include "predict/time/i_ticker.hpp"
#include "predict/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace predict {

enum class AgentState { Idle, Sensing, Thinking, Acting, Tracking, Sleeping };

const char* toString(AgentState s);

struct AgentLoopOptions {
  domain::TradingMode mode{domain::TradingMode::Paper};
  std::int64_t interval_ms{60 * 1000};
  RetryPolicy retry;
  EquitySampling equity_sampling{EquitySampling::PerTick};
  EquitySeries metrics_series{EquitySeries::Bankroll};
  KillSwitchParams kill_switch;
  // Articles published at or before this are treated as already seen.
  std::int64_t news_watermark_ms{0};
};

// Collaborators the loop drives. None are owned; all must outlive the loop.
struct AgentLoopDeps {
  const ITimeProvider& clock;
  INewsSource& news;
  IMarketDataSource& markets;
  const EdgeEvaluator& evaluator;
  const KellySizer& sizer;
  RiskManager& risk;
  IExecutionEngine& engine;
  IPersistenceSink& sink;
  EventBus* bus{nullptr};
};

// Copy of the loop's observable state, taken under a mutex at phase
// boundaries so other threads (IPC) can read it at any time.
struct AgentStatus {
  AgentState state{AgentState::Idle};
  std::vector<domain::Position> open_positions;
  double daily_pnl{0.0};
  double bankroll{0.0};
  double equity{0.0};
  std::int64_t last_tick_ms{0};
  std::string last_error;
  std::uint64_t ticks_run{0};
  std::uint64_t ticks_failed{0};
  std::uint64_t ticks_skipped{0};
  int consecutive_failures{0};
  bool halted{false};
  std::string halt_reason;
  PerformanceMetrics metrics;
};

// -----------------------------------------------------------------------------
// AgentLoop — Sense -> Think -> Act -> Track
// -----------------------------------------------------------------------------
//
// @brief  Runs one trading tick end-to-end and schedules ticks off an
//         ITicker. The only component that sequences the others.
//
// @details
// Per tick:
//
//   Sensing   fetch new articles (watermarked) and the market snapshot
//             through RetryPolicy. Each fetch gets the policy timeout;
//             TransientIoError is retried with backoff.
//   Thinking  every Strategy turns (articles, markets) into RawSignals and
//             TradingPipeline::screen() evaluates them at zero stake. No
//             engine state changes.
//   Acting    rollDay() for the tick's UTC day, then TradingPipeline::act()
//             for each candidate in order.
//   Tracking  fetch resolutions for open markets, journal and apply them,
//             journal and append an EquitySample (per the sampling
//             policy), compute metrics on the configured series.
//   Sleeping  between ticks.
//
// After every tick, ok or failed, KillSwitchPolicy is evaluated. A verdict
// that goes from clear to tripped halts new bets through RiskManager and
// publishes RiskViolationEvent; tracking continues on later ticks. An
// operator RESUME is not overridden until the verdict clears and trips
// again.
//
// Failure isolation:
//   Any exception in an active phase is logged, stored as last_error and
//   ends the tick in Sleeping. Bets committed earlier in the same tick stay
//   committed. Nothing escapes runTick(). Every record is journaled before
//   the engine commits it, so a PersistenceError leaves the engine as it
//   was before that record.
//
// Thread model:
//   runTick() may be called from any thread (run loop, IPC TICK command,
//   tests); an atomic in-progress flag makes a concurrent call return
//   false instead of running a second tick. getStatus() and
//   executeCommand() are safe from any thread.
// -----------------------------------------------------------------------------
class AgentLoop {
 public:
  AgentLoop(const AgentLoopOptions& options, const AgentLoopDeps& deps,
            std::vector<Strategy> strategies, Sleeper sleeper = realSleep);

  AgentLoop(const AgentLoop&) = delete;
  AgentLoop& operator=(const AgentLoop&) = delete;
  AgentLoop(AgentLoop&&) = delete;
  AgentLoop& operator=(AgentLoop&&) = delete;

  // Live data is also written to the historical snapshot layout so it can
  // be backtested later. Recording failures are logged, never fatal.
  void setSnapshotRecorder(const SnapshotStore* recorder);

  // -------------------------------------------------------------------------
  // runTick()
  // -------------------------------------------------------------------------
  // @return false if a tick was already in progress (nothing was done),
  //         true once this call's tick has finished, successfully or not.
  // -------------------------------------------------------------------------
  bool runTick();

  // -------------------------------------------------------------------------
  // run(ticker)
  // -------------------------------------------------------------------------
  // @brief  Ticks every interval_ms until requestStop(). A tick that runs
  //         past one or more slots skips them (counted in ticks_skipped);
  //         missed slots are never queued.
  // -------------------------------------------------------------------------
  void run(ITicker& ticker);

  void requestStop();
  bool stopRequested() const { return stop_.load(); }

  AgentStatus getStatus() const;

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  Operator command handler bound to IpcServer. Returns JSON.
  //
  //   "PING"           {"status":"ok","response":"PONG"}
  //   "STATUS"         {"status":"ok", state, bankroll, equity, positions..}
  //   "TICK"           runs a tick now, or "busy" if one is in progress
  //   "HALT [reason]"  halts new bets
  //   "RESUME"         lifts the halt
  //   other            {"status":"error","response":"Unknown command: ..."}
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  const std::vector<Strategy>& strategies() const { return strategies_; }
  std::int64_t newsWatermark() const { return watermark_ms_; }

  // Series and annualization the loop's metrics use: one equity sample per
  // interval_ms under PerTick, at most one per day under PerDay.
  const MetricsOptions& metricsOptions() const { return metrics_options_; }

 private:
  struct TickCounts {
    int bets_placed{0};
    int resolutions_applied{0};
  };

  void sense(std::vector<domain::Article>& articles,
             std::vector<domain::MarketQuote>& markets);
  std::vector<Candidate> think(const std::vector<domain::Article>& articles,
                               const std::vector<domain::MarketQuote>& markets,
                               std::int64_t now_ms);
  void act(const std::vector<Candidate>& candidates, std::int64_t now_ms,
           TickCounts& counts);
  void track(std::int64_t now_ms, TickCounts& counts);
  void evaluateKillSwitch(std::int64_t now_ms);

  void setState(AgentState s);
  void refreshStatus(AgentState s);
  void recordSafely(const char* what, const std::function<void()>& fn);

  const AgentLoopOptions options_;
  const MetricsOptions metrics_options_;
  const ITimeProvider& clock_;
  INewsSource& news_;
  IMarketDataSource& markets_;
  RiskManager& risk_;
  IExecutionEngine& engine_;
  IPersistenceSink& sink_;
  EventBus* bus_;
  Sleeper sleeper_;

  std::vector<Strategy> strategies_;
  BetIdGenerator ids_;
  TradingPipeline pipeline_;
  KillSwitchPolicy kill_switch_;
  const SnapshotStore* recorder_{nullptr};

  std::atomic<bool> tick_in_progress_{false};
  std::atomic<bool> stop_{false};

  // Tick-thread state.
  std::int64_t watermark_ms_{0};
  std::uint64_t tick_number_{0};
  std::string last_sampled_day_;
  std::string last_recorded_markets_day_;
  bool kill_tripped_{false};
  PerformanceMetrics metrics_;

  mutable std::mutex status_mutex_;
  AgentStatus status_;
};

}  // namespace predict
