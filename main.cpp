// -----------------------------------------------------------------------------
// predict_engine — single executable entry point.
//
//   predict_engine [--config FILE] [--mode backtest|paper]
//                  [--start DATE] [--end DATE]
//
// Backtest mode:
//   1) SimulationTimeProvider at the backtest start.
//   2) Snapshot-backed news, market and extractor sources over
//      paths.historical_dir.
//   3) AgentLoop + BacktestRunner step the clock one period per tick.
//   4) Final metrics are printed as JSON on stdout.
//
// Paper mode:
//   1) LiveTimeProvider + JsonlJournal under paths.journal_dir; the
//      ExecutionSimulator is warm-started from the journal.
//   2) JsonFileNewsSource polls paths.news_file; ZmqMarketFeed subscribes to
//      ipc.market_feed_endpoint; recorded extractor answers come from the
//      historical snapshot store, which also records the live data.
//   3) IpcServer exposes PING/STATUS/TICK/HALT/RESUME and publishes telemetry.
//   4) AgentLoop::run() ticks every loop.interval_seconds until Ctrl-C.
//
// Live mode needs an exchange adapter this binary does not ship and is
// refused at startup.
// -----------------------------------------------------------------------------

#include "predict/config/engine_config.hpp"
#include "predict/domain/errors.hpp"
#include "predict/edge/edge_evaluator.hpp"
#include "predict/engine/agent_loop.hpp"
#include "predict/engine/backtest_runner.hpp"
#include "predict/eventbus/event_bus.hpp"
#include "predict/execution/execution_simulator.hpp"
#include "predict/gateway/json_file_news_source.hpp"
#include "predict/gateway/zmq_market_feed.hpp"
#include "predict/network/ipc_server.hpp"
#include "predict/risk/risk_manager.hpp"
#include "predict/sizing/kelly_sizer.hpp"
#include "predict/storage/in_memory_journal.hpp"
#include "predict/storage/jsonl_journal.hpp"
#include "predict/storage/snapshot_sources.hpp"
#include "predict/storage/snapshot_store.hpp"
#include "predict/strategy/news_speed_strategy.hpp"
#include "predict/time/live_ticker.hpp"
#include "predict/time/live_time_provider.hpp"
#include "predict/time/simulation_time_provider.hpp"
#include "predict/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

// -----------------------------------------------------------------------------
// The only global in the program: a raw pointer to the stack-local AgentLoop
// so the SIGINT handler can request a cooperative stop. Set once before the
// handler is installed, cleared after run() returns.
// -----------------------------------------------------------------------------
predict::AgentLoop* g_loop_ptr = nullptr;

void sigint_handler(int /*signum*/) {
  if (g_loop_ptr != nullptr) {
    g_loop_ptr->requestStop();
  }
}

struct CliArgs {
  std::string config_path{"config/settings.json"};
  std::optional<std::string> mode;
  std::optional<std::string> start;
  std::optional<std::string> end;
};

CliArgs parseArgs(int argc, char** argv) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw predict::ConfigError("missing value for " + flag);
      }
      return argv[++i];
    };
    if (flag == "--config") {
      args.config_path = value();
    } else if (flag == "--mode") {
      args.mode = value();
    } else if (flag == "--start") {
      args.start = value();
    } else if (flag == "--end") {
      args.end = value();
    } else {
      throw predict::ConfigError("unknown argument " + flag);
    }
  }
  return args;
}

std::vector<predict::Strategy> buildStrategies(
    const predict::EngineConfig& cfg, predict::ISignalExtractor& extractor) {
  std::vector<predict::Strategy> strategies;
  if (cfg.news_speed.enabled) {
    strategies.push_back(
        predict::makeNewsSpeedStrategy(extractor, cfg.news_speed.options));
  }
  if (strategies.empty()) {
    std::cerr << "[main] WARNING: no strategy enabled; the loop will only "
                 "track resolutions.\n";
  }
  return strategies;
}

int runBacktest(const predict::EngineConfig& cfg) {
  using namespace predict;

  const std::int64_t start = *time_utils::parseIsoTimestamp(cfg.backtest.start);
  const std::int64_t end = *time_utils::parseIsoTimestamp(cfg.backtest.end);
  const std::int64_t period =
      static_cast<std::int64_t>(cfg.backtest.period_hours) *
      time_utils::kMsPerHour;

  SimulationTimeProvider clock(start);
  SnapshotStore store(cfg.paths.historical_dir);
  SnapshotNewsSource news(store, clock, period);
  SnapshotMarketDataSource markets(store, clock, period);
  RecordedSignalExtractor extractor(store, clock);

  EventBus bus;
  ExecutionSimulator simulator(cfg.trading.bankroll, &bus);
  InMemoryJournal journal;

  const EdgeEvaluator evaluator(cfg.edgeParams());
  const KellySizer sizer(cfg.sizingParams());
  RiskManager risk(cfg.trading.limits);

  AgentLoopOptions options;
  options.mode = domain::TradingMode::Backtest;
  options.interval_ms = period;
  options.retry = cfg.retry;
  options.equity_sampling = EquitySampling::PerTick;
  options.metrics_series = cfg.loop.metrics_series;
  options.kill_switch = cfg.kill_switch;

  AgentLoop loop(options,
                 AgentLoopDeps{clock, news, markets, evaluator, sizer, risk,
                               simulator, journal, &bus},
                 buildStrategies(cfg, extractor),
                 [](std::chrono::milliseconds) {});

  BacktestRunner runner(clock, loop, simulator);
  const BacktestResult result = runner.run(BacktestOptions{start, end, period});

  const auto& m = result.metrics;
  nlohmann::json summary;
  summary["start"] = time_utils::isoTimestamp(start);
  summary["end"] = time_utils::isoTimestamp(end);
  summary["periods"] = result.periods;
  summary["ticks_failed"] = result.ticks_failed;
  summary["initial_bankroll"] = result.initial_bankroll;
  summary["final_bankroll"] = result.final_bankroll;
  summary["final_equity"] = result.final_equity;
  summary["open_positions"] = result.open_positions;
  summary["num_bets"] = m.num_bets;
  summary["num_resolved"] = m.num_resolved;
  summary["wins"] = m.wins;
  summary["losses"] = m.losses;
  summary["win_rate"] = m.win_rate;
  summary["avg_edge"] = m.avg_edge;
  summary["total_staked"] = m.total_staked;
  summary["total_realized_pnl"] = m.total_realized_pnl;
  summary["roi"] = m.roi;
  summary["sharpe_ratio"] = m.sharpe_ratio;
  summary["max_drawdown"] = m.max_drawdown;
  summary["metrics_series"] = toString(loop.metricsOptions().series);
  std::cout << summary.dump(2) << "\n";
  return 0;
}

int runPaper(const predict::EngineConfig& cfg) {
  using namespace predict;

  LiveTimeProvider clock;
  JsonlJournal journal(cfg.paths.journal_dir);

  EventBus bus;
  ExecutionSimulator simulator(cfg.trading.bankroll, &bus);
  const auto equity = journal.loadEquitySamples();
  simulator.restore(journal.loadBets(), journal.loadResolutions(), equity);

  JsonFileNewsSource news(cfg.paths.news_file);
  ZmqMarketFeed feed(clock, cfg.ipc.market_feed_endpoint);
  feed.start();

  SnapshotStore store(cfg.paths.historical_dir);
  RecordedSignalExtractor extractor(store, clock);

  const EdgeEvaluator evaluator(cfg.edgeParams());
  const KellySizer sizer(cfg.sizingParams());
  RiskManager risk(cfg.trading.limits);

  AgentLoopOptions options;
  options.mode = domain::TradingMode::Paper;
  options.interval_ms = cfg.loop.interval_ms;
  options.retry = cfg.retry;
  options.equity_sampling = cfg.loop.equity_sampling;
  options.metrics_series = cfg.loop.metrics_series;
  options.kill_switch = cfg.kill_switch;
  options.news_watermark_ms = equity.empty() ? 0 : equity.back().timestamp_ms;

  AgentLoop loop(options,
                 AgentLoopDeps{clock, news, feed, evaluator, sizer, risk,
                               simulator, journal, &bus},
                 buildStrategies(cfg, extractor));
  loop.setSnapshotRecorder(&store);

  std::unique_ptr<IpcServer> ipc;
  if (cfg.ipc.enabled) {
    ipc = std::make_unique<IpcServer>(
        [&loop](const std::string& cmd) { return loop.executeCommand(cmd); },
        cfg.ipc.cmd_endpoint, cfg.ipc.pub_endpoint);
    // Telemetry bridge: tick-thread events into the IPC queue. The server
    // detaches itself from the bus when it stops.
    ipc->attachTelemetry(bus);
    ipc->start();
  }

  g_loop_ptr = &loop;
  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] paper trading. bankroll=" << simulator.riskState().bankroll
            << " equity=" << simulator.equity()
            << " open_positions=" << simulator.riskState().open_position_count
            << "\n[main] Press Ctrl-C to shut down.\n";

  LiveTicker ticker(clock);
  loop.run(ticker);

  std::cout << "[main] loop exited. Stopping IPC and market feed...\n";
  std::signal(SIGINT, SIG_DFL);
  g_loop_ptr = nullptr;
  if (ipc) {
    ipc->stop();
  }
  ipc.reset();
  feed.stop();
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const CliArgs args = parseArgs(argc, argv);
    predict::EngineConfig cfg = predict::EngineConfig::loadFile(args.config_path);

    if (args.mode) {
      auto mode = predict::domain::parseTradingMode(*args.mode);
      if (!mode) {
        throw predict::ConfigError("unknown --mode " + *args.mode);
      }
      cfg.trading.mode = *mode;
    }
    if (args.start) {
      cfg.backtest.start = *args.start;
    }
    if (args.end) {
      cfg.backtest.end = *args.end;
    }
    cfg.validate();

    switch (cfg.trading.mode) {
      case predict::domain::TradingMode::Backtest:
        if (cfg.backtest.start.empty() || cfg.backtest.end.empty()) {
          throw predict::ConfigError(
              "backtest mode needs backtest.start and backtest.end");
        }
        return runBacktest(cfg);
      case predict::domain::TradingMode::Paper:
        return runPaper(cfg);
      case predict::domain::TradingMode::Live:
        throw predict::ConfigError(
            "live mode requires an exchange adapter; use paper or backtest");
    }
    return 0;
  } catch (const predict::ConfigError& e) {
    std::cerr << "[main] CRITICAL: configuration error: " << e.what() << "\n";
    return 2;
  } catch (const predict::FatalError& e) {
    std::cerr << "[main] CRITICAL: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] CRITICAL: unexpected error: " << e.what() << "\n";
    return 1;
  }
}
