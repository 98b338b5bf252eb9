#pragma once

#include "predict/domain/direction.hpp"
#include "predict/domain/risk_limits.hpp"
#include "predict/edge/edge_evaluator.hpp"
#include "predict/io/retry_policy.hpp"
#include "predict/risk/kill_switch_policy.hpp"
#include "predict/sizing/kelly_sizer.hpp"
#include "predict/strategy/news_speed_strategy.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace predict {

// When the Tracking phase appends an EquitySample.
//   PerTick  every tick (the backtest default: one tick per period).
//   PerDay   the first tick of each UTC day, plus the tick that rolls it.
enum class EquitySampling { PerTick, PerDay };

const char* toString(EquitySampling s);

// -----------------------------------------------------------------------------
// EngineConfig — everything the binary reads from config/settings.json
// -----------------------------------------------------------------------------
//
// @brief  Typed view of the JSON settings file, with the conservative
//         paper-trading defaults baked in.
//
// @details
// Layout (every key optional, unknown keys ignored):
//
//   {
//     "trading": {"mode": "paper", "bankroll": 500, "max_bet_pct": 0.05,
//                 "max_daily_loss_pct": 0.10, "min_edge": 0.05,
//                 "kelly_fraction": 0.5, "min_confidence": 6,
//                 "max_concurrent_positions": 10, "max_volume_pct": 0.10},
//     "fees":    {"taker_fee_rate": 0.0,
//                 "slippage": {"impact_coefficient": 0.0,
//                              "max_slippage": 0.05}},
//     "loop":    {"interval_seconds": 60, "max_quote_age_seconds": 300,
//                 "equity_sampling": "per_tick",
//                 "metrics_series": "bankroll"},
//     "retry":   {"max_attempts": 3, "initial_backoff_ms": 200,
//                 "multiplier": 2.0, "max_backoff_ms": 5000,
//                 "timeout_ms": 10000},
//     "kill_switch": {"enabled": true, "max_drawdown_pct": 0.25,
//                     "max_consecutive_failures": 5},
//     "strategies": {"news_speed": {"enabled": true,
//                                   "max_markets_per_cycle": 5}},
//     "paths":   {"journal_dir": "data/journal",
//                 "historical_dir": "data/historical",
//                 "news_file": "data/news.json"},
//     "ipc":     {"enabled": true, "cmd_endpoint": "tcp://127.0.0.1:5556",
//                 "pub_endpoint": "tcp://127.0.0.1:5557",
//                 "market_feed_endpoint": "tcp://127.0.0.1:5560"},
//     "backtest": {"start": "2024-01-01", "end": "2024-02-01",
//                  "period_hours": 24}
//   }
//
// "${VAR}" inside any string value is replaced with the environment
// variable (empty when unset) before the values are read. Numeric fields
// also accept numeric strings so they can come from the environment.
//
// fromJson() throws ConfigError for mistyped values; validate() throws
// ConfigError for values outside their domain. Neither is retried: the
// engine refuses to start.
// -----------------------------------------------------------------------------
struct EngineConfig {
  struct Trading {
    domain::TradingMode mode{domain::TradingMode::Paper};
    double bankroll{500.0};
    double kelly_fraction{0.5};
    double min_confidence{6.0};
    domain::RiskLimits limits;
  };

  struct Loop {
    std::int64_t interval_ms{60 * 1000};
    std::int64_t max_quote_age_ms{5 * 60 * 1000};
    EquitySampling equity_sampling{EquitySampling::PerTick};
    EquitySeries metrics_series{EquitySeries::Bankroll};
  };

  struct NewsSpeed {
    bool enabled{true};
    NewsSpeedOptions options;
  };

  struct Paths {
    std::string journal_dir{"data/journal"};
    std::string historical_dir{"data/historical"};
    std::string news_file{"data/news.json"};
  };

  struct Ipc {
    bool enabled{true};
    std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
    std::string pub_endpoint{"tcp://127.0.0.1:5557"};
    std::string market_feed_endpoint{"tcp://127.0.0.1:5560"};
  };

  struct Backtest {
    std::string start;  // "YYYY-MM-DD" or ISO timestamp, inclusive
    std::string end;    // exclusive
    int period_hours{24};
  };

  Trading trading;
  FeeModel fees;
  Loop loop;
  RetryPolicy retry;
  KillSwitchParams kill_switch;
  NewsSpeed news_speed;
  Paths paths;
  Ipc ipc;
  Backtest backtest;

  EdgeParams edgeParams() const;
  SizingParams sizingParams() const;

  // Throws ConfigError naming the first offending key.
  void validate() const;

  static EngineConfig fromJson(const nlohmann::json& j);

  // A missing file yields the defaults; an unreadable or malformed one
  // throws ConfigError.
  static EngineConfig loadFile(const std::filesystem::path& path);
};

// Replaces every "${NAME}" with getenv("NAME"), or "" when unset.
std::string interpolateEnv(const std::string& value);

}  // namespace predict
