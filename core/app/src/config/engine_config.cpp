#include "predict/config/engine_config.hpp"

#include "predict/domain/errors.hpp"
#include "predict/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <system_error>

namespace predict {

const char* toString(EquitySampling s) {
  switch (s) {
    case EquitySampling::PerTick: return "per_tick";
    case EquitySampling::PerDay:  return "per_day";
  }
  return "unknown";
}

std::string interpolateEnv(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  std::size_t pos = 0;
  while (pos < value.size()) {
    const auto open = value.find("${", pos);
    if (open == std::string::npos) {
      out.append(value, pos, std::string::npos);
      break;
    }
    const auto close = value.find('}', open + 2);
    if (close == std::string::npos) {
      out.append(value, pos, std::string::npos);
      break;
    }
    out.append(value, pos, open - pos);
    const std::string name = value.substr(open + 2, close - open - 2);
    if (const char* env = std::getenv(name.c_str())) {
      out += env;
    }
    pos = close + 1;
  }
  return out;
}

namespace {

using nlohmann::json;

void interpolateTree(json& node) {
  if (node.is_string()) {
    node = interpolateEnv(node.get<std::string>());
  } else if (node.is_object() || node.is_array()) {
    for (auto& child : node) {
      interpolateTree(child);
    }
  }
}

const json* section(const json& root, const char* name) {
  auto it = root.find(name);
  if (it == root.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("config section '") + name +
                      "' must be an object");
  }
  return &*it;
}

void readNumber(const json& sec, const char* key, const std::string& where,
                double& out) {
  auto it = sec.find(key);
  if (it == sec.end() || it->is_null()) {
    return;
  }
  if (it->is_number()) {
    out = it->get<double>();
    return;
  }
  if (it->is_string()) {
    const auto text = it->get<std::string>();
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (!text.empty() && end == text.c_str() + text.size()) {
      out = v;
      return;
    }
  }
  throw ConfigError("config key '" + where + "." + key +
                    "' must be a number, got " + it->dump());
}

void readInt(const json& sec, const char* key, const std::string& where,
             int& out) {
  double v = out;
  readNumber(sec, key, where, v);
  if (v != std::floor(v)) {
    throw ConfigError("config key '" + where + "." + key +
                      "' must be an integer");
  }
  out = static_cast<int>(v);
}

void readMillis(const json& sec, const char* key, const std::string& where,
                double scale, std::int64_t& out_ms) {
  double v = static_cast<double>(out_ms) / scale;
  readNumber(sec, key, where, v);
  out_ms = static_cast<std::int64_t>(std::llround(v * scale));
}

void readMillis(const json& sec, const char* key, const std::string& where,
                std::chrono::milliseconds& out) {
  std::int64_t ms = out.count();
  readMillis(sec, key, where, 1.0, ms);
  out = std::chrono::milliseconds(ms);
}

void readBool(const json& sec, const char* key, const std::string& where,
              bool& out) {
  auto it = sec.find(key);
  if (it == sec.end() || it->is_null()) {
    return;
  }
  if (it->is_boolean()) {
    out = it->get<bool>();
    return;
  }
  if (it->is_string()) {
    const auto text = domain::detail::lowerTrimmed(it->get<std::string>());
    if (text == "true" || text == "1" || text == "yes") {
      out = true;
      return;
    }
    if (text == "false" || text == "0" || text == "no") {
      out = false;
      return;
    }
  }
  throw ConfigError("config key '" + where + "." + key +
                    "' must be a boolean, got " + it->dump());
}

void readString(const json& sec, const char* key, const std::string& where,
                std::string& out) {
  auto it = sec.find(key);
  if (it == sec.end() || it->is_null()) {
    return;
  }
  if (!it->is_string()) {
    throw ConfigError("config key '" + where + "." + key +
                      "' must be a string, got " + it->dump());
  }
  out = it->get<std::string>();
}

void require(bool ok, const std::string& message) {
  if (!ok) {
    throw ConfigError("invalid config: " + message);
  }
}

bool isFraction(double v) { return std::isfinite(v) && v > 0.0 && v <= 1.0; }

}  // namespace

EdgeParams EngineConfig::edgeParams() const {
  EdgeParams p;
  p.fees = fees;
  p.min_edge = trading.limits.min_edge;
  p.min_confidence = trading.min_confidence;
  p.max_quote_age_ms = loop.max_quote_age_ms;
  return p;
}

SizingParams EngineConfig::sizingParams() const {
  SizingParams p;
  p.kelly_fraction = trading.kelly_fraction;
  p.max_bet_pct = trading.limits.max_bet_pct;
  return p;
}

EngineConfig EngineConfig::fromJson(const nlohmann::json& input) {
  if (!input.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }
  json root = input;
  interpolateTree(root);

  EngineConfig cfg;

  if (const json* t = section(root, "trading")) {
    std::string mode = domain::toString(cfg.trading.mode);
    readString(*t, "mode", "trading", mode);
    auto parsed = domain::parseTradingMode(mode);
    if (!parsed) {
      throw ConfigError("config key 'trading.mode' must be backtest, paper "
                        "or live, got '" + mode + "'");
    }
    cfg.trading.mode = *parsed;
    readNumber(*t, "bankroll", "trading", cfg.trading.bankroll);
    readNumber(*t, "kelly_fraction", "trading", cfg.trading.kelly_fraction);
    readNumber(*t, "min_confidence", "trading", cfg.trading.min_confidence);
    readNumber(*t, "min_edge", "trading", cfg.trading.limits.min_edge);
    readNumber(*t, "max_bet_pct", "trading", cfg.trading.limits.max_bet_pct);
    readNumber(*t, "max_daily_loss_pct", "trading",
               cfg.trading.limits.max_daily_loss_pct);
    readNumber(*t, "max_volume_pct", "trading",
               cfg.trading.limits.max_volume_pct);
    readInt(*t, "max_concurrent_positions", "trading",
            cfg.trading.limits.max_concurrent_positions);
  }

  if (const json* f = section(root, "fees")) {
    readNumber(*f, "taker_fee_rate", "fees", cfg.fees.taker_fee_rate);
    if (const json* s = section(*f, "slippage")) {
      readNumber(*s, "impact_coefficient", "fees.slippage",
                 cfg.fees.slippage.impact_coefficient);
      readNumber(*s, "max_slippage", "fees.slippage",
                 cfg.fees.slippage.max_slippage);
    }
  }

  if (const json* l = section(root, "loop")) {
    readMillis(*l, "interval_seconds", "loop", 1000.0, cfg.loop.interval_ms);
    readMillis(*l, "max_quote_age_seconds", "loop", 1000.0,
               cfg.loop.max_quote_age_ms);
    std::string sampling = toString(cfg.loop.equity_sampling);
    readString(*l, "equity_sampling", "loop", sampling);
    sampling = domain::detail::lowerTrimmed(sampling);
    if (sampling == "per_tick") {
      cfg.loop.equity_sampling = EquitySampling::PerTick;
    } else if (sampling == "per_day") {
      cfg.loop.equity_sampling = EquitySampling::PerDay;
    } else {
      throw ConfigError("config key 'loop.equity_sampling' must be per_tick "
                        "or per_day, got '" + sampling + "'");
    }
    std::string series = toString(cfg.loop.metrics_series);
    readString(*l, "metrics_series", "loop", series);
    series = domain::detail::lowerTrimmed(series);
    if (series == "bankroll") {
      cfg.loop.metrics_series = EquitySeries::Bankroll;
    } else if (series == "equity") {
      cfg.loop.metrics_series = EquitySeries::Equity;
    } else {
      throw ConfigError("config key 'loop.metrics_series' must be bankroll "
                        "or equity, got '" + series + "'");
    }
  }

  if (const json* r = section(root, "retry")) {
    readInt(*r, "max_attempts", "retry", cfg.retry.max_attempts);
    readMillis(*r, "initial_backoff_ms", "retry", cfg.retry.initial_backoff);
    readNumber(*r, "multiplier", "retry", cfg.retry.multiplier);
    readMillis(*r, "max_backoff_ms", "retry", cfg.retry.max_backoff);
    readMillis(*r, "timeout_ms", "retry", cfg.retry.timeout);
  }

  if (const json* k = section(root, "kill_switch")) {
    readBool(*k, "enabled", "kill_switch", cfg.kill_switch.enabled);
    readNumber(*k, "max_drawdown_pct", "kill_switch",
               cfg.kill_switch.max_drawdown_pct);
    readInt(*k, "max_consecutive_failures", "kill_switch",
            cfg.kill_switch.max_consecutive_failures);
  }

  if (const json* s = section(root, "strategies")) {
    if (const json* n = section(*s, "news_speed")) {
      readBool(*n, "enabled", "strategies.news_speed",
               cfg.news_speed.enabled);
      readInt(*n, "max_markets_per_cycle", "strategies.news_speed",
              cfg.news_speed.options.max_markets_per_cycle);
      // Per-strategy override of the global confidence floor.
      readNumber(*n, "min_confidence", "strategies.news_speed",
                 cfg.trading.min_confidence);
    }
  }

  if (const json* p = section(root, "paths")) {
    readString(*p, "journal_dir", "paths", cfg.paths.journal_dir);
    readString(*p, "historical_dir", "paths", cfg.paths.historical_dir);
    readString(*p, "news_file", "paths", cfg.paths.news_file);
  }

  if (const json* i = section(root, "ipc")) {
    readBool(*i, "enabled", "ipc", cfg.ipc.enabled);
    readString(*i, "cmd_endpoint", "ipc", cfg.ipc.cmd_endpoint);
    readString(*i, "pub_endpoint", "ipc", cfg.ipc.pub_endpoint);
    readString(*i, "market_feed_endpoint", "ipc",
               cfg.ipc.market_feed_endpoint);
  }

  if (const json* b = section(root, "backtest")) {
    readString(*b, "start", "backtest", cfg.backtest.start);
    readString(*b, "end", "backtest", cfg.backtest.end);
    readInt(*b, "period_hours", "backtest", cfg.backtest.period_hours);
  }

  return cfg;
}

EngineConfig EngineConfig::loadFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    std::cout << "[EngineConfig] " << path.string()
              << " not found, using defaults.\n";
    return EngineConfig{};
  }
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path.string());
  }
  json j = json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    throw ConfigError("config file " + path.string() + " is not valid JSON");
  }
  auto cfg = fromJson(j);
  std::cout << "[EngineConfig] loaded " << path.string() << "\n";
  return cfg;
}

void EngineConfig::validate() const {
  const auto& l = trading.limits;
  require(std::isfinite(trading.bankroll) && trading.bankroll > 0.0,
          "trading.bankroll must be positive");
  require(isFraction(trading.kelly_fraction),
          "trading.kelly_fraction must be in (0, 1]");
  require(isFraction(l.max_bet_pct), "trading.max_bet_pct must be in (0, 1]");
  require(isFraction(l.max_daily_loss_pct),
          "trading.max_daily_loss_pct must be in (0, 1]");
  require(isFraction(l.max_volume_pct),
          "trading.max_volume_pct must be in (0, 1]");
  require(std::isfinite(l.min_edge) && l.min_edge >= 0.0 && l.min_edge < 1.0,
          "trading.min_edge must be in [0, 1)");
  require(l.max_concurrent_positions >= 1,
          "trading.max_concurrent_positions must be at least 1");
  require(std::isfinite(trading.min_confidence) &&
              trading.min_confidence >= 0.0 && trading.min_confidence <= 10.0,
          "trading.min_confidence must be in [0, 10]");

  require(std::isfinite(fees.taker_fee_rate) && fees.taker_fee_rate >= 0.0 &&
              fees.taker_fee_rate < 1.0,
          "fees.taker_fee_rate must be in [0, 1)");
  require(std::isfinite(fees.slippage.impact_coefficient) &&
              fees.slippage.impact_coefficient >= 0.0,
          "fees.slippage.impact_coefficient must be non-negative");
  require(std::isfinite(fees.slippage.max_slippage) &&
              fees.slippage.max_slippage >= 0.0 &&
              fees.slippage.max_slippage < 1.0,
          "fees.slippage.max_slippage must be in [0, 1)");

  require(loop.interval_ms > 0, "loop.interval_seconds must be positive");
  require(loop.max_quote_age_ms >= 0,
          "loop.max_quote_age_seconds must be non-negative");

  require(retry.max_attempts >= 1, "retry.max_attempts must be at least 1");
  require(retry.initial_backoff.count() >= 0,
          "retry.initial_backoff_ms must be non-negative");
  require(std::isfinite(retry.multiplier) && retry.multiplier >= 1.0,
          "retry.multiplier must be at least 1");
  require(retry.max_backoff >= retry.initial_backoff,
          "retry.max_backoff_ms must be >= retry.initial_backoff_ms");
  require(retry.timeout.count() > 0, "retry.timeout_ms must be positive");

  require(std::isfinite(kill_switch.max_drawdown_pct) &&
              kill_switch.max_drawdown_pct >= 0.0 &&
              kill_switch.max_drawdown_pct <= 1.0,
          "kill_switch.max_drawdown_pct must be in [0, 1]");
  require(kill_switch.max_consecutive_failures >= 0,
          "kill_switch.max_consecutive_failures must be non-negative");

  require(news_speed.options.max_markets_per_cycle >= 1,
          "strategies.news_speed.max_markets_per_cycle must be at least 1");

  if (trading.mode == domain::TradingMode::Paper) {
    require(!paths.journal_dir.empty(), "paths.journal_dir must be set");
  }

  require(backtest.period_hours > 0, "backtest.period_hours must be positive");
  if (!backtest.start.empty() || !backtest.end.empty()) {
    const auto start = time_utils::parseIsoTimestamp(backtest.start);
    const auto end = time_utils::parseIsoTimestamp(backtest.end);
    require(start.has_value(), "backtest.start must be a date or timestamp");
    require(end.has_value(), "backtest.end must be a date or timestamp");
    require(*end > *start, "backtest.end must be after backtest.start");
  }
}

}  // namespace predict
