// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Unit tests for predict::EngineConfig.
//
// Validates:
//   - Defaults are valid and match the paper-trading settings
//   - fromJson overrides only the keys present, numbers may be strings
//   - ${VAR} interpolation from the environment
//   - Type and range errors raise ConfigError
//   - loadFile falls back to defaults when the file is missing
// =============================================================================

#include "predict/config/engine_config.hpp"
#include "predict/domain/errors.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

using nlohmann::json;
using predict::ConfigError;
using predict::EngineConfig;
using predict::EquitySampling;
using predict_test::ScratchDir;

TEST(EngineConfigTest, DefaultsAreValid) {
  const EngineConfig cfg;
  EXPECT_NO_THROW(cfg.validate());
  EXPECT_EQ(cfg.trading.mode, predict::domain::TradingMode::Paper);
  EXPECT_DOUBLE_EQ(cfg.trading.bankroll, 500.0);
  EXPECT_DOUBLE_EQ(cfg.trading.kelly_fraction, 0.5);
  EXPECT_DOUBLE_EQ(cfg.trading.limits.max_bet_pct, 0.05);
  EXPECT_EQ(cfg.loop.interval_ms, 60000);
  EXPECT_EQ(cfg.loop.equity_sampling, EquitySampling::PerTick);
  EXPECT_EQ(cfg.loop.metrics_series, predict::EquitySeries::Bankroll);
  EXPECT_TRUE(cfg.kill_switch.enabled);
}

TEST(EngineConfigTest, FromJsonOverridesPresentKeys) {
  const json j = {
      {"trading",
       {{"mode", "backtest"},
        {"bankroll", 1000},
        {"min_edge", "0.08"},
        {"max_concurrent_positions", 3}}},
      {"fees", {{"taker_fee_rate", 0.02}, {"slippage", {{"max_slippage", 0.03}}}}},
      {"loop",
       {{"interval_seconds", 1.5},
        {"equity_sampling", "PER_DAY"},
        {"metrics_series", "Equity"}}},
      {"retry", {{"max_attempts", 5}, {"initial_backoff_ms", 50}}},
      {"kill_switch", {{"enabled", "no"}}},
      {"backtest", {{"start", "2024-03-01"}, {"end", "2024-03-08"}}}};

  const auto cfg = EngineConfig::fromJson(j);

  EXPECT_EQ(cfg.trading.mode, predict::domain::TradingMode::Backtest);
  EXPECT_DOUBLE_EQ(cfg.trading.bankroll, 1000.0);
  EXPECT_DOUBLE_EQ(cfg.trading.limits.min_edge, 0.08);
  EXPECT_EQ(cfg.trading.limits.max_concurrent_positions, 3);
  EXPECT_DOUBLE_EQ(cfg.trading.kelly_fraction, 0.5);
  EXPECT_DOUBLE_EQ(cfg.fees.taker_fee_rate, 0.02);
  EXPECT_DOUBLE_EQ(cfg.fees.slippage.max_slippage, 0.03);
  EXPECT_EQ(cfg.loop.interval_ms, 1500);
  EXPECT_EQ(cfg.loop.equity_sampling, EquitySampling::PerDay);
  EXPECT_EQ(cfg.loop.metrics_series, predict::EquitySeries::Equity);
  EXPECT_EQ(cfg.retry.max_attempts, 5);
  EXPECT_EQ(cfg.retry.initial_backoff.count(), 50);
  EXPECT_FALSE(cfg.kill_switch.enabled);
  EXPECT_NO_THROW(cfg.validate());

  const auto edge = cfg.edgeParams();
  EXPECT_DOUBLE_EQ(edge.min_edge, 0.08);
  EXPECT_DOUBLE_EQ(edge.fees.taker_fee_rate, 0.02);
  const auto sizing = cfg.sizingParams();
  EXPECT_DOUBLE_EQ(sizing.kelly_fraction, 0.5);
  EXPECT_DOUBLE_EQ(sizing.max_bet_pct, 0.05);
}

TEST(EngineConfigTest, NewsSpeedConfidenceOverridesGlobalFloor) {
  const json j = {
      {"trading", {{"min_confidence", 6}}},
      {"strategies",
       {{"news_speed", {{"min_confidence", 7.5}, {"max_markets_per_cycle", 2}}}}}};

  const auto cfg = EngineConfig::fromJson(j);

  EXPECT_DOUBLE_EQ(cfg.trading.min_confidence, 7.5);
  EXPECT_DOUBLE_EQ(cfg.edgeParams().min_confidence, 7.5);
  EXPECT_EQ(cfg.news_speed.options.max_markets_per_cycle, 2);
}

TEST(EngineConfigTest, InterpolatesEnvironmentVariables) {
  ::setenv("PREDICT_TEST_JOURNAL", "/var/predict", 1);
  ::unsetenv("PREDICT_TEST_UNSET");

  EXPECT_EQ(predict::interpolateEnv("${PREDICT_TEST_JOURNAL}/journal"),
            "/var/predict/journal");
  EXPECT_EQ(predict::interpolateEnv("x${PREDICT_TEST_UNSET}y"), "xy");
  EXPECT_EQ(predict::interpolateEnv("no vars"), "no vars");
  EXPECT_EQ(predict::interpolateEnv("open ${brace"), "open ${brace");

  const json j = {{"paths", {{"journal_dir", "${PREDICT_TEST_JOURNAL}/j"}}}};
  EXPECT_EQ(EngineConfig::fromJson(j).paths.journal_dir, "/var/predict/j");
}

TEST(EngineConfigTest, TypeErrorsRaiseConfigError) {
  EXPECT_THROW(EngineConfig::fromJson(json::array()), ConfigError);
  EXPECT_THROW(EngineConfig::fromJson({{"trading", 5}}), ConfigError);
  EXPECT_THROW(EngineConfig::fromJson({{"trading", {{"bankroll", "lots"}}}}),
               ConfigError);
  EXPECT_THROW(EngineConfig::fromJson({{"trading", {{"mode", "yolo"}}}}),
               ConfigError);
  EXPECT_THROW(
      EngineConfig::fromJson({{"trading", {{"max_concurrent_positions", 2.5}}}}),
      ConfigError);
  EXPECT_THROW(EngineConfig::fromJson({{"kill_switch", {{"enabled", "maybe"}}}}),
               ConfigError);
  EXPECT_THROW(EngineConfig::fromJson({{"paths", {{"news_file", 3}}}}),
               ConfigError);
  EXPECT_THROW(EngineConfig::fromJson({{"loop", {{"equity_sampling", "hourly"}}}}),
               ConfigError);
  EXPECT_THROW(EngineConfig::fromJson({{"loop", {{"metrics_series", "pnl"}}}}),
               ConfigError);
}

TEST(EngineConfigTest, ValidateRejectsOutOfRangeValues) {
  auto expectInvalid = [](auto mutate) {
    EngineConfig cfg;
    mutate(cfg);
    EXPECT_THROW(cfg.validate(), ConfigError);
  };

  expectInvalid([](EngineConfig& c) { c.trading.bankroll = 0.0; });
  expectInvalid([](EngineConfig& c) { c.trading.kelly_fraction = 1.5; });
  expectInvalid([](EngineConfig& c) { c.trading.limits.max_bet_pct = 0.0; });
  expectInvalid([](EngineConfig& c) { c.trading.limits.min_edge = -0.1; });
  expectInvalid([](EngineConfig& c) { c.trading.limits.max_concurrent_positions = 0; });
  expectInvalid([](EngineConfig& c) { c.trading.min_confidence = 11.0; });
  expectInvalid([](EngineConfig& c) { c.fees.taker_fee_rate = 1.0; });
  expectInvalid([](EngineConfig& c) { c.loop.interval_ms = 0; });
  expectInvalid([](EngineConfig& c) { c.retry.max_attempts = 0; });
  expectInvalid([](EngineConfig& c) { c.retry.multiplier = 0.5; });
  expectInvalid([](EngineConfig& c) {
    c.retry.max_backoff = std::chrono::milliseconds(10);
  });
  expectInvalid([](EngineConfig& c) { c.kill_switch.max_drawdown_pct = 1.5; });
  expectInvalid([](EngineConfig& c) { c.backtest.period_hours = 0; });
  expectInvalid([](EngineConfig& c) {
    c.backtest.start = "2024-03-08";
    c.backtest.end = "2024-03-01";
  });
  expectInvalid([](EngineConfig& c) {
    c.backtest.start = "yesterday";
    c.backtest.end = "2024-03-01";
  });
}

TEST(EngineConfigTest, LoadFileMissingUsesDefaults) {
  ScratchDir dir;
  const auto cfg = EngineConfig::loadFile(dir.path() / "absent.json");
  EXPECT_DOUBLE_EQ(cfg.trading.bankroll, 500.0);
}

TEST(EngineConfigTest, LoadFileParsesAndRejectsMalformed) {
  ScratchDir dir;
  const auto good = dir.path() / "settings.json";
  {
    std::ofstream out(good);
    out << R"({"trading": {"bankroll": 750, "kelly_fraction": 0.25}})";
  }
  const auto cfg = EngineConfig::loadFile(good);
  EXPECT_DOUBLE_EQ(cfg.trading.bankroll, 750.0);
  EXPECT_DOUBLE_EQ(cfg.trading.kelly_fraction, 0.25);

  const auto bad = dir.path() / "broken.json";
  {
    std::ofstream out(bad);
    out << "{ not json";
  }
  EXPECT_THROW(EngineConfig::loadFile(bad), ConfigError);
}
