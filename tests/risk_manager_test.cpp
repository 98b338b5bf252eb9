// =============================================================================
// risk_manager_test.cpp
// =============================================================================
// Unit tests for predict::RiskManager.
//
// Validates:
//   - Each gate as a total function over explicit arguments
//   - Gate order: the first failing check is the reported reason
//   - Halt / resume, including from another thread
// =============================================================================

#include "predict/risk/risk_manager.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <thread>

using predict::MarketExposure;
using predict::RiskCheck;
using predict::RiskManager;
using predict_test::Direction;
using predict_test::makeSignal;

class RiskManagerTest : public ::testing::Test {
 protected:
  predict::domain::RiskLimits limits;  // defaults: 0.05 / 10 / 0.10 / 0.10 / 0.05
  predict::domain::RiskState state;

  void SetUp() override {
    state.bankroll = 500.0;
    state.start_of_day_bankroll = 500.0;
    state.daily_pnl = 0.0;
    state.open_position_count = 0;
  }

  static MarketExposure liquid() {
    MarketExposure m;
    m.volume_24h = 100000.0;
    return m;
  }
};

// -----------------------------------------------------------------------------
// 1. Edge 0.03 under a 0.05 minimum is rejected with MIN_EDGE.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, RejectsEdgeBelowMinimum) {
  RiskManager rm(limits);
  const auto signal = makeSignal("m1", Direction::Yes, 0.63, 0.60, 0.03);

  const auto d = rm.check(signal, 10.0, state, liquid());

  EXPECT_FALSE(d.accepted);
  EXPECT_EQ(d.reason, RiskCheck::MinEdge);
  EXPECT_STREQ(predict::toString(d.reason), "MIN_EDGE");
}

TEST_F(RiskManagerTest, AcceptsSignalWithinAllLimits) {
  RiskManager rm(limits);
  const auto signal = makeSignal("m1", Direction::Yes, 0.75, 0.60, 0.15);

  const auto d = rm.check(signal, 25.0, state, liquid());

  EXPECT_TRUE(d.accepted);
  EXPECT_EQ(d.reason, RiskCheck::Passed);
}

// -----------------------------------------------------------------------------
// 2. Max concurrent counts a new market only; adding to an open one is fine.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, MaxConcurrentProjectsNewMarketsOnly) {
  EXPECT_TRUE(RiskManager::checkMaxConcurrent(9, false, 10).accepted);
  EXPECT_FALSE(RiskManager::checkMaxConcurrent(10, false, 10).accepted);
  EXPECT_TRUE(RiskManager::checkMaxConcurrent(10, true, 10).accepted);
  EXPECT_EQ(RiskManager::checkMaxConcurrent(10, false, 10).reason,
            RiskCheck::MaxConcurrent);
}

// -----------------------------------------------------------------------------
// 3. Daily loss: floor is -pct x start-of-day bankroll, inclusive.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, DailyLossFloor) {
  EXPECT_TRUE(RiskManager::checkDailyLoss(-50.0, 500.0, 0.10).accepted);
  EXPECT_FALSE(RiskManager::checkDailyLoss(-50.01, 500.0, 0.10).accepted);
  EXPECT_TRUE(RiskManager::checkDailyLoss(120.0, 500.0, 0.10).accepted);
}

TEST_F(RiskManagerTest, MarketVolumeCap) {
  EXPECT_TRUE(RiskManager::checkMarketVolume(100.0, 1000.0, 0.10).accepted);
  EXPECT_FALSE(RiskManager::checkMarketVolume(100.5, 1000.0, 0.10).accepted);
  EXPECT_FALSE(RiskManager::checkMarketVolume(1.0, 0.0, 0.10).accepted);
}

TEST_F(RiskManagerTest, MarketExposureIncludesExistingPosition) {
  // Cap = 0.05 * 500 = 25.
  EXPECT_TRUE(RiskManager::checkMarketExposure(0.0, 25.0, 500.0, 0.05).accepted);
  EXPECT_TRUE(RiskManager::checkMarketExposure(15.0, 10.0, 500.0, 0.05).accepted);
  const auto d = RiskManager::checkMarketExposure(20.0, 10.0, 500.0, 0.05);
  EXPECT_FALSE(d.accepted);
  EXPECT_EQ(d.reason, RiskCheck::MarketExposure);
}

// -----------------------------------------------------------------------------
// 4. The gates short-circuit in order: a signal failing both daily loss
//    and volume reports DAILY_LOSS.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, FirstFailingGateIsReported) {
  RiskManager rm(limits);
  const auto signal = makeSignal("m1", Direction::Yes, 0.75, 0.60, 0.15);
  state.daily_pnl = -80.0;
  MarketExposure thin;
  thin.volume_24h = 10.0;

  const auto d = rm.check(signal, 25.0, state, thin);

  EXPECT_FALSE(d.accepted);
  EXPECT_EQ(d.reason, RiskCheck::DailyLoss);

  state.daily_pnl = 0.0;
  EXPECT_EQ(rm.check(signal, 25.0, state, thin).reason,
            RiskCheck::MarketVolume);
}

// -----------------------------------------------------------------------------
// 5. Halt rejects everything ahead of the other gates until resumed.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, HaltAndResume) {
  RiskManager rm(limits);
  const auto signal = makeSignal("m1", Direction::Yes, 0.75, 0.60, 0.15);

  std::thread operator_thread([&rm] { rm.haltTrading("operator"); });
  operator_thread.join();

  EXPECT_TRUE(rm.isHalted());
  EXPECT_EQ(rm.haltReason(), "operator");
  const auto d = rm.check(signal, 25.0, state, liquid());
  EXPECT_EQ(d.reason, RiskCheck::TradingHalted);
  EXPECT_EQ(d.detail, "operator");

  rm.resumeTrading();
  EXPECT_FALSE(rm.isHalted());
  EXPECT_TRUE(rm.check(signal, 25.0, state, liquid()).accepted);
}
