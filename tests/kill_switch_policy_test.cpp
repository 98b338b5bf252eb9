// =============================================================================
// kill_switch_policy_test.cpp
// =============================================================================
// Unit tests for predict::KillSwitchPolicy.
// =============================================================================

#include "predict/risk/kill_switch_policy.hpp"

#include <gtest/gtest.h>

using predict::KillSwitchParams;
using predict::KillSwitchPolicy;
using predict::PerformanceMetrics;

namespace {

PerformanceMetrics withDrawdown(double dd) {
  PerformanceMetrics m;
  m.current_drawdown = dd;
  m.equity_drawdown = dd;
  m.max_drawdown = dd;
  return m;
}

}  // namespace

TEST(KillSwitchPolicyTest, TripsOnCurrentDrawdown) {
  KillSwitchPolicy policy(KillSwitchParams{true, 0.25, 5});

  EXPECT_FALSE(policy.evaluate(withDrawdown(0.24), 0).trip);

  const auto v = policy.evaluate(withDrawdown(0.25), 0);
  EXPECT_TRUE(v.trip);
  EXPECT_EQ(v.reason, "MAX_DRAWDOWN");
  EXPECT_DOUBLE_EQ(v.current_value, 0.25);
  EXPECT_DOUBLE_EQ(v.limit_value, 0.25);
}

TEST(KillSwitchPolicyTest, RecoveredCurveDoesNotTrip) {
  KillSwitchPolicy policy(KillSwitchParams{true, 0.25, 5});
  PerformanceMetrics m;
  m.max_drawdown = 0.40;
  m.current_drawdown = 0.0;
  m.equity_drawdown = 0.0;
  EXPECT_FALSE(policy.evaluate(m, 0).trip);
}

TEST(KillSwitchPolicyTest, CashDeployedInPositionsDoesNotTrip) {
  KillSwitchPolicy policy(KillSwitchParams{true, 0.25, 5});
  PerformanceMetrics m;
  m.current_drawdown = 0.40;
  m.max_drawdown = 0.40;
  m.equity_drawdown = 0.0;
  EXPECT_FALSE(policy.evaluate(m, 0).trip);

  m.equity_drawdown = 0.30;
  const auto v = policy.evaluate(m, 0);
  EXPECT_TRUE(v.trip);
  EXPECT_DOUBLE_EQ(v.current_value, 0.30);
}

TEST(KillSwitchPolicyTest, TripsOnConsecutiveFailures) {
  KillSwitchPolicy policy(KillSwitchParams{true, 0.25, 3});

  EXPECT_FALSE(policy.evaluate(PerformanceMetrics{}, 2).trip);
  const auto v = policy.evaluate(PerformanceMetrics{}, 3);
  EXPECT_TRUE(v.trip);
  EXPECT_EQ(v.reason, "CONSECUTIVE_FAILURES");
  EXPECT_DOUBLE_EQ(v.current_value, 3.0);
}

TEST(KillSwitchPolicyTest, DisabledOrZeroLimitsNeverTrip) {
  KillSwitchPolicy off(KillSwitchParams{false, 0.25, 3});
  EXPECT_FALSE(off.evaluate(withDrawdown(0.9), 10).trip);

  KillSwitchPolicy zero(KillSwitchParams{true, 0.0, 0});
  EXPECT_FALSE(zero.evaluate(withDrawdown(0.9), 10).trip);
}
