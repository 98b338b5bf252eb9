// =============================================================================
// kelly_sizer_test.cpp
// =============================================================================
// Unit tests for predict::KellySizer and the kellyFraction() formula.
//
// Validates:
//   - kellyFraction(0.6, 1.0, 0.5) == 0.1 and the formula over a grid of p, b
//   - Stake capped at max_bet_pct of bankroll
//   - Zero stake for non-positive edge, odds, bankroll or configuration
// =============================================================================

#include "predict/sizing/kelly_sizer.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using predict::KellySizer;
using predict::SizingParams;
using predict_test::Direction;
using predict_test::makeSignal;

TEST(KellyFractionTest, EvenOddsSixtyPercent) {
  EXPECT_NEAR(predict::kellyFraction(0.6, 1.0, 0.5), 0.1, 1e-12);
  EXPECT_NEAR(predict::kellyFraction(0.6, 1.0, 1.0), 0.2, 1e-12);
}

TEST(KellyFractionTest, MatchesFormulaAcrossInputs) {
  for (double p = 0.0; p <= 1.0001; p += 0.1) {
    for (double b : {0.1, 0.5, 1.0, 2.5, 9.0}) {
      const double expected = std::max(0.0, (p * b - (1.0 - p)) / b) * 0.5;
      EXPECT_NEAR(predict::kellyFraction(p, b, 0.5), expected, 1e-12)
          << "p=" << p << " b=" << b;
    }
  }
}

TEST(KellyFractionTest, NegativeKellyClampsToZero) {
  EXPECT_DOUBLE_EQ(predict::kellyFraction(0.3, 1.0, 0.5), 0.0);
  EXPECT_DOUBLE_EQ(predict::kellyFraction(0.9, 0.0, 0.5), 0.0);
}

TEST(KellyFractionTest, DecimalOddsFromPrice) {
  EXPECT_NEAR(predict::decimalOddsFromPrice(0.5), 1.0, 1e-12);
  EXPECT_NEAR(predict::decimalOddsFromPrice(0.25), 3.0, 1e-12);
  EXPECT_DOUBLE_EQ(predict::decimalOddsFromPrice(0.0), 0.0);
}

// -----------------------------------------------------------------------------
// Sizer: half-Kelly of a strong signal hits the 5% cap.
// -----------------------------------------------------------------------------
TEST(KellySizerTest, StakeCappedAtMaxBetPct) {
  KellySizer sizer(SizingParams{0.5, 0.05});
  // p = 0.75 at 0.60: b = 2/3, raw = (0.5 - 0.25) / (2/3) = 0.375.
  const auto s = makeSignal("m1", Direction::Yes, 0.75, 0.60, 0.15);

  const auto sizing = sizer.size(s, 500.0);

  EXPECT_NEAR(sizing.raw_kelly, 0.375, 1e-12);
  EXPECT_NEAR(sizing.stake_fraction, 0.05, 1e-12);
  EXPECT_NEAR(sizing.stake_amount, 25.0, 1e-9);
}

TEST(KellySizerTest, UncappedStakeIsScaledKelly) {
  KellySizer sizer(SizingParams{0.5, 0.5});
  const auto s = makeSignal("m1", Direction::Yes, 0.6, 0.5, 0.1);

  const auto sizing = sizer.size(s, 1000.0);

  EXPECT_NEAR(sizing.stake_fraction, 0.1, 1e-12);
  EXPECT_NEAR(sizing.stake_amount, 100.0, 1e-9);
}

TEST(KellySizerTest, ZeroStakeForNonPositiveInputs) {
  const auto good = makeSignal("m1", Direction::Yes, 0.75, 0.60, 0.15);

  KellySizer sizer(SizingParams{0.5, 0.05});
  EXPECT_DOUBLE_EQ(sizer.size(0.75, 0.60, 0.0, 500.0).stake_amount, 0.0);
  EXPECT_DOUBLE_EQ(sizer.size(0.75, 0.60, -0.1, 500.0).stake_amount, 0.0);
  EXPECT_DOUBLE_EQ(sizer.size(good, 0.0).stake_amount, 0.0);
  EXPECT_DOUBLE_EQ(sizer.size(good, -10.0).stake_amount, 0.0);
  EXPECT_DOUBLE_EQ(sizer.size(0.75, 1.0, 0.15, 500.0).stake_amount, 0.0);

  EXPECT_DOUBLE_EQ(KellySizer(SizingParams{0.0, 0.05}).size(good, 500.0)
                       .stake_amount,
                   0.0);
  EXPECT_DOUBLE_EQ(KellySizer(SizingParams{0.5, 0.0}).size(good, 500.0)
                       .stake_amount,
                   0.0);
}

TEST(KellySizerTest, SameInputsSameStake) {
  KellySizer sizer(SizingParams{0.25, 0.2});
  const auto s = makeSignal("m1", Direction::No, 0.58, 0.47, 0.11);
  EXPECT_DOUBLE_EQ(sizer.size(s, 731.5).stake_amount,
                   sizer.size(s, 731.5).stake_amount);
}
