// =============================================================================
// trading_pipeline_test.cpp
// =============================================================================
// Tests for predict::TradingPipeline: one candidate through edge, sizing,
// risk and execution, with the journal as witness.
//
// Validates:
//   - Accepted signal: bet journaled before it is committed, ids increase
//   - Every rejection stage is journaled with its stage and reason
//   - Execution refusals map to named reasons and change nothing
//   - Slippage re-pricing never increases the stake
// =============================================================================

#include "predict/engine/trading_pipeline.hpp"
#include "predict/execution/execution_simulator.hpp"
#include "predict/storage/in_memory_journal.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

using predict::PipelineOutcome;
using predict_test::Direction;
using predict_test::kDay0;
using predict_test::makeQuote;
using predict_test::makeRaw;

namespace {

predict::domain::RiskLimits looseLimits() {
  predict::domain::RiskLimits limits;
  limits.max_bet_pct = 0.10;
  return limits;
}

// Sink that records the engine's bet count at the moment of each appendBet.
class WitnessJournal : public predict::IPersistenceSink {
 public:
  explicit WitnessJournal(const predict::IExecutionEngine& engine)
      : engine_(engine) {}

  void appendSignal(const predict::SignalRecord& record) override {
    inner_.appendSignal(record);
  }
  void appendBet(const predict::domain::Bet& bet) override {
    bets_in_engine_at_append.push_back(engine_.bets().size());
    inner_.appendBet(bet);
  }
  void appendResolution(const predict::domain::Resolution& r) override {
    inner_.appendResolution(r);
  }
  void appendEquitySample(const predict::domain::EquitySample& s) override {
    inner_.appendEquitySample(s);
  }
  std::vector<predict::SignalRecord> loadSignals() const override {
    return inner_.loadSignals();
  }
  std::vector<predict::domain::Bet> loadBets() const override {
    return inner_.loadBets();
  }
  std::vector<predict::domain::Resolution> loadResolutions() const override {
    return inner_.loadResolutions();
  }
  std::vector<predict::domain::EquitySample> loadEquitySamples() const override {
    return inner_.loadEquitySamples();
  }

  std::vector<std::size_t> bets_in_engine_at_append;

 private:
  const predict::IExecutionEngine& engine_;
  predict::InMemoryJournal inner_;
};

}  // namespace

class TradingPipelineTest : public ::testing::Test {
 protected:
  TradingPipelineTest()
      : evaluator(predict::EdgeParams{}),
        sizer(predict::SizingParams{}),
        risk(looseLimits()),
        simulator(500.0),
        journal(simulator),
        pipeline(evaluator, sizer, risk, simulator, journal, ids,
                 predict::domain::TradingMode::Paper, &bus) {
    simulator.rollDay(predict::time_utils::dayKey(kDay0));
    quote = makeQuote("m1", 0.55);
  }

  PipelineOutcome run(const predict::domain::RawSignal& raw) {
    const auto candidate = pipeline.screen(raw, &quote, kDay0);
    return pipeline.act(candidate, kDay0);
  }

  predict::EdgeEvaluator evaluator;
  predict::KellySizer sizer;
  predict::RiskManager risk;
  predict::ExecutionSimulator simulator;
  WitnessJournal journal;
  predict::BetIdGenerator ids;
  predict::EventBus bus;
  predict::TradingPipeline pipeline;
  predict::domain::MarketQuote quote;
};

// -----------------------------------------------------------------------------
// 1. Accepted: journal first, then engine.
// -----------------------------------------------------------------------------
TEST_F(TradingPipelineTest, AcceptedSignalIsJournaledThenPlaced) {
  const auto out = run(makeRaw("m1", Direction::Yes, 0.70));

  ASSERT_TRUE(out.placed);
  EXPECT_EQ(out.stage, predict::stage::kPlaced);
  ASSERT_TRUE(out.bet.has_value());
  EXPECT_EQ(out.bet->id, 1u);
  EXPECT_EQ(out.bet->mode, predict::domain::TradingMode::Paper);
  EXPECT_NEAR(out.bet->signal.edge, 0.15, 1e-12);
  EXPECT_NEAR(out.bet->kelly_fraction_applied, 0.05, 1e-12);
  EXPECT_NEAR(out.stake, 25.0, 1e-9);

  ASSERT_EQ(journal.bets_in_engine_at_append.size(), 1u);
  EXPECT_EQ(journal.bets_in_engine_at_append[0], 0u);
  EXPECT_EQ(simulator.bets().size(), 1u);

  const auto signals = journal.loadSignals();
  ASSERT_EQ(signals.size(), 1u);
  EXPECT_TRUE(signals[0].accepted);
  EXPECT_EQ(signals[0].bet_id, 1u);
}

// -----------------------------------------------------------------------------
// 2. Rejections carry their stage and reason into the journal.
// -----------------------------------------------------------------------------
TEST_F(TradingPipelineTest, EdgeRejectionIsJournaled) {
  const auto out = run(makeRaw("m1", Direction::Yes, 0.57));

  EXPECT_FALSE(out.placed);
  EXPECT_EQ(out.stage, predict::stage::kEdge);
  EXPECT_EQ(out.reason, "BELOW_MIN_EDGE");
  EXPECT_TRUE(simulator.bets().empty());

  const auto signals = journal.loadSignals();
  ASSERT_EQ(signals.size(), 1u);
  EXPECT_FALSE(signals[0].accepted);
  EXPECT_EQ(signals[0].stage, "EDGE");
}

TEST_F(TradingPipelineTest, UnknownMarketKeepsRawIdentity) {
  const auto candidate =
      pipeline.screen(makeRaw("ghost", Direction::No, 0.7), nullptr, kDay0);
  const auto out = pipeline.act(candidate, kDay0);

  EXPECT_FALSE(out.placed);
  EXPECT_EQ(out.stage, predict::stage::kEdge);
  EXPECT_EQ(out.signal.market_id, "ghost");
  EXPECT_EQ(out.signal.direction, Direction::No);
}

TEST_F(TradingPipelineTest, RiskRejectionPublishesEvent) {
  std::vector<predict::RiskRejectEvent> rejects;
  bus.subscribe<predict::RiskRejectEvent>(
      [&rejects](const predict::RiskRejectEvent& e) { rejects.push_back(e); });

  quote.volume_24h = 100.0;  // 10% of volume = 10 < 25 stake
  const auto out = run(makeRaw("m1", Direction::Yes, 0.70));

  EXPECT_FALSE(out.placed);
  EXPECT_EQ(out.stage, predict::stage::kRisk);
  EXPECT_EQ(out.reason, "MARKET_VOLUME");
  ASSERT_EQ(rejects.size(), 1u);
  EXPECT_EQ(rejects[0].market_id, "m1");
  EXPECT_TRUE(journal.loadBets().empty());
}

// -----------------------------------------------------------------------------
// 3. Execution refusals: nothing journaled as a bet, nothing committed.
// -----------------------------------------------------------------------------
TEST_F(TradingPipelineTest, OppositeDirectionIsPositionConflict) {
  ASSERT_TRUE(run(makeRaw("m1", Direction::Yes, 0.70)).placed);
  const double bankroll = simulator.riskState().bankroll;

  auto raw = makeRaw("m1", Direction::No, 0.80);
  const auto out = run(raw);

  EXPECT_FALSE(out.placed);
  EXPECT_EQ(out.stage, predict::stage::kExecution);
  EXPECT_EQ(out.reason, "POSITION_CONFLICT");
  EXPECT_DOUBLE_EQ(simulator.riskState().bankroll, bankroll);
  EXPECT_EQ(journal.loadBets().size(), 1u);
  EXPECT_EQ(journal.loadSignals().size(), 2u);
}

TEST_F(TradingPipelineTest, ResolvedMarketIsRefused) {
  ASSERT_TRUE(run(makeRaw("m1", Direction::Yes, 0.70)).placed);
  simulator.resolve(predict::domain::Resolution{"m1", Direction::No, kDay0});

  const auto out = run(makeRaw("m1", Direction::Yes, 0.70));
  EXPECT_EQ(out.reason, "MARKET_RESOLVED");
  EXPECT_EQ(simulator.bets().size(), 1u);
}

// -----------------------------------------------------------------------------
// 4. With slippage the stake is sized on the worse price, never above the
//    first sizing.
// -----------------------------------------------------------------------------
TEST(TradingPipelineSlippageTest, SlippageNeverRaisesStake) {
  predict::EdgeParams params;
  params.fees.slippage.impact_coefficient = 0.5;
  params.fees.slippage.max_slippage = 0.05;
  predict::EdgeEvaluator evaluator(params);
  predict::SizingParams sizing;
  sizing.max_bet_pct = 1.0;
  predict::KellySizer sizer(sizing);
  predict::domain::RiskLimits limits;
  limits.max_bet_pct = 1.0;
  limits.max_volume_pct = 1.0;
  predict::RiskManager risk(limits);
  predict::ExecutionSimulator simulator(500.0);
  predict::InMemoryJournal journal;
  predict::BetIdGenerator ids;
  predict::TradingPipeline pipeline(evaluator, sizer, risk, simulator, journal,
                                    ids, predict::domain::TradingMode::Backtest);

  auto quote = makeQuote("m1", 0.40, 100000.0);
  quote.book_depth = 1000.0;
  const auto candidate =
      pipeline.screen(makeRaw("m1", Direction::Yes, 0.70), &quote, kDay0);
  const double unslipped =
      sizer.size(candidate.screened.signal, 500.0).stake_amount;

  const auto out = pipeline.act(candidate, kDay0);

  ASSERT_TRUE(out.placed);
  EXPECT_GT(out.bet->execution_price, 0.40);
  EXPECT_LE(out.stake, unslipped + 1e-9);
}
