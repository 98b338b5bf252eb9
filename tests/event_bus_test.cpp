// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for predict::EventBus.
//
// Validates:
//   - Generic (all-event) subscription receives every event type
//   - Typed subscription receives only the matching event type
//   - Multiple subscribers all receive the same published event
//   - Unsubscribe stops delivery; unknown ids and empty buses are harmless
//   - Re-entrant publish (subscriber publishes inside callback), no deadlock
//   - Payload fields survive the variant dispatch path
// =============================================================================

#include "predict/eventbus/event_bus.hpp"
#include "predict/events/event.hpp"
#include "predict/events/event_types.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  predict::EventBus bus;

  static predict::SignalEvaluatedEvent makeEvaluated(const std::string& market,
                                                     bool accepted) {
    predict::SignalEvaluatedEvent e;
    e.signal = predict_test::makeSignal(market, predict_test::Direction::Yes,
                                        0.7, 0.55, 0.15);
    e.accepted = accepted;
    e.reason = accepted ? "PLACED" : "BELOW_MIN_EDGE";
    e.timestamp_ms = predict_test::kDay0;
    return e;
  }

  static predict::TickEvent makeTick(std::uint64_t n) {
    predict::TickEvent e;
    e.tick_number = n;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber sees every event type (the IPC telemetry bridge).
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const predict::Event&) { ++call_count; });

  bus.publish(makeEvaluated("m1", true));
  bus.publish(makeTick(1));
  bus.publish(predict::RiskViolationEvent{"MAX_DRAWDOWN", 0.3, 0.25, 0});

  EXPECT_EQ(call_count, 3);
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int tick_count = 0;
  bus.subscribe<predict::TickEvent>(
      [&tick_count](const predict::TickEvent&) { ++tick_count; });

  bus.publish(makeTick(1));
  bus.publish(makeEvaluated("m1", false));

  EXPECT_EQ(tick_count, 1);
}

TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;
  bus.subscribe<predict::TickEvent>(
      [&count_a](const predict::TickEvent&) { ++count_a; });
  bus.subscribe<predict::TickEvent>(
      [&count_b](const predict::TickEvent&) { ++count_b; });

  bus.publish(makeTick(7));

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
}

// -----------------------------------------------------------------------------
// 3. unsubscribe(id) stops future delivery.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<predict::TickEvent>(
      [&call_count](const predict::TickEvent&) { ++call_count; });

  bus.publish(makeTick(1));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  bus.publish(makeTick(2));
  EXPECT_EQ(call_count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

TEST_F(EventBusTest, UnknownIdAndEmptyBusAreHarmless) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeTick(1)));
}

// -----------------------------------------------------------------------------
// 4. A subscriber may publish from inside its callback.
//    Scenario: a rejected signal triggers a RiskRejectEvent.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int rejects = 0;
  bus.subscribe<predict::RiskRejectEvent>(
      [&rejects](const predict::RiskRejectEvent&) { ++rejects; });
  bus.subscribe<predict::SignalEvaluatedEvent>(
      [this](const predict::SignalEvaluatedEvent& e) {
        if (!e.accepted) {
          bus.publish(predict::RiskRejectEvent{e.signal.market_id, e.reason, "",
                                               e.timestamp_ms});
        }
      });

  bus.publish(makeEvaluated("m1", false));
  bus.publish(makeEvaluated("m2", true));

  EXPECT_EQ(rejects, 1);
}

// -----------------------------------------------------------------------------
// 5. Field values survive publish -> dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  std::string market;
  double edge = 0.0;
  bool accepted = false;
  bus.subscribe<predict::SignalEvaluatedEvent>(
      [&](const predict::SignalEvaluatedEvent& e) {
        market = e.signal.market_id;
        edge = e.signal.edge;
        accepted = e.accepted;
      });

  bus.publish(makeEvaluated("fed-march", true));

  EXPECT_EQ(market, "fed-march");
  EXPECT_DOUBLE_EQ(edge, 0.15);
  EXPECT_TRUE(accepted);
}
