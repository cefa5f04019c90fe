// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for breakout::EventBus.
//
// Validates:
//   - Generic subscription receives every event kind
//   - Typed subscription receives only the matching kind
//   - Unsubscribe stops delivery; unknown ids are harmless
//   - Re-entrant publish (subscriber publishes inside callback), no deadlock
//   - A throwing subscriber is counted and does not starve the others
//
// All tests are single-threaded. Cross-thread delivery through the publish
// loop is covered in tracker_engine_test.cpp.
// =============================================================================

#include "breakout/eventbus/event_bus.hpp"
#include "breakout/events/event.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

class EventBusTest : public ::testing::Test {
 protected:
  breakout::EventBus bus;

  static breakout::NotificationEvent makeNewLow(const std::string& instrument,
                                                double old_low,
                                                double new_low) {
    breakout::NotificationEvent e;
    e.strategy_id = 1;
    e.instrument_id = instrument;
    e.kind = breakout::NotificationKind::NewLow;
    e.old_value = old_low;
    e.new_value = new_low;
    e.drop_percent = breakout::domain::dropPercent(old_low, new_low);
    return e;
  }

  static breakout::PhaseChangeEvent makePhaseChange(
      breakout::domain::StrategyId id) {
    breakout::PhaseChangeEvent e;
    e.strategy_id = id;
    e.from = breakout::domain::StrategyPhase::Pending;
    e.to = breakout::domain::StrategyPhase::Lookback;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber (the telemetry bridge) sees every kind.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const breakout::Event&) { ++call_count; });

  bus.publish(makeNewLow("NSE_FO|1", 60.0, 55.0));
  bus.publish(makePhaseChange(1));
  bus.publish(breakout::StrategyRemovedEvent{1, 0});
  bus.publish(breakout::EngineStatusEvent{});

  EXPECT_EQ(call_count, 4);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber (the console alert sink) fires only for its kind.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int notification_count = 0;
  bus.subscribe<breakout::NotificationEvent>(
      [&notification_count](const breakout::NotificationEvent&) {
        ++notification_count;
      });

  bus.publish(makeNewLow("NSE_FO|1", 60.0, 55.0));
  bus.publish(makePhaseChange(1));

  EXPECT_EQ(notification_count, 1);
}

TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;

  bus.subscribe<breakout::PhaseChangeEvent>(
      [&count_a](const breakout::PhaseChangeEvent&) { ++count_a; });
  bus.subscribe<breakout::PhaseChangeEvent>(
      [&count_b](const breakout::PhaseChangeEvent&) { ++count_b; });

  bus.publish(makePhaseChange(7));

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<breakout::NotificationEvent>(
      [&call_count](const breakout::NotificationEvent&) { ++call_count; });

  bus.publish(makeNewLow("NSE_FO|1", 60.0, 55.0));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);

  bus.publish(makeNewLow("NSE_FO|1", 55.0, 50.0));
  EXPECT_EQ(call_count, 1);
}

TEST_F(EventBusTest, UnsubscribeNonExistentIdIsNoOp) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
}

TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_NO_FATAL_FAILURE(bus.publish(makePhaseChange(1)));
}

// -----------------------------------------------------------------------------
// 3. Publishing from inside a callback must not deadlock: the subscriber
//    list is copied before callbacks run.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int removed_received = 0;

  bus.subscribe<breakout::StrategyRemovedEvent>(
      [&removed_received](const breakout::StrategyRemovedEvent&) {
        ++removed_received;
      });

  bus.subscribe<breakout::PhaseChangeEvent>(
      [this](const breakout::PhaseChangeEvent& e) {
        bus.publish(breakout::StrategyRemovedEvent{e.strategy_id, 0});
      });

  bus.publish(makePhaseChange(3));

  EXPECT_EQ(removed_received, 1);
}

// -----------------------------------------------------------------------------
// 4. A sink that throws is logged and counted; later subscribers still get
//    the event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberDoesNotStarveOthers) {
  int delivered = 0;

  bus.subscribe([](const breakout::Event&) {
    throw std::runtime_error("sink offline");
  });
  bus.subscribe([&delivered](const breakout::Event&) { ++delivered; });

  bus.publish(makePhaseChange(1));
  bus.publish(makePhaseChange(2));

  EXPECT_EQ(delivered, 2);
  EXPECT_EQ(bus.subscriberFailures(), 2u);
}

TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  std::string instrument;
  double new_low = 0.0;
  std::optional<double> drop;

  bus.subscribe<breakout::NotificationEvent>(
      [&](const breakout::NotificationEvent& e) {
        instrument = e.instrument_id;
        new_low = e.new_value;
        drop = e.drop_percent;
      });

  bus.publish(makeNewLow("NSE_FO|52910", 80.0, 60.0));

  EXPECT_EQ(instrument, "NSE_FO|52910");
  EXPECT_DOUBLE_EQ(new_low, 60.0);
  ASSERT_TRUE(drop.has_value());
  EXPECT_DOUBLE_EQ(*drop, 25.0);
}
