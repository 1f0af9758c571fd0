// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for nanotrade::EventBus.
//
// Validates:
//   - Generic subscription receives every event alternative
//   - Typed subscription receives only its own alternative
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - A subscriber may publish from inside its callback (the tick processor
//     publishes reports from its MarketTickEvent callback)
//   - Payloads survive the variant dispatch path
//
// All tests are single-threaded. Cross-thread delivery through the tick loop
// is covered in detection_engine_test.cpp.
// =============================================================================

#include "nanotrade/eventbus/event_bus.hpp"
#include "nanotrade/events/event.hpp"
#include "nanotrade/events/event_types.hpp"

#include <gtest/gtest.h>

class EventBusTest : public ::testing::Test {
 protected:
  nanotrade::EventBus bus;

  static nanotrade::MarketTickEvent makeTick(nanotrade::domain::EventKind kind,
                                             std::uint16_t value,
                                             std::uint64_t seq = 0) {
    nanotrade::MarketTickEvent e;
    e.input.kind = kind;
    e.input.value = value;
    e.sequence_id = seq;
    return e;
  }

  static nanotrade::BreakerTransitionEvent makeTransition(
      nanotrade::domain::BreakerMode to) {
    nanotrade::BreakerTransitionEvent e;
    e.from = nanotrade::domain::BreakerMode::Normal;
    e.to = to;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every alternative.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const nanotrade::Event&) { ++call_count; });

  bus.publish(makeTick(nanotrade::domain::EventKind::Price, 100));
  bus.publish(nanotrade::TickReportEvent{});
  bus.publish(makeTransition(nanotrade::domain::BreakerMode::Pause));
  bus.publish(nanotrade::CascadeEvent{});

  EXPECT_EQ(call_count, 4);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered alternative.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int tick_count = 0;
  bus.subscribe<nanotrade::MarketTickEvent>(
      [&tick_count](const nanotrade::MarketTickEvent&) { ++tick_count; });

  bus.publish(makeTick(nanotrade::domain::EventKind::Volume, 50));
  bus.publish(nanotrade::TickReportEvent{});
  bus.publish(nanotrade::CascadeEvent{});

  EXPECT_EQ(tick_count, 1);
}

// -----------------------------------------------------------------------------
// 3. Every subscriber of an alternative receives the event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int a = 0;
  int b = 0;
  bus.subscribe<nanotrade::CascadeEvent>(
      [&a](const nanotrade::CascadeEvent&) { ++a; });
  bus.subscribe<nanotrade::CascadeEvent>(
      [&b](const nanotrade::CascadeEvent&) { ++b; });

  bus.publish(nanotrade::CascadeEvent{});

  EXPECT_EQ(a, 1);
  EXPECT_EQ(b, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id) the callback no longer fires.
// Why: components unsubscribe in their destructors; a late delivery would
//      touch a destroyed object.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<nanotrade::MarketTickEvent>(
      [&call_count](const nanotrade::MarketTickEvent&) { ++call_count; });

  bus.publish(makeTick(nanotrade::domain::EventKind::Price, 100));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  bus.publish(makeTick(nanotrade::domain::EventKind::Price, 101));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 5. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeUnknownIdAndPublishWithNoSubscribers) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(
      bus.publish(makeTick(nanotrade::domain::EventKind::Buy, 10)));
}

// -----------------------------------------------------------------------------
// 6. A subscriber may publish inside its callback without deadlocking.
//
// Scenario: the MarketTickEvent subscriber publishes a TickReportEvent, the
//           same shape as the tick processor on the tick loop.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int reports = 0;

  bus.subscribe<nanotrade::TickReportEvent>(
      [&reports](const nanotrade::TickReportEvent&) { ++reports; });

  bus.subscribe<nanotrade::MarketTickEvent>(
      [this](const nanotrade::MarketTickEvent& tick) {
        nanotrade::TickReportEvent report;
        report.tick = tick.sequence_id;
        report.input = tick.input;
        bus.publish(report);
      });

  bus.publish(makeTick(nanotrade::domain::EventKind::Price, 100, 1));

  EXPECT_EQ(reports, 1);
}

// -----------------------------------------------------------------------------
// 7. Field values survive publish and dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  nanotrade::BreakerTransitionEvent received;

  bus.subscribe<nanotrade::BreakerTransitionEvent>(
      [&received](const nanotrade::BreakerTransitionEvent& e) {
        received = e;
      });

  auto sent = makeTransition(nanotrade::domain::BreakerMode::Throttle);
  sent.tick = 812;
  sent.countdown = 119;
  bus.publish(sent);

  EXPECT_EQ(received.tick, 812u);
  EXPECT_EQ(received.from, nanotrade::domain::BreakerMode::Normal);
  EXPECT_EQ(received.to, nanotrade::domain::BreakerMode::Throttle);
  EXPECT_EQ(received.countdown, 119);
}
