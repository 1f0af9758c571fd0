// =============================================================================
// order_book_test.cpp
// =============================================================================
// Unit tests for stepOrderBook() and the book views.
//
// Validates:
//   - Insertion into the first free slot, full sides drop silently
//   - Matching is decided on the book as it stood at the start of the tick
//   - Trades print at the ask price and free both slots
//   - Equal prices resolve to the earliest arrival, also past 256 arrivals
//   - A slot freed by a match is not reused on the same tick
//   - Policy gates: frozen book, orders refused, widened spread
// =============================================================================

#include "nanotrade/book/order_book.hpp"

#include <gtest/gtest.h>

using nanotrade::OrderBookState;
using nanotrade::OrderBookStep;
using nanotrade::domain::EventKind;
using nanotrade::domain::MarketEvent;
using nanotrade::domain::PolicyDirectives;

class OrderBookTest : public ::testing::Test {
 protected:
  OrderBookState book;
  PolicyDirectives open{};

  OrderBookStep step(EventKind kind, std::uint16_t value) {
    return step(kind, value, open);
  }

  OrderBookStep step(EventKind kind, std::uint16_t value,
                     const PolicyDirectives& policy) {
    OrderBookStep s = nanotrade::stepOrderBook(book, MarketEvent{kind, value},
                                               policy);
    book = s.next;
    return s;
  }

  OrderBookStep idle() { return step(EventKind::Price, 0); }
};

// -----------------------------------------------------------------------------
// 1. Orders fill slots in order; a fifth order on a full side is dropped.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, InsertAndDropWhenFull) {
  for (int i = 0; i < 5; ++i) {
    auto s = step(EventKind::Buy, static_cast<std::uint16_t>(10 + i));
    EXPECT_FALSE(s.match.valid);
  }
  EXPECT_EQ(nanotrade::bidCount(book), nanotrade::kBookDepth);
  EXPECT_EQ(nanotrade::askCount(book), 0u);
  EXPECT_EQ(*nanotrade::bestBid(book), 13);
  EXPECT_EQ(book.bids[0].price, 10);
}

// -----------------------------------------------------------------------------
// 2. A crossing order does not match on the tick it arrives; the following
//    tick matches at the ask price and frees both slots.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, MatchOnFollowingTickAtAskPrice) {
  step(EventKind::Buy, 12);
  auto arrival = step(EventKind::Sell, 10);
  EXPECT_FALSE(arrival.match.valid);
  EXPECT_EQ(nanotrade::askCount(book), 1u);

  auto s = idle();
  ASSERT_TRUE(s.match.valid);
  EXPECT_EQ(s.match.price, 10);
  EXPECT_EQ(nanotrade::bidCount(book), 0u);
  EXPECT_EQ(nanotrade::askCount(book), 0u);

  EXPECT_FALSE(idle().match.valid);
}

// -----------------------------------------------------------------------------
// 3. No match while the book is not crossed, nor with a side empty.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, NoMatchWhenNotCrossed) {
  step(EventKind::Buy, 9);
  EXPECT_FALSE(idle().match.valid);
  step(EventKind::Sell, 10);
  EXPECT_FALSE(idle().match.valid);
  EXPECT_EQ(nanotrade::bidCount(book), 1u);
  EXPECT_EQ(nanotrade::askCount(book), 1u);
}

// -----------------------------------------------------------------------------
// 4. Among equal prices the earliest arrival trades first, including after
//    an older slot has been recycled.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, EqualPricesTradeInArrivalOrder) {
  step(EventKind::Buy, 10);   // slot 0, arrival 0
  step(EventKind::Buy, 10);   // slot 1, arrival 1
  EXPECT_EQ(*nanotrade::bestBidSlot(book), 0u);

  step(EventKind::Sell, 10);  // arrival 2
  auto s = idle();
  ASSERT_TRUE(s.match.valid);
  EXPECT_FALSE(book.bids[0].occupied);
  EXPECT_TRUE(book.bids[1].occupied);

  step(EventKind::Buy, 10);   // reuses slot 0, arrival 3
  EXPECT_TRUE(book.bids[0].occupied);
  EXPECT_EQ(*nanotrade::bestBidSlot(book), 1u);
}

// -----------------------------------------------------------------------------
// 5. A slot freed by this tick's match is not available to this tick's order.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, FreedSlotNotReusedSameTick) {
  step(EventKind::Buy, 20);
  step(EventKind::Buy, 1);
  step(EventKind::Buy, 1);
  step(EventKind::Buy, 1);
  step(EventKind::Sell, 15);

  auto s = step(EventKind::Buy, 5);
  ASSERT_TRUE(s.match.valid);
  EXPECT_EQ(s.match.price, 15);
  EXPECT_EQ(nanotrade::bidCount(book), 3u);
  EXPECT_FALSE(book.bids[0].occupied);
}

// -----------------------------------------------------------------------------
// 6. allow_match == false freezes the book: no insertion, no match.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, PausedBookIsFrozen) {
  step(EventKind::Buy, 12);
  step(EventKind::Sell, 10);

  PolicyDirectives paused{false, false, 0};
  auto s = step(EventKind::Buy, 30, paused);
  EXPECT_FALSE(s.match.valid);
  EXPECT_EQ(nanotrade::bidCount(book), 1u);
  EXPECT_EQ(nanotrade::askCount(book), 1u);

  EXPECT_TRUE(idle().match.valid);
}

// -----------------------------------------------------------------------------
// 7. allow_order == false refuses new orders but resting orders still trade.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, RefusedOrdersStillMatch) {
  step(EventKind::Buy, 12);
  step(EventKind::Sell, 10);

  PolicyDirectives throttled{false, true, 0};
  auto s = step(EventKind::Sell, 5, throttled);
  EXPECT_TRUE(s.match.valid);
  EXPECT_EQ(nanotrade::askCount(book), 0u);
}

// -----------------------------------------------------------------------------
// 8. A spread guard demands the bid clear the ask by that many levels.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, SpreadGuardWidensCrossing) {
  PolicyDirectives widened{true, true, 2};

  step(EventKind::Buy, 11, widened);
  step(EventKind::Sell, 10, widened);
  EXPECT_FALSE(step(EventKind::Price, 0, widened).match.valid);

  step(EventKind::Buy, 12, widened);
  auto s = step(EventKind::Price, 0, widened);
  ASSERT_TRUE(s.match.valid);
  EXPECT_EQ(s.match.price, 10);
  EXPECT_EQ(*nanotrade::bestBid(book), 11);
}

// -----------------------------------------------------------------------------
// 9. Arrival order survives more than 256 insertions: a bid resting since
//    arrival 0 still beats an equal bid that arrived 200 orders later.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, ArrivalOrderSurvivesLongRest) {
  // Sell 100 against a buy at 120; the pair trades on the idle tick and
  // frees both slots, leaving the bids at 10 untouched.
  auto cycle = [this] {
    step(EventKind::Sell, 100);
    step(EventKind::Buy, 120);
    ASSERT_TRUE(idle().match.valid);
  };

  step(EventKind::Buy, 10);  // slot 0, arrival 0
  for (int i = 0; i < 100; ++i) cycle();
  ASSERT_EQ(book.next_arrival, 201u);

  step(EventKind::Buy, 10);  // slot 1, arrival 201
  ASSERT_TRUE(book.bids[1].occupied);
  for (int i = 0; i < 30; ++i) cycle();
  ASSERT_EQ(book.next_arrival, 262u);
  EXPECT_EQ(*nanotrade::bestBidSlot(book), 0u);

  step(EventKind::Sell, 5);
  auto s = idle();
  ASSERT_TRUE(s.match.valid);
  EXPECT_EQ(s.match.price, 5);
  EXPECT_FALSE(book.bids[0].occupied);
  EXPECT_TRUE(book.bids[1].occupied);
}
