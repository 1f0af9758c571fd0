#pragma once

#include "nanotrade/domain/breaker.hpp"
#include "nanotrade/domain/market_event.hpp"

#include <array>
#include <cstdint>
#include <optional>

namespace nanotrade {

constexpr std::size_t kBookDepth = 4;           // slots per side
constexpr std::uint8_t kBookPriceMask = 0x7F;   // 7-bit price levels

// -----------------------------------------------------------------------------
// OrderBookEntry
// -----------------------------------------------------------------------------
// One resting order. arrival is a 32-bit wrapping sequence number used only
// to order entries resting at the same price (earliest first).
// -----------------------------------------------------------------------------
struct OrderBookEntry {
  std::uint8_t price{0};
  std::uint32_t arrival{0};
  bool occupied{false};
};

// -----------------------------------------------------------------------------
// OrderBookState
// -----------------------------------------------------------------------------
//
// @brief  The complete mutable state of the order book engine.
//
// @details
// Fixed arrays, no allocation. bids and asks are owned exclusively by the
// order book engine; other components read a committed snapshot of the
// previous tick and never write it.
// -----------------------------------------------------------------------------
struct OrderBookState {
  std::array<OrderBookEntry, kBookDepth> bids{};
  std::array<OrderBookEntry, kBookDepth> asks{};
  std::uint32_t next_arrival{0};
};

struct MatchResult {
  bool valid{false};
  std::uint8_t price{0};
};

struct OrderBookStep {
  OrderBookState next;
  MatchResult match;
};

// -----------------------------------------------------------------------------
// stepOrderBook(state, event, policy)
// -----------------------------------------------------------------------------
//
// @brief  Advances the order book by one tick.
//
// @param  state   Book as committed at the end of the previous tick.
// @param  event   This tick's decoded event.
// @param  policy  Admission policy from the circuit breaker's previous state.
//
// @return The next book state and this tick's match output.
//
// @details
// Everything is decided from `state`, as it stood at the start of the tick:
//
//   1. allow_match == false: the book is frozen. The input state is
//      returned unchanged and no match is reported.
//   2. Best bid / best ask are taken from occupied slots of `state`.
//   3. If both sides are non-empty and best_bid >= best_ask + spread_guard,
//      the two orders trade at the ask price (the resting maker's price)
//      and both slots are freed in the next state.
//   4. If allow_order and the event is a Buy/Sell, the order goes into the
//      first slot of its side that was free in `state`. A slot freed by
//      this tick's match is not reused until the next tick. A full side
//      drops the order without error.
//
// At most one match per tick. A match never happens with either side
// empty.
// -----------------------------------------------------------------------------
OrderBookStep stepOrderBook(const OrderBookState& state,
                            const domain::MarketEvent& event,
                            const domain::PolicyDirectives& policy);

// Read-only views used by the rule detector, feature extractor and tests.
std::optional<std::size_t> bestBidSlot(const OrderBookState& state);
std::optional<std::size_t> bestAskSlot(const OrderBookState& state);
std::optional<std::uint8_t> bestBid(const OrderBookState& state);
std::optional<std::uint8_t> bestAsk(const OrderBookState& state);
std::size_t bidCount(const OrderBookState& state);
std::size_t askCount(const OrderBookState& state);

}  // namespace nanotrade
