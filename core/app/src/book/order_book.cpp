#include "nanotrade/book/order_book.hpp"

namespace nanotrade {

namespace {

using Side = std::array<OrderBookEntry, kBookDepth>;

// Age of an entry relative to the next arrival number. Sequence numbers
// wrap, so "older" is the larger distance back from next_arrival.
std::uint32_t ageOf(const OrderBookEntry& e, std::uint32_t next_arrival) {
  return next_arrival - e.arrival;
}

// Best slot on one side. better(a, b) is true when price a beats price b.
template <typename Better>
std::optional<std::size_t> bestSlot(const Side& side,
                                    std::uint32_t next_arrival,
                                    Better better) {
  std::optional<std::size_t> best;
  for (std::size_t i = 0; i < side.size(); ++i) {
    if (!side[i].occupied) {
      continue;
    }
    if (!best) {
      best = i;
      continue;
    }
    const OrderBookEntry& cur = side[*best];
    if (better(side[i].price, cur.price) ||
        (side[i].price == cur.price &&
         ageOf(side[i], next_arrival) > ageOf(cur, next_arrival))) {
      best = i;
    }
  }
  return best;
}

std::optional<std::size_t> firstFree(const Side& side) {
  for (std::size_t i = 0; i < side.size(); ++i) {
    if (!side[i].occupied) {
      return i;
    }
  }
  return std::nullopt;
}

std::size_t occupiedCount(const Side& side) {
  std::size_t n = 0;
  for (const auto& e : side) {
    if (e.occupied) {
      ++n;
    }
  }
  return n;
}

}  // namespace

// -----------------------------------------------------------------------------
// Read-only views
// -----------------------------------------------------------------------------
std::optional<std::size_t> bestBidSlot(const OrderBookState& state) {
  return bestSlot(state.bids, state.next_arrival,
                  [](std::uint8_t a, std::uint8_t b) { return a > b; });
}

std::optional<std::size_t> bestAskSlot(const OrderBookState& state) {
  return bestSlot(state.asks, state.next_arrival,
                  [](std::uint8_t a, std::uint8_t b) { return a < b; });
}

std::optional<std::uint8_t> bestBid(const OrderBookState& state) {
  auto slot = bestBidSlot(state);
  if (!slot) {
    return std::nullopt;
  }
  return state.bids[*slot].price;
}

std::optional<std::uint8_t> bestAsk(const OrderBookState& state) {
  auto slot = bestAskSlot(state);
  if (!slot) {
    return std::nullopt;
  }
  return state.asks[*slot].price;
}

std::size_t bidCount(const OrderBookState& state) {
  return occupiedCount(state.bids);
}

std::size_t askCount(const OrderBookState& state) {
  return occupiedCount(state.asks);
}

// -----------------------------------------------------------------------------
// stepOrderBook()
// -----------------------------------------------------------------------------
OrderBookStep stepOrderBook(const OrderBookState& state,
                            const domain::MarketEvent& event,
                            const domain::PolicyDirectives& policy) {
  OrderBookStep step{state, MatchResult{}};

  if (!policy.allow_match) {
    return step;
  }

  // --- Matching: decided on the book as it stood at the start of the tick --
  const auto bid_slot = bestBidSlot(state);
  const auto ask_slot = bestAskSlot(state);
  if (bid_slot && ask_slot) {
    const unsigned bid = state.bids[*bid_slot].price;
    const unsigned ask = state.asks[*ask_slot].price;
    if (bid >= ask + policy.spread_guard) {
      step.match.valid = true;
      step.match.price = static_cast<std::uint8_t>(ask);
      step.next.bids[*bid_slot] = OrderBookEntry{};
      step.next.asks[*ask_slot] = OrderBookEntry{};
    }
  }

  // --- Admission: first slot free at the start of the tick -----------------
  if (policy.allow_order && domain::isOrder(event)) {
    const bool is_buy = event.kind == domain::EventKind::Buy;
    const Side& side_now = is_buy ? state.bids : state.asks;
    Side& side_next = is_buy ? step.next.bids : step.next.asks;

    if (auto slot = firstFree(side_now)) {
      side_next[*slot].price =
          static_cast<std::uint8_t>(event.value & kBookPriceMask);
      side_next[*slot].arrival = state.next_arrival;
      side_next[*slot].occupied = true;
      step.next.next_arrival = state.next_arrival + 1;
    }
  }

  return step;
}

}  // namespace nanotrade
