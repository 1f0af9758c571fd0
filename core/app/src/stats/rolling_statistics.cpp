#include "nanotrade/stats/rolling_statistics.hpp"

#include <cstdlib>
#include <limits>

namespace nanotrade {

namespace {

std::uint16_t saturatingIncrement(std::uint16_t v) {
  return v == std::numeric_limits<std::uint16_t>::max()
             ? v
             : static_cast<std::uint16_t>(v + 1);
}

}  // namespace

RollingStatistics stepStatistics(const RollingStatistics& stats,
                                 const domain::MarketEvent& event,
                                 bool matched) {
  RollingStatistics next = stats;

  if (domain::isPriceSample(event)) {
    const int price = event.value;

    if (stats.price_window.full()) {
      const int deviation = std::abs(price - stats.priceAverage());
      next.mad = static_cast<std::uint16_t>(stats.mad - (stats.mad >> 3) +
                                            (deviation >> 3));
    }
    next.price_window.push(event.value);

    if (stats.last_price != 0) {
      next.prev_move = stats.last_move;
      next.last_move = static_cast<std::int16_t>(price - stats.last_price);
    }
    next.last_price = event.value;
  } else if (domain::isVolumeSample(event)) {
    next.volume_window.push(event.value);
    next.last_volume = event.value;
  } else if (event.kind == domain::EventKind::Buy) {
    next.buy_count = saturatingIncrement(stats.buy_count);
  } else if (event.kind == domain::EventKind::Sell) {
    next.sell_count = saturatingIncrement(stats.sell_count);
  }

  if (matched) {
    next.match_count = saturatingIncrement(stats.match_count);
    next.ticks_since_match = 0;
  } else {
    next.ticks_since_match = saturatingIncrement(stats.ticks_since_match);
  }

  if (stats.window_tick == kWindowBoundaryTick) {
    next.match_baseline = static_cast<std::uint16_t>(
        (stats.match_baseline >> 1) + (next.match_count >> 1));
    next.buy_count = static_cast<std::uint16_t>(next.buy_count >> 1);
    next.sell_count = static_cast<std::uint16_t>(next.sell_count >> 1);
    next.match_count = static_cast<std::uint16_t>(next.match_count >> 1);
    next.window_tick = 0;
  } else {
    next.window_tick = static_cast<std::uint8_t>(stats.window_tick + 1);
  }

  return next;
}

}  // namespace nanotrade
