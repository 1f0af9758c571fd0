#pragma once

#include "nanotrade/domain/market_event.hpp"
#include "nanotrade/stats/rolling_window.hpp"

#include <cstdint>

namespace nanotrade {

constexpr std::size_t kStatsWindow = 8;
constexpr std::uint8_t kWindowBoundaryTick = 255;

// -----------------------------------------------------------------------------
// RollingStatistics
// -----------------------------------------------------------------------------
//
// @brief  Per-tick market statistics shared by the rule detector and the
//         feature extractor.
//
// @details
// Price and volume windows only ever see non-zero samples; the idle
// encoding never dilutes an average.
//
// Order and match counters are windowed. They accumulate for 256 ticks
// (window_tick 0..255) and are halved at each window boundary rather than
// reset, so a burst straddling a boundary still counts.
//
// match_baseline is a slow average of matches per window. Quote stuffing is
// judged against it, which keeps a naturally busy book from looking
// stuffed.
// -----------------------------------------------------------------------------
struct RollingStatistics {
  RollingWindow<kStatsWindow> price_window;
  RollingWindow<kStatsWindow> volume_window;

  // Mean absolute deviation of price, exponentially smoothed (1/8).
  std::uint16_t mad{0};

  std::uint16_t buy_count{0};
  std::uint16_t sell_count{0};
  std::uint16_t match_count{0};
  std::uint16_t match_baseline{0};
  std::uint8_t window_tick{0};

  std::uint16_t last_price{0};
  std::int16_t last_move{0};
  std::int16_t prev_move{0};
  std::uint16_t last_volume{0};
  std::uint16_t ticks_since_match{0};

  std::uint16_t priceAverage() const { return price_window.average(); }
  std::uint16_t volumeAverage() const { return volume_window.average(); }

  // Detectors stay silent until both windows hold real samples only.
  bool warm() const { return price_window.full() && volume_window.full(); }
};

// -----------------------------------------------------------------------------
// stepStatistics(stats, event, matched)
// -----------------------------------------------------------------------------
//
// @brief  Computes next tick's statistics.
//
// @param  stats    Statistics committed at the end of the previous tick.
// @param  event    This tick's decoded event.
// @param  matched  Whether the order book matched on this tick.
//
// @details
//   - Price sample (non-zero): MAD is updated against the previous average
//     if the price window was already full, then the sample is pushed. The
//     price move is recorded once a previous price exists.
//   - Volume sample (non-zero): pushed into the volume window.
//   - Buy / Sell: the matching counter increments, saturating at 65535.
//   - matched: match_count increments and ticks_since_match restarts at 0;
//     otherwise ticks_since_match counts up, saturating.
//   - window_tick == 255: after this tick's increments every windowed
//     counter is halved, the baseline absorbs half the window's matches,
//     and window_tick wraps to 0.
// -----------------------------------------------------------------------------
RollingStatistics stepStatistics(const RollingStatistics& stats,
                                 const domain::MarketEvent& event,
                                 bool matched);

}  // namespace nanotrade
