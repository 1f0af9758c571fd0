#pragma once

#include "nanotrade/book/order_book.hpp"
#include "nanotrade/stats/rolling_statistics.hpp"

#include <array>
#include <cstdint>

namespace nanotrade {

constexpr std::size_t kFeatureCount = 16;
constexpr std::uint8_t kSnapshotTick = 255;

using FeatureVector = std::array<std::uint8_t, kFeatureCount>;

// Feature slots. Values offset by 128 are signed quantities recentred on
// the middle of the byte.
enum class Feature : std::uint8_t {
  ShortDelta = 0,
  AverageDeviation = 1,
  LongDelta = 2,
  VolumeRatio = 3,
  SpreadProxy = 4,
  Imbalance = 5,
  Volatility = 6,
  ArrivalRate = 7,
  CancelRate = 8,
  BuyDepth = 9,
  SellDepth = 10,
  TicksSinceMatch = 11,
  OrderLifespan = 12,
  TradeFrequency = 13,
  Momentum = 14,
  Reserved = 15,
};

struct FeatureExtractorState {
  std::uint8_t tick{0};
  std::uint16_t snapshot_price{0};  // last_price at the previous snapshot
  FeatureVector features{};
  bool valid{false};  // true for exactly one tick per snapshot
};

// -----------------------------------------------------------------------------
// stepFeatures(state, stats, book)
// -----------------------------------------------------------------------------
//
// @brief  Counts ticks and snapshots the market every 256 of them.
//
// @param  stats  Statistics as committed at the start of this tick.
// @param  book   Order book as committed at the start of this tick.
//
// @details
// On tick index 255 of the extractor's own counter the 16 features are
// computed, `valid` is raised for that tick only and the snapshot price is
// remembered for the next long delta. On every other tick the previous
// vector is kept and `valid` drops.
//
//    0  short delta          last_move + 128
//    1  average deviation    last_price - price_avg + 128
//    2  long delta           last_price - previous snapshot price + 128
//    3  volume ratio         last_volume * 64 / volume_avg (64 if avg is 0)
//    4  spread proxy         |best_ask - best_bid| * 4, 0 on a one-sided book
//    5  imbalance            (buys - sells) * 128 / (buys + sells) + 128
//    6  volatility           MAD * 4
//    7  arrival rate         buys + sells
//    8  cancel rate          10 (no cancels on this feed)
//    9  buy depth            resting bids * 60
//   10  sell depth           resting asks * 60
//   11  ticks since match
//   12  order lifespan       200 (not tracked)
//   13  trade frequency      match_count
//   14  momentum             last_move - prev_move + 128
//   15  reserved             128
//
// Every value is clamped to [0, 255].
// -----------------------------------------------------------------------------
FeatureExtractorState stepFeatures(const FeatureExtractorState& state,
                                   const RollingStatistics& stats,
                                   const OrderBookState& book);

// The snapshot itself, exposed for tests.
FeatureVector extractFeatures(const RollingStatistics& stats,
                              const OrderBookState& book,
                              std::uint16_t previous_snapshot_price);

}  // namespace nanotrade
