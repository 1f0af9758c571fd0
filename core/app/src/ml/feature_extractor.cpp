#include "nanotrade/ml/feature_extractor.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>

namespace nanotrade {

namespace {

std::uint8_t clampByte(std::int64_t v) {
  return static_cast<std::uint8_t>(std::clamp<std::int64_t>(v, 0, 255));
}

void set(FeatureVector& f, Feature slot, std::int64_t value) {
  f[static_cast<std::size_t>(slot)] = clampByte(value);
}

}  // namespace

FeatureVector extractFeatures(const RollingStatistics& stats,
                              const OrderBookState& book,
                              std::uint16_t previous_snapshot_price) {
  FeatureVector f{};

  const std::int64_t last_price = stats.last_price;
  const std::int64_t buys = stats.buy_count;
  const std::int64_t sells = stats.sell_count;

  set(f, Feature::ShortDelta, stats.last_move + 128);
  set(f, Feature::AverageDeviation, last_price - stats.priceAverage() + 128);
  set(f, Feature::LongDelta, last_price - previous_snapshot_price + 128);

  const std::int64_t vol_avg = stats.volumeAverage();
  set(f, Feature::VolumeRatio,
      vol_avg == 0 ? 64 : (static_cast<std::int64_t>(stats.last_volume) * 64) / vol_avg);

  const auto bid = bestBid(book);
  const auto ask = bestAsk(book);
  set(f, Feature::SpreadProxy,
      (bid && ask) ? std::abs(static_cast<int>(*ask) - static_cast<int>(*bid)) * 4
                   : 0);

  const std::int64_t total = buys + sells;
  set(f, Feature::Imbalance, total == 0 ? 128 : (buys - sells) * 128 / total + 128);

  set(f, Feature::Volatility, static_cast<std::int64_t>(stats.mad) * 4);
  set(f, Feature::ArrivalRate, total);
  set(f, Feature::CancelRate, 10);
  set(f, Feature::BuyDepth, static_cast<std::int64_t>(bidCount(book)) * 60);
  set(f, Feature::SellDepth, static_cast<std::int64_t>(askCount(book)) * 60);
  set(f, Feature::TicksSinceMatch, stats.ticks_since_match);
  set(f, Feature::OrderLifespan, 200);
  set(f, Feature::TradeFrequency, stats.match_count);
  set(f, Feature::Momentum,
      static_cast<std::int64_t>(stats.last_move) - stats.prev_move + 128);
  set(f, Feature::Reserved, 128);

  return f;
}

FeatureExtractorState stepFeatures(const FeatureExtractorState& state,
                                   const RollingStatistics& stats,
                                   const OrderBookState& book) {
  FeatureExtractorState next = state;
  next.tick = static_cast<std::uint8_t>(state.tick + 1);
  next.valid = false;

  if (state.tick == kSnapshotTick) {
    next.features = extractFeatures(stats, book, state.snapshot_price);
    next.snapshot_price = stats.last_price;
    next.valid = true;
  }
  return next;
}

}  // namespace nanotrade
