#include "nanotrade/detect/rule_detector.hpp"

#include <array>
#include <cstdlib>

namespace nanotrade {

namespace {

using domain::AlertType;

bool flashCrash(const RollingStatistics& s, const domain::MarketEvent& e,
                const domain::Thresholds& th) {
  if (!domain::isPriceSample(e)) {
    return false;
  }
  const int drop = static_cast<int>(s.priceAverage()) - e.value;
  return drop > static_cast<int>(th.flash);
}

bool priceSpike(const RollingStatistics& s, const domain::MarketEvent& e,
                const domain::Thresholds& th) {
  if (!domain::isPriceSample(e)) {
    return false;
  }
  const int deviation = std::abs(static_cast<int>(e.value) - s.priceAverage());
  return deviation > static_cast<int>(th.spike) &&
         deviation > 4 * static_cast<int>(s.mad);
}

bool volumeSurge(const RollingStatistics& s, const domain::MarketEvent& e,
                 const domain::Thresholds& th) {
  if (!domain::isVolumeSample(e)) {
    return false;
  }
  const unsigned avg = s.volumeAverage();
  return e.value > 3u * avg && avg > th.volume_floor;
}

bool orderImbalance(unsigned buys, unsigned sells) {
  const unsigned dominant = buys > sells ? buys : sells;
  const unsigned other = buys > sells ? sells : buys;
  return dominant > kImbalanceRatio * other && dominant >= kImbalanceMinOrders;
}

bool quoteStuffing(const RollingStatistics& s, unsigned buys, unsigned sells) {
  const unsigned total = buys + sells;
  const unsigned baseline = s.match_baseline;
  return total > kStuffingMinTotal && buys > kStuffingMinSide &&
         sells > kStuffingMinSide && baseline > kStuffingMinBaseline &&
         total > kStuffingBaselineRatio * baseline &&
         s.window_tick >= kStuffingMinWindowTick;
}

bool tradeVelocity(const RollingStatistics& s, const domain::MarketEvent& e,
                   const domain::Thresholds& th) {
  if (!domain::isPriceSample(e) || s.last_price == 0) {
    return false;
  }
  const int move = static_cast<int>(e.value) - s.last_price;
  const int previous = s.last_move;
  const int limit = th.spike;
  const bool same_sign = (move > 0 && previous > 0) || (move < 0 && previous < 0);
  return same_sign && std::abs(move) > limit && std::abs(previous) > limit;
}

}  // namespace

// -----------------------------------------------------------------------------
// evaluateRules()
// -----------------------------------------------------------------------------
domain::AlertRecord evaluateRules(const RollingStatistics& stats,
                                  const domain::MarketEvent& event,
                                  const domain::Thresholds& thresholds) {
  domain::AlertRecord record;
  if (!stats.warm()) {
    return record;
  }

  // Counters as they will stand once this tick's order is counted.
  const unsigned buys =
      stats.buy_count + (event.kind == domain::EventKind::Buy ? 1u : 0u);
  const unsigned sells =
      stats.sell_count + (event.kind == domain::EventKind::Sell ? 1u : 0u);

  std::array<bool, domain::kAlertTypeCount> fired{};
  fired[static_cast<std::size_t>(AlertType::FlashCrash)] =
      flashCrash(stats, event, thresholds);
  fired[static_cast<std::size_t>(AlertType::PriceSpike)] =
      priceSpike(stats, event, thresholds);
  fired[static_cast<std::size_t>(AlertType::VolumeSurge)] =
      volumeSurge(stats, event, thresholds);
  fired[static_cast<std::size_t>(AlertType::OrderImbalance)] =
      orderImbalance(buys, sells);
  fired[static_cast<std::size_t>(AlertType::QuoteStuffing)] =
      quoteStuffing(stats, buys, sells);
  fired[static_cast<std::size_t>(AlertType::TradeVelocity)] =
      tradeVelocity(stats, event, thresholds);

  for (std::uint8_t i = 0; i < domain::kAlertTypeCount; ++i) {
    if (!fired[i]) {
      continue;
    }
    const auto type = static_cast<AlertType>(i);
    record.bitmap |= domain::bitOf(type);

    const std::uint8_t prio = domain::alertPriority(type);
    if (!record.any || prio > record.priority) {
      record.any = true;
      record.priority = prio;
      record.type = i;
    }
  }

  return record;
}

std::optional<domain::AnomalyClass> ruleClass(const domain::AlertRecord& rules) {
  if (!rules.any) {
    return std::nullopt;
  }
  return domain::classOf(static_cast<AlertType>(rules.type));
}

}  // namespace nanotrade
