#pragma once

#include "nanotrade/domain/alert.hpp"
#include "nanotrade/domain/market_event.hpp"
#include "nanotrade/domain/thresholds.hpp"
#include "nanotrade/stats/rolling_statistics.hpp"

#include <optional>

namespace nanotrade {

// Order counts and the stuffing gate, in events per 256-tick window.
constexpr std::uint16_t kImbalanceMinOrders = 8;
constexpr std::uint16_t kImbalanceRatio = 3;
constexpr std::uint16_t kStuffingMinTotal = 50;
constexpr std::uint16_t kStuffingMinSide = 20;
constexpr std::uint16_t kStuffingMinBaseline = 6;
constexpr std::uint16_t kStuffingBaselineRatio = 8;
constexpr std::uint8_t kStuffingMinWindowTick = 128;

// -----------------------------------------------------------------------------
// evaluateRules(stats, event, thresholds)
// -----------------------------------------------------------------------------
//
// @brief  Runs every statistical detector against one tick.
//
// @param  stats       Statistics committed at the end of the previous tick.
// @param  event       This tick's decoded event.
// @param  thresholds  Detector thresholds committed at the end of the
//                     previous tick.
//
// @return The winning alert plus the bitmap of every detector that fired.
//
// @details
// Nothing fires until stats.warm(). Detectors, highest priority first:
//
//   FLASH_CRASH      price event, avg - price > flash
//   PRICE_SPIKE      price event, |price - avg| > spike and > 4 x MAD
//   VOLUME_SURGE     volume event, volume > 3 x vol_avg, vol_avg > floor
//   ORDER_IMBALANCE  dominant side > 3 x other side and >= 8 orders,
//                    counting this tick's order
//   QUOTE_STUFFING   > 50 orders, > 20 on each side, baseline > 6,
//                    orders > 8 x baseline, window_tick >= 128
//   TRADE_VELOCITY   price event, this move and the previous move share a
//                    sign and both exceed spike in magnitude
//
// VOL_DRY and SPREAD_WIDENING never fire. Comparisons are exact: a flash
// drop of exactly `flash` does not fire, one more level does.
// -----------------------------------------------------------------------------
domain::AlertRecord evaluateRules(const RollingStatistics& stats,
                                  const domain::MarketEvent& event,
                                  const domain::Thresholds& thresholds);

// The anomaly class of the winning rule, if it has one.
std::optional<domain::AnomalyClass> ruleClass(const domain::AlertRecord& rules);

}  // namespace nanotrade
