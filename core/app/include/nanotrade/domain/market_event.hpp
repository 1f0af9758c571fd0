#pragma once

#include <cstdint>

namespace nanotrade {
namespace domain {

// -----------------------------------------------------------------------------
// EventKind — what a single tick carries
// -----------------------------------------------------------------------------
//
// @brief  Classifies the one input event delivered per tick.
//
// @details
// Price and Volume carry a 12-bit reading. Buy and Sell carry a 6-bit
// quantity which the order book uses directly as the order's price level.
// Config carries a 2-bit threshold preset selector and only reaches the
// threshold unit; every other component treats it as a no-op.
// -----------------------------------------------------------------------------
enum class EventKind : std::uint8_t {
  Price,
  Volume,
  Buy,
  Sell,
  Config,
};

// Value widths on the input interface.
constexpr std::uint16_t kPriceMask = 0x0FFF;   // 12-bit price / volume
constexpr std::uint16_t kQuantityMask = 0x003F; // 6-bit order quantity
constexpr std::uint16_t kPresetMask = 0x0003;   // 2-bit preset selector

// -----------------------------------------------------------------------------
// MarketEvent
// -----------------------------------------------------------------------------
// Decoded per-tick event. Exactly one per tick. value == 0 on a Price or
// Volume event is the idle encoding and is excluded from all statistics.
// -----------------------------------------------------------------------------
struct MarketEvent {
  EventKind kind{EventKind::Price};
  std::uint16_t value{0};
};

inline bool isIdle(const MarketEvent& e) {
  return (e.kind == EventKind::Price || e.kind == EventKind::Volume) &&
         e.value == 0;
}

inline bool isOrder(const MarketEvent& e) {
  return e.kind == EventKind::Buy || e.kind == EventKind::Sell;
}

inline bool isPriceSample(const MarketEvent& e) {
  return e.kind == EventKind::Price && e.value != 0;
}

inline bool isVolumeSample(const MarketEvent& e) {
  return e.kind == EventKind::Volume && e.value != 0;
}

// -----------------------------------------------------------------------------
// InputRecord
// -----------------------------------------------------------------------------
//
// @brief  The external per-tick input record as delivered by the feed.
//
// @details
// Values arrive unmasked; the decoder applies the interface widths. A set
// config_strobe turns the record into a Config event whatever its kind, and
// the low two bits of value select the preset.
// -----------------------------------------------------------------------------
struct InputRecord {
  EventKind kind{EventKind::Price};
  std::uint16_t value{0};
  bool config_strobe{false};
};

}  // namespace domain
}  // namespace nanotrade
