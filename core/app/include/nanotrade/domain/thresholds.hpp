#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace nanotrade {
namespace domain {

// -----------------------------------------------------------------------------
// ThresholdPreset — 2-bit config channel selector
// -----------------------------------------------------------------------------
//
// @brief  Named detector sensitivity levels selectable at runtime through a
//         Config tick.
//
// @details
// The numeric value is the 2-bit code carried by the Config event. Any
// 2-bit code is a valid preset, so an out-of-range selection cannot be
// expressed on the wire.
//
// The constants were tuned against historical replays so that quiet
// sessions produce no alerts at Normal sensitivity. Treat them as
// configuration to validate against fixtures, not as derived values.
// -----------------------------------------------------------------------------
enum class ThresholdPreset : std::uint8_t {
  Quiet = 0,
  Normal = 1,
  Sensitive = 2,
  Demo = 3,
};

// Detector thresholds in 12-bit price/volume units.
struct Thresholds {
  std::uint16_t spike{20};
  std::uint16_t flash{40};
  std::uint16_t volume_floor{10};
};

inline bool operator==(const Thresholds& a, const Thresholds& b) {
  return a.spike == b.spike && a.flash == b.flash &&
         a.volume_floor == b.volume_floor;
}

inline bool operator!=(const Thresholds& a, const Thresholds& b) {
  return !(a == b);
}

inline constexpr ThresholdPreset presetFromCode(std::uint16_t code) {
  return static_cast<ThresholdPreset>(code & 0x3);
}

inline Thresholds presetThresholds(ThresholdPreset p) {
  switch (p) {
    case ThresholdPreset::Quiet:     return Thresholds{60, 80, 20};
    case ThresholdPreset::Normal:    return Thresholds{20, 40, 10};
    case ThresholdPreset::Sensitive: return Thresholds{10, 20, 5};
    case ThresholdPreset::Demo:      return Thresholds{5, 10, 2};
  }
  return Thresholds{};
}

const char* presetName(ThresholdPreset p);

// Case-insensitive lookup of "quiet", "normal", "sensitive", "demo".
std::optional<ThresholdPreset> presetFromName(const std::string& name);

}  // namespace domain
}  // namespace nanotrade
