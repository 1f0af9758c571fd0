#include "nanotrade/domain/alert.hpp"
#include "nanotrade/domain/breaker.hpp"
#include "nanotrade/domain/thresholds.hpp"

#include <algorithm>
#include <cctype>

namespace nanotrade {
namespace domain {

const char* alertTypeName(AlertType t) {
  switch (t) {
    case AlertType::PriceSpike:     return "PRICE_SPIKE";
    case AlertType::VolDry:         return "VOL_DRY";
    case AlertType::VolumeSurge:    return "VOLUME_SURGE";
    case AlertType::TradeVelocity:  return "TRADE_VELOCITY";
    case AlertType::OrderImbalance: return "ORDER_IMBALANCE";
    case AlertType::SpreadWidening: return "SPREAD_WIDENING";
    case AlertType::QuoteStuffing:  return "QUOTE_STUFFING";
    case AlertType::FlashCrash:     return "FLASH_CRASH";
  }
  return "UNKNOWN";
}

const char* anomalyClassName(AnomalyClass c) {
  switch (c) {
    case AnomalyClass::Normal:         return "NORMAL";
    case AnomalyClass::PriceSpike:     return "PRICE_SPIKE";
    case AnomalyClass::VolumeSurge:    return "VOLUME_SURGE";
    case AnomalyClass::FlashCrash:     return "FLASH_CRASH";
    case AnomalyClass::OrderImbalance: return "ORDER_IMBALANCE";
    case AnomalyClass::QuoteStuffing:  return "QUOTE_STUFFING";
  }
  return "UNKNOWN";
}

const char* breakerModeName(BreakerMode m) {
  switch (m) {
    case BreakerMode::Normal:   return "Normal";
    case BreakerMode::Throttle: return "Throttle";
    case BreakerMode::Widen:    return "Widen";
    case BreakerMode::Pause:    return "Pause";
  }
  return "Unknown";
}

const char* presetName(ThresholdPreset p) {
  switch (p) {
    case ThresholdPreset::Quiet:     return "QUIET";
    case ThresholdPreset::Normal:    return "NORMAL";
    case ThresholdPreset::Sensitive: return "SENSITIVE";
    case ThresholdPreset::Demo:      return "DEMO";
  }
  return "UNKNOWN";
}

std::optional<ThresholdPreset> presetFromName(const std::string& name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper == "QUIET") return ThresholdPreset::Quiet;
  if (upper == "NORMAL") return ThresholdPreset::Normal;
  if (upper == "SENSITIVE") return ThresholdPreset::Sensitive;
  if (upper == "DEMO") return ThresholdPreset::Demo;
  return std::nullopt;
}

}  // namespace domain
}  // namespace nanotrade
