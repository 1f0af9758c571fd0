#pragma once

#include <cstdint>
#include <optional>

namespace nanotrade {
namespace domain {

// -----------------------------------------------------------------------------
// AlertType — rule detector identifiers
// -----------------------------------------------------------------------------
//
// @brief  The eight rule detectors. The numeric value is both the alert_type
//         code on the output record and the detector's bit in alert_bitmap.
//
// @details
// VolDry and SpreadWidening have no observable signal on a single-instrument
// tick feed. They keep their codes and bitmap positions so downstream
// consumers see a stable 8-bit layout, but they never fire.
// -----------------------------------------------------------------------------
enum class AlertType : std::uint8_t {
  PriceSpike = 0,
  VolDry = 1,
  VolumeSurge = 2,
  TradeVelocity = 3,
  OrderImbalance = 4,
  SpreadWidening = 5,
  QuoteStuffing = 6,
  FlashCrash = 7,
};

constexpr std::uint8_t kAlertTypeCount = 8;

inline constexpr std::uint8_t bitOf(AlertType t) {
  return static_cast<std::uint8_t>(1u << static_cast<std::uint8_t>(t));
}

// Priority of each detector when several fire on the same tick. Zero means
// the detector never participates in the priority race.
inline constexpr std::uint8_t alertPriority(AlertType t) {
  switch (t) {
    case AlertType::FlashCrash:     return 7;
    case AlertType::PriceSpike:     return 6;
    case AlertType::VolumeSurge:    return 5;
    case AlertType::OrderImbalance: return 4;
    case AlertType::QuoteStuffing:  return 3;
    case AlertType::TradeVelocity:  return 2;
    case AlertType::VolDry:         return 0;
    case AlertType::SpreadWidening: return 0;
  }
  return 0;
}

// -----------------------------------------------------------------------------
// AnomalyClass — classifier output classes
// -----------------------------------------------------------------------------
// Shared vocabulary between the ML pipeline, the cascade detector and the
// circuit breaker. Numeric values are the ml_class codes.
// -----------------------------------------------------------------------------
enum class AnomalyClass : std::uint8_t {
  Normal = 0,
  PriceSpike = 1,
  VolumeSurge = 2,
  FlashCrash = 3,
  OrderImbalance = 4,
  QuoteStuffing = 5,
};

constexpr std::uint8_t kAnomalyClassCount = 6;

inline constexpr std::uint8_t classPriority(AnomalyClass c) {
  switch (c) {
    case AnomalyClass::Normal:         return 0;
    case AnomalyClass::PriceSpike:     return 6;
    case AnomalyClass::VolumeSurge:    return 5;
    case AnomalyClass::FlashCrash:     return 7;
    case AnomalyClass::OrderImbalance: return 4;
    case AnomalyClass::QuoteStuffing:  return 3;
  }
  return 0;
}

// Maps a rule detector onto the classifier's class space. TradeVelocity and
// the placeholder detectors have no class of their own.
inline std::optional<AnomalyClass> classOf(AlertType t) {
  switch (t) {
    case AlertType::PriceSpike:     return AnomalyClass::PriceSpike;
    case AlertType::VolumeSurge:    return AnomalyClass::VolumeSurge;
    case AlertType::OrderImbalance: return AnomalyClass::OrderImbalance;
    case AlertType::QuoteStuffing:  return AnomalyClass::QuoteStuffing;
    case AlertType::FlashCrash:     return AnomalyClass::FlashCrash;
    case AlertType::TradeVelocity:
    case AlertType::VolDry:
    case AlertType::SpreadWidening:
      return std::nullopt;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// AlertRecord
// -----------------------------------------------------------------------------
//
// @brief  One tick's alert summary. Recomputed from scratch every tick.
//
// @details
// any/priority/type describe the single winning alert. bitmap is decoupled
// from the winner: it holds the bit of every detector that fired on the
// tick, so a FLASH_CRASH winner can still show that PRICE_SPIKE fired too.
// -----------------------------------------------------------------------------
struct AlertRecord {
  bool any{false};
  std::uint8_t priority{0};  // 0..7
  std::uint8_t type{0};      // 0..7 (AlertType or AnomalyClass code)
  std::uint8_t bitmap{0};
};

const char* alertTypeName(AlertType t);
const char* anomalyClassName(AnomalyClass c);

}  // namespace domain
}  // namespace nanotrade
