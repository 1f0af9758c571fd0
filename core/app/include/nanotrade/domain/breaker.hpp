#pragma once

#include "nanotrade/domain/alert.hpp"

#include <cstdint>

namespace nanotrade {
namespace domain {

// -----------------------------------------------------------------------------
// BreakerMode — circuit breaker interventions
// -----------------------------------------------------------------------------
enum class BreakerMode : std::uint8_t {
  Normal = 0,
  Throttle = 1,
  Widen = 2,
  Pause = 3,
};

const char* breakerModeName(BreakerMode m);

// -----------------------------------------------------------------------------
// PolicyDirectives — order book admission policy
// -----------------------------------------------------------------------------
//
// @brief  The gate the circuit breaker hands to the order book.
//
// @details
// allow_match == false freezes the book entirely (no insertion, no
// matching), whatever allow_order says. spread_guard is the extra number of
// price levels a crossing must clear before it matches; it is nonzero only
// while widened.
// -----------------------------------------------------------------------------
struct PolicyDirectives {
  bool allow_order{true};
  bool allow_match{true};
  std::uint8_t spread_guard{0};
};

// -----------------------------------------------------------------------------
// BreakerTrigger
// -----------------------------------------------------------------------------
//
// @brief  A request for the circuit breaker to intervene.
//
// @details
// duration is the countdown the intervention runs for, in ticks. A
// single-event trigger runs for 2 × confidence ticks; a cascade trigger
// doubles that to 4 × confidence. Duration is carried explicitly so the
// breaker never needs to know where the trigger came from.
// -----------------------------------------------------------------------------
struct BreakerTrigger {
  AnomalyClass cls{AnomalyClass::Normal};
  std::uint8_t confidence{0};
  std::uint16_t duration{0};
};

inline BreakerTrigger singleTrigger(AnomalyClass cls, std::uint8_t confidence) {
  return BreakerTrigger{cls, confidence,
                        static_cast<std::uint16_t>(2u * confidence)};
}

inline BreakerTrigger cascadeTrigger(AnomalyClass cls, std::uint8_t confidence) {
  return BreakerTrigger{cls, confidence,
                        static_cast<std::uint16_t>(4u * confidence)};
}

}  // namespace domain
}  // namespace nanotrade
