#pragma once

#include "nanotrade/detect/cascade_detector.hpp"
#include "nanotrade/domain/alert.hpp"
#include "nanotrade/domain/breaker.hpp"
#include "nanotrade/domain/engine_config.hpp"
#include "nanotrade/ml/ml_pipeline.hpp"

#include <cstdint>
#include <optional>

namespace nanotrade {

// -----------------------------------------------------------------------------
// CircuitBreakerState
// -----------------------------------------------------------------------------
//
// @brief  The autonomous intervention currently in force.
//
// @details
// While active the countdown only ever decreases, one per tick. The tick it
// reaches zero the breaker is back to Normal and inactive; nothing else can
// end or extend an intervention.
//
// throttle_period / throttle_phase pace order admission in Throttle mode:
// an order is admitted on phase 0 only.
// -----------------------------------------------------------------------------
struct CircuitBreakerState {
  domain::BreakerMode mode{domain::BreakerMode::Normal};
  std::uint16_t countdown{0};
  bool active{false};
  std::uint8_t throttle_period{0};
  std::uint8_t throttle_phase{0};
};

// Intervention a trigger of this class asks for. Normal means none.
domain::BreakerMode modeFor(domain::AnomalyClass cls);

// -----------------------------------------------------------------------------
// selectTrigger(cascade, rules, ml, config)
// -----------------------------------------------------------------------------
//
// @brief  Picks at most one trigger for this tick.
//
// @details
// Precedence: a cascade trigger, then the priority-7 rule fast path
// (FLASH_CRASH with config.rule_trigger_confidence), then a valid ML
// result. A NORMAL ML result is still returned; it simply maps to no
// intervention.
// -----------------------------------------------------------------------------
std::optional<domain::BreakerTrigger> selectTrigger(
    const CascadeOutput& cascade,
    const domain::AlertRecord& rules,
    const MlResult& ml,
    const domain::EngineConfig& config);

// -----------------------------------------------------------------------------
// stepCircuitBreaker(state, trigger)
// -----------------------------------------------------------------------------
//
// @brief  Advances the breaker by one tick.
//
// @details
// Latch-once: a trigger is considered only while the committed mode is
// Normal. FLASH_CRASH maps to Pause, QUOTE_STUFFING to Throttle with
// period 2 + (confidence >> 6), ORDER_IMBALANCE to Widen. Any other class,
// or a zero duration, leaves the breaker Normal.
//
// While active, triggers are ignored and the countdown decrements. The
// policy derived from the new state reaches the order book on the next
// tick.
// -----------------------------------------------------------------------------
CircuitBreakerState stepCircuitBreaker(
    const CircuitBreakerState& state,
    const std::optional<domain::BreakerTrigger>& trigger);

// Admission policy the order book obeys while in `state`.
domain::PolicyDirectives policyFor(const CircuitBreakerState& state,
                                   const domain::EngineConfig& config);

}  // namespace nanotrade
