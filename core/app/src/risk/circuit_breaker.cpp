#include "nanotrade/risk/circuit_breaker.hpp"

namespace nanotrade {

using domain::AnomalyClass;
using domain::BreakerMode;

BreakerMode modeFor(AnomalyClass cls) {
  switch (cls) {
    case AnomalyClass::FlashCrash:     return BreakerMode::Pause;
    case AnomalyClass::QuoteStuffing:  return BreakerMode::Throttle;
    case AnomalyClass::OrderImbalance: return BreakerMode::Widen;
    default:                           return BreakerMode::Normal;
  }
}

std::optional<domain::BreakerTrigger> selectTrigger(
    const CascadeOutput& cascade,
    const domain::AlertRecord& rules,
    const MlResult& ml,
    const domain::EngineConfig& config) {
  if (cascade.valid) {
    return cascade.trigger;
  }
  if (rules.any &&
      rules.priority == domain::alertPriority(domain::AlertType::FlashCrash)) {
    return domain::singleTrigger(AnomalyClass::FlashCrash,
                                 config.rule_trigger_confidence);
  }
  if (ml.valid) {
    return domain::singleTrigger(ml.cls, ml.confidence);
  }
  return std::nullopt;
}

CircuitBreakerState stepCircuitBreaker(
    const CircuitBreakerState& state,
    const std::optional<domain::BreakerTrigger>& trigger) {
  CircuitBreakerState next = state;

  if (state.active) {
    next.countdown = static_cast<std::uint16_t>(state.countdown - 1);
    if (next.countdown == 0) {
      return CircuitBreakerState{};
    }
    if (state.mode == BreakerMode::Throttle) {
      const auto phase = static_cast<std::uint8_t>(state.throttle_phase + 1);
      next.throttle_phase = phase >= state.throttle_period ? 0 : phase;
    }
    return next;
  }

  if (state.mode != BreakerMode::Normal || !trigger) {
    return next;
  }

  const BreakerMode mode = modeFor(trigger->cls);
  if (mode == BreakerMode::Normal || trigger->duration == 0) {
    return next;
  }

  next.mode = mode;
  next.countdown = trigger->duration;
  next.active = true;
  next.throttle_phase = 0;
  next.throttle_period =
      mode == BreakerMode::Throttle
          ? static_cast<std::uint8_t>(2 + (trigger->confidence >> 6))
          : 0;
  return next;
}

domain::PolicyDirectives policyFor(const CircuitBreakerState& state,
                                   const domain::EngineConfig& config) {
  domain::PolicyDirectives policy;
  switch (state.mode) {
    case BreakerMode::Normal:
      break;
    case BreakerMode::Throttle:
      policy.allow_order = state.throttle_phase == 0;
      break;
    case BreakerMode::Widen:
      policy.spread_guard = config.widen_spread_guard;
      break;
    case BreakerMode::Pause:
      policy.allow_order = false;
      policy.allow_match = false;
      break;
  }
  return policy;
}

}  // namespace nanotrade
