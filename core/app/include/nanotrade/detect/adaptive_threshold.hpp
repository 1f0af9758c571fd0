#pragma once

#include "nanotrade/domain/engine_config.hpp"
#include "nanotrade/domain/market_event.hpp"
#include "nanotrade/domain/thresholds.hpp"

#include <cstdint>

namespace nanotrade {

constexpr std::uint8_t kAdaptiveMinSamples = 64;
constexpr std::uint16_t kAdaptiveMinSpike = 10;
constexpr std::uint16_t kAdaptiveMinFlash = 15;

// -----------------------------------------------------------------------------
// ThresholdState
// -----------------------------------------------------------------------------
//
// @brief  Registers of the adaptive threshold unit.
//
// @details
// `active` is what the rule detector reads on the following tick. The
// preset register changes only on a Config event.
//
// mean_q and var_q are exponential moving sums with weight 1/64: the
// smoothed mean is mean_q >> 6 and the variance var_q >> 6. The first
// price sample seeds mean_q with the price and leaves var_q at zero.
// -----------------------------------------------------------------------------
struct ThresholdState {
  domain::ThresholdPreset preset{domain::ThresholdPreset::Normal};
  std::uint32_t mean_q{0};
  std::uint32_t var_q{0};
  std::uint8_t samples{0};
  domain::Thresholds active{domain::presetThresholds(domain::ThresholdPreset::Normal)};
};

ThresholdState initialThresholdState(const domain::EngineConfig& config);

// -----------------------------------------------------------------------------
// stepThresholds(state, event, config)
// -----------------------------------------------------------------------------
//
// @brief  Advances the threshold unit by one tick.
//
// @details
// Preset path (adaptive off, override set, or fewer than 64 price samples
// seen): active' = presetThresholds(preset'), so a Config event changes the
// thresholds the detectors see from the next tick on.
//
// Adaptive path: active' is derived from the variance registered at the
// start of this tick, so a price sample reaches the detectors two ticks
// later. sigma comes from integerSigma(); spike = max(3 sigma, 10) and
// flash = max(4 sigma, 15). The volume floor always follows the preset.
// -----------------------------------------------------------------------------
ThresholdState stepThresholds(const ThresholdState& state,
                              const domain::MarketEvent& event,
                              const domain::EngineConfig& config);

// Largest s in [0, 15] with s * s <= variance.
std::uint16_t integerSigma(std::uint32_t variance);

}  // namespace nanotrade
